// ==============================================================================
// sgrep/value.hpp - Каноническая модель документа (Value)
// ==============================================================================
//
// Назначение:
// - Дерево разобранного YAML документа: скаляры, последовательности, мапы
// - Конверсия из yaml-cpp (YAML 1.1 разрешение plain-скаляров)
// - Конверсия в RapidJSON Value для передачи движку
// - Явная типизация чисел: Int64 / UInt64 / Double
//
// ==============================================================================

#ifndef SGREP_VALUE_HPP
#define SGREP_VALUE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

namespace YAML {
class Node;
}  // namespace YAML

// GCC 13 generates false positives for -Wnull-dereference when using
// std::get on std::variant at high optimization levels.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=108842
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace sgrep {

// ----------------------------------------------------------------------------
// Value - каноническая модель документа
// ----------------------------------------------------------------------------
//
// Object использует hash map: порядок ключей документа не сохраняется.
//

class Value;

/// Тип для массива значений
using ValueArray = std::vector<Value>;

/// Тип для объекта (map string -> Value)
using ValueObject = std::unordered_map<std::string, Value>;

/// Каноническое представление документа
class Value {
public:
    struct Null {};
    using Bool = bool;
    using Int64 = std::int64_t;
    using UInt64 = std::uint64_t;
    using Double = double;
    using String = std::string;
    using Array = ValueArray;
    using Object = ValueObject;

private:
    std::variant<Null, Bool, Int64, UInt64, Double, String, std::shared_ptr<Array>,
                 std::shared_ptr<Object>>
        data_;

public:
    // -------------------------------------------------------------------------
    // Конструкторы
    // -------------------------------------------------------------------------

    Value() : data_(Null{}) {}
    explicit Value(bool v) : data_(v) {}
    explicit Value(std::int64_t v) : data_(v) {}
    explicit Value(std::uint64_t v) : data_(v) {}
    explicit Value(double v) : data_(v) {}
    explicit Value(std::string v) : data_(std::move(v)) {}
    explicit Value(const char* v) : data_(std::string(v)) {}
    explicit Value(Array v) : data_(std::make_shared<Array>(std::move(v))) {}
    explicit Value(Object v) : data_(std::make_shared<Object>(std::move(v))) {}

    // -------------------------------------------------------------------------
    // Статические фабричные методы
    // -------------------------------------------------------------------------

    static Value make_array() { return Value(Array{}); }
    static Value make_object() { return Value(Object{}); }

    // -------------------------------------------------------------------------
    // Проверка типа
    // -------------------------------------------------------------------------

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<Bool>(data_); }
    bool is_int() const { return std::holds_alternative<Int64>(data_); }
    bool is_uint() const { return std::holds_alternative<UInt64>(data_); }
    bool is_double() const { return std::holds_alternative<Double>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_array() const { return std::holds_alternative<std::shared_ptr<Array>>(data_); }
    bool is_object() const { return std::holds_alternative<std::shared_ptr<Object>>(data_); }

    // -------------------------------------------------------------------------
    // Доступ к значению (undefined behavior при несовпадении типа)
    // -------------------------------------------------------------------------

    Bool as_bool() const { return std::get<Bool>(data_); }
    Int64 as_int() const { return std::get<Int64>(data_); }
    UInt64 as_uint() const { return std::get<UInt64>(data_); }
    Double as_double() const { return std::get<Double>(data_); }
    const String& as_string() const { return std::get<String>(data_); }
    const Array& as_array() const { return *std::get<std::shared_ptr<Array>>(data_); }
    const Object& as_object() const { return *std::get<std::shared_ptr<Object>>(data_); }

    // -------------------------------------------------------------------------
    // Безопасный доступ (nullptr если тип не совпадает)
    // -------------------------------------------------------------------------

    const Array* get_array() const {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    const Object* get_object() const {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    // -------------------------------------------------------------------------
    // Операции с массивом
    // -------------------------------------------------------------------------

    /// Добавить элемент в массив (только если is_array())
    void push_back(Value v) {
        if (auto* arr = get_array_mut()) {
            arr->push_back(std::move(v));
        }
    }

    /// Размер массива (0 если не массив)
    std::size_t array_size() const {
        if (const auto* arr = get_array()) {
            return arr->size();
        }
        return 0;
    }

    /// Доступ к элементу массива по индексу
    const Value* at(std::size_t index) const {
        if (const auto* arr = get_array()) {
            if (index < arr->size()) {
                return &(*arr)[index];
            }
        }
        return nullptr;
    }

    // -------------------------------------------------------------------------
    // Операции с объектом
    // -------------------------------------------------------------------------

    /// Установить поле объекта (только если is_object())
    void set(const std::string& key, Value v) {
        if (auto* obj = get_object_mut()) {
            (*obj)[key] = std::move(v);
        }
    }

    /// Получить поле объекта по ключу (nullptr если не найдено или не объект)
    const Value* get(const std::string& key) const {
        if (const auto* obj = get_object()) {
            auto it = obj->find(key);
            if (it != obj->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    // -------------------------------------------------------------------------
    // Сравнение (глубокое, по содержимому)
    // -------------------------------------------------------------------------

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

    // -------------------------------------------------------------------------
    // Конверсия из yaml-cpp
    // -------------------------------------------------------------------------

    /// Конвертировать разобранный YAML узел.
    /// Plain-скаляры разрешаются по YAML 1.1 (null/bool/int/float/str),
    /// quoted и !!str скаляры всегда строки.
    static Value from_yaml(const YAML::Node& node);

    // -------------------------------------------------------------------------
    // Конверсия в RapidJSON
    // -------------------------------------------------------------------------

    /// inf/nan записываются строками ".inf", "-.inf", ".nan"
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;

    rapidjson::Document to_rapidjson_document() const;

private:
    Array* get_array_mut() {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    Object* get_object_mut() {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }
};

/// Разрешить plain-скаляр YAML 1.1 в типизированный Value
Value resolve_plain_scalar(const std::string& scalar);

}  // namespace sgrep

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif  // SGREP_VALUE_HPP
