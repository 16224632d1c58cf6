// ==============================================================================
// sgrep/config_set.hpp - Набор разрешённых конфигов и ошибки разрешения
// ==============================================================================
//
// Назначение:
// - ConfigSet: config id -> документ либо маркер отсутствия (nullopt)
// - ErrorKind / Error: фатальные ошибки разрешения как данные
// - ResolveResult: единый результат pipeline (аналог Result в Rust)
//
// Мягкие ошибки (нет файла, синтаксис YAML, сбой транспорта) не попадают в
// Error: они представлены записью с nullopt в ConfigSet.
//
// ==============================================================================

#ifndef SGREP_CONFIG_SET_HPP
#define SGREP_CONFIG_SET_HPP

#include <sgrep/value.hpp>

#include <map>
#include <optional>
#include <string>

namespace sgrep::config {

/// config id -> разобранный документ или nullopt ("пытались, не получилось")
using ConfigSet = std::map<std::string, std::optional<Value>>;

// ============================================================================
// Error handling
// ============================================================================

/// Вид фатальной ошибки
enum class ErrorKind {
    UnsupportedContentType,  // content-type ответа не распознан
    BadHttpStatus,           // HTTP статус не 2xx
    InvalidLocationType,     // путь существует, но не файл и не директория
    LocationNotFound,        // явно указанный путь не существует
    ArchiveLayout,           // архив пуст или первый элемент не директория
    TemplateExists,          // шаблон конфига уже существует
    TemplateWrite            // не удалось записать шаблон
};

/// Фатальная ошибка разрешения
struct Error {
    ErrorKind kind = ErrorKind::LocationNotFound;
    std::string message;
    std::string location;  // путь или URL

    std::string format() const;
};

/// Результат разрешения конфига
struct ResolveResult {
    bool ok = false;
    ConfigSet configs;
    Error error;

    explicit operator bool() const { return ok; }

    static ResolveResult success(ConfigSet configs) {
        ResolveResult r;
        r.ok = true;
        r.configs = std::move(configs);
        return r;
    }

    static ResolveResult failure(ErrorKind kind, std::string message, std::string location) {
        ResolveResult r;
        r.ok = false;
        r.error = Error{kind, std::move(message), std::move(location)};
        return r;
    }
};

/// Преобразовать ErrorKind в строку
std::string to_string(ErrorKind kind);

/// Число записей с маркером отсутствия
std::size_t count_absent(const ConfigSet& configs);

/// JSON объект id -> документ; маркер отсутствия становится null.
/// @throws std::runtime_error для inf/nan в документе
rapidjson::Document to_json(const ConfigSet& configs);

}  // namespace sgrep::config

#endif  // SGREP_CONFIG_SET_HPP
