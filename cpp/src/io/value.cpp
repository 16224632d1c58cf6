// ==============================================================================
// value.cpp - Реализация Value (каноническая модель документа)
// ==============================================================================
//
// yaml-cpp отдаёт скаляры строками; типизация выполняется здесь по правилам
// YAML 1.1, которые применяет safe-загрузчик исходного инструмента.
//
// ==============================================================================

#include <sgrep/value.hpp>

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <optional>
#include <regex>
#include <yaml-cpp/yaml.h>

namespace sgrep {

namespace {

const std::regex& int_regex() {
    static const std::regex re(
        R"(^[-+]?(0b[0-1_]+|0x[0-9a-fA-F_]+|0o[0-7_]+|0[0-7_]+|0|[1-9][0-9_]*)$)");
    return re;
}

const std::regex& float_regex() {
    static const std::regex re(
        R"(^([-+]?[0-9][0-9_]*\.[0-9_]*([eE][-+][0-9]+)?|[-+]?\.[0-9][0-9_]*([eE][-+][0-9]+)?|[-+]?\.(inf|Inf|INF)|\.(nan|NaN|NAN))$)");
    return re;
}

bool is_null_literal(const std::string& s) {
    return s.empty() || s == "~" || s == "null" || s == "Null" || s == "NULL";
}

std::optional<bool> parse_bool_literal(const std::string& s) {
    static const char* const truthy[] = {"yes", "Yes", "YES", "true", "True",
                                         "TRUE", "on", "On", "ON"};
    static const char* const falsy[] = {"no",    "No",    "NO",  "false", "False",
                                        "FALSE", "off",   "Off", "OFF"};
    for (const char* t : truthy) {
        if (s == t) {
            return true;
        }
    }
    for (const char* f : falsy) {
        if (s == f) {
            return false;
        }
    }
    return std::nullopt;
}

std::string strip_underscores(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c != '_') {
            out += c;
        }
    }
    return out;
}

// Целое YAML 1.1 -> Int64, либо UInt64 при выходе за INT64_MAX.
// nullopt если значение не помещается в 64 бита.
std::optional<Value> parse_int_literal(const std::string& scalar) {
    std::string s = strip_underscores(scalar);
    bool negative = false;
    std::size_t pos = 0;
    if (s[pos] == '-' || s[pos] == '+') {
        negative = s[pos] == '-';
        ++pos;
    }

    int base = 10;
    if (s.compare(pos, 2, "0b") == 0) {
        base = 2;
        pos += 2;
    } else if (s.compare(pos, 2, "0x") == 0) {
        base = 16;
        pos += 2;
    } else if (s.compare(pos, 2, "0o") == 0) {
        base = 8;
        pos += 2;
    } else if (s.size() - pos > 1 && s[pos] == '0') {
        base = 8;
        pos += 1;
    }

    std::uint64_t magnitude = 0;
    const char* first = s.data() + pos;
    const char* last = s.data() + s.size();
    auto [ptr, ec] = std::from_chars(first, last, magnitude, base);
    if (ec != std::errc() || ptr != last) {
        return std::nullopt;
    }

    if (negative) {
        constexpr auto limit =
            static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()) + 1;
        if (magnitude > limit) {
            return std::nullopt;
        }
        if (magnitude == limit) {
            return Value(std::numeric_limits<std::int64_t>::min());
        }
        return Value(-static_cast<std::int64_t>(magnitude));
    }
    if (magnitude > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return Value(magnitude);
    }
    return Value(static_cast<std::int64_t>(magnitude));
}

Value parse_float_literal(const std::string& scalar) {
    std::string s = strip_underscores(scalar);
    std::string lower;
    for (char c : s) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == ".nan") {
        return Value(std::numeric_limits<double>::quiet_NaN());
    }
    if (lower == ".inf" || lower == "+.inf") {
        return Value(std::numeric_limits<double>::infinity());
    }
    if (lower == "-.inf") {
        return Value(-std::numeric_limits<double>::infinity());
    }
    return Value(std::strtod(s.c_str(), nullptr));
}

bool is_string_tag(const std::string& tag) {
    return tag == "!" || tag == "tag:yaml.org,2002:str" || tag == "!!str";
}

}  // namespace

// ----------------------------------------------------------------------------
// resolve_plain_scalar
// ----------------------------------------------------------------------------

Value resolve_plain_scalar(const std::string& scalar) {
    if (is_null_literal(scalar)) {
        return Value();
    }
    if (auto b = parse_bool_literal(scalar)) {
        return Value(*b);
    }
    if (std::regex_match(scalar, int_regex())) {
        if (auto v = parse_int_literal(scalar)) {
            return *v;
        }
        return Value(scalar);
    }
    if (std::regex_match(scalar, float_regex())) {
        return parse_float_literal(scalar);
    }
    return Value(scalar);
}

// ----------------------------------------------------------------------------
// Value::from_yaml
// ----------------------------------------------------------------------------

Value Value::from_yaml(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
        return Value();

    case YAML::NodeType::Scalar:
        if (is_string_tag(node.Tag())) {
            return Value(node.Scalar());
        }
        return resolve_plain_scalar(node.Scalar());

    case YAML::NodeType::Sequence: {
        Array arr;
        arr.reserve(node.size());
        for (const auto& item : node) {
            arr.push_back(from_yaml(item));
        }
        return Value(std::move(arr));
    }

    case YAML::NodeType::Map: {
        Object obj;
        for (const auto& kv : node) {
            // Ключ-скаляр как есть, составные ключи - в flow-представлении
            std::string key = kv.first.IsScalar() ? kv.first.Scalar() : YAML::Dump(kv.first);
            obj[key] = from_yaml(kv.second);
        }
        return Value(std::move(obj));
    }
    }

    return Value();
}

// ----------------------------------------------------------------------------
// Value::operator==
// ----------------------------------------------------------------------------

bool Value::operator==(const Value& other) const {
    if (data_.index() != other.data_.index()) {
        return false;
    }

    if (is_null()) {
        return true;
    }
    if (is_bool()) {
        return as_bool() == other.as_bool();
    }
    if (is_int()) {
        return as_int() == other.as_int();
    }
    if (is_uint()) {
        return as_uint() == other.as_uint();
    }
    if (is_double()) {
        return as_double() == other.as_double();
    }
    if (is_string()) {
        return as_string() == other.as_string();
    }
    if (is_array()) {
        return as_array() == other.as_array();
    }
    if (is_object()) {
        return as_object() == other.as_object();
    }
    return false;
}

// ----------------------------------------------------------------------------
// Value::to_rapidjson - конверсия в RapidJSON
// ----------------------------------------------------------------------------

void Value::to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const {
    if (is_null()) {
        out.SetNull();
        return;
    }

    if (is_bool()) {
        out.SetBool(as_bool());
        return;
    }

    if (is_int()) {
        out.SetInt64(as_int());
        return;
    }

    if (is_uint()) {
        out.SetUint64(as_uint());
        return;
    }

    if (is_double()) {
        double d = as_double();
        // JSON не представляет inf/nan: пишем YAML-написание строкой
        if (std::isnan(d)) {
            out.SetString(".nan", alloc);
        } else if (std::isinf(d)) {
            out.SetString(d > 0 ? ".inf" : "-.inf", alloc);
        } else {
            out.SetDouble(d);
        }
        return;
    }

    if (is_string()) {
        const auto& s = as_string();
        out.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
        return;
    }

    if (is_array()) {
        out.SetArray();
        const auto& arr = as_array();
        out.Reserve(static_cast<rapidjson::SizeType>(arr.size()), alloc);
        for (const auto& elem : arr) {
            rapidjson::Value v;
            elem.to_rapidjson(v, alloc);
            out.PushBack(v, alloc);
        }
        return;
    }

    if (is_object()) {
        out.SetObject();
        const auto& obj = as_object();
        for (const auto& [key, val] : obj) {
            rapidjson::Value k;
            k.SetString(key.c_str(), static_cast<rapidjson::SizeType>(key.size()), alloc);
            rapidjson::Value v;
            val.to_rapidjson(v, alloc);
            out.AddMember(k, v, alloc);
        }
        return;
    }

    out.SetNull();
}

rapidjson::Document Value::to_rapidjson_document() const {
    rapidjson::Document doc;
    to_rapidjson(doc, doc.GetAllocator());
    return doc;
}

}  // namespace sgrep
