// ==============================================================================
// parser.cpp - Разбор одного YAML документа конфига
// ==============================================================================
//
// Ошибки yaml-cpp не выходят за пределы модуля: каждый документ
// разбирается независимо, сбой одного не влияет на соседей.
//
// ==============================================================================

#include <sgrep/parser.hpp>
#include <sgrep/platform.hpp>

#include <fstream>
#include <iterator>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace sgrep::config {

namespace {

void report_invalid(const std::string& config_id, std::string_view diagnostic,
                    output::Writer& writer) {
    writer.error("Invalid yaml file " + config_id + ":\n" + output::indent(diagnostic));
}

}  // namespace

ConfigSet parse_config_string(const std::string& config_id, std::string_view contents,
                              output::Writer& writer) {
    ConfigSet result;

    try {
        std::vector<YAML::Node> documents = YAML::LoadAll(std::string(contents));

        if (documents.size() > 1) {
            report_invalid(config_id, "expected a single document in the stream", writer);
            result.emplace(config_id, std::nullopt);
            return result;
        }

        // Пустой поток (только комментарии / пробелы) - Null документ
        Value document = documents.empty() ? Value() : Value::from_yaml(documents.front());
        result.emplace(config_id, std::move(document));
    } catch (const YAML::Exception& e) {
        report_invalid(config_id, e.what(), writer);
        result.emplace(config_id, std::nullopt);
    }

    return result;
}

ConfigSet parse_config_at_path(const std::filesystem::path& path, const std::string& config_id,
                               output::Writer& writer) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        writer.error("YAML file at " + platform::path_to_utf8(path) + " not found");
        ConfigSet result;
        result.emplace(config_id, std::nullopt);
        return result;
    }

    std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        writer.error("YAML file at " + platform::path_to_utf8(path) + " not found");
        ConfigSet result;
        result.emplace(config_id, std::nullopt);
        return result;
    }

    writer.trace("parsing config " + config_id);
    return parse_config_string(config_id, contents, writer);
}

ConfigSet parse_config_at_path(const std::filesystem::path& path, output::Writer& writer) {
    return parse_config_at_path(path, platform::path_to_utf8(path), writer);
}

}  // namespace sgrep::config
