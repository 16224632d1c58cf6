// ==============================================================================
// sgrep/parser.hpp - Разбор одного YAML документа конфига
// ==============================================================================
//
// Назначение:
// - Разбор текста в дерево Value (yaml-cpp)
// - Изоляция синтаксических ошибок: ошибка -> {id: nullopt} + сообщение
// - Чтение файла с диска с тем же контрактом
//
// ==============================================================================

#ifndef SGREP_PARSER_HPP
#define SGREP_PARSER_HPP

#include <sgrep/config_set.hpp>
#include <sgrep/output.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace sgrep::config {

/// Разобрать текст как один YAML документ.
///
/// Всегда возвращает ровно одну запись {id: ...}. Пустой текст даёт Null
/// документ. Поток из нескольких документов считается синтаксической
/// ошибкой. При ошибке в writer пишется "Invalid yaml file <id>:" и
/// диагностика yaml-cpp с отступом табуляцией.
ConfigSet parse_config_string(const std::string& config_id, std::string_view contents,
                              output::Writer& writer);

/// Прочитать файл и разобрать его.
/// Отсутствующий или нечитаемый файл: "YAML file at <path> not found", {id: nullopt}.
ConfigSet parse_config_at_path(const std::filesystem::path& path, const std::string& config_id,
                               output::Writer& writer);

/// Вариант с id = путь к файлу
ConfigSet parse_config_at_path(const std::filesystem::path& path, output::Writer& writer);

}  // namespace sgrep::config

#endif  // SGREP_PARSER_HPP
