// ==============================================================================
// sgrep/scanner.hpp - Рекурсивный обход директории с конфигами
// ==============================================================================
//
// Назначение:
// - Рекурсивный обход директорий
// - Фильтрация по расширениям .yml / .yaml
// - Исключение скрытых директорий (кроме директорий с именем sgrep)
// - Разбор каждого файла с изоляцией ошибок
// - Детерминированный порядок обхода (сортировка путей)
//
// ==============================================================================

#ifndef SGREP_SCANNER_HPP
#define SGREP_SCANNER_HPP

#include <sgrep/config_set.hpp>
#include <sgrep/output.hpp>

#include <filesystem>
#include <optional>
#include <vector>

namespace sgrep::config {

/// Имя-маркер: скрытые директории, содержащие его, не исключаются
constexpr const char* DEFAULT_SGREP_CONFIG_NAME = "sgrep";

/// Распознаваемые расширения (с точкой, case-sensitive)
constexpr const char* YML_EXTENSIONS[] = {".yml", ".yaml"};

/// Проверить расширение файла
bool is_yaml_extension(const std::filesystem::path& path);

/// Путь находится внутри скрытой директории.
///
/// Проверяются только компоненты-директории (все, кроме последнего):
/// компонент начинается с '.', не равен "." / ".." и не содержит
/// DEFAULT_SGREP_CONFIG_NAME. Имя самого файла не проверяется:
/// rules/.sgrep.yml сохраняется, path/.github/foo.yml исключается,
/// src/.sgrep/bad_pattern.yml сохраняется.
bool is_hidden_config_dir(const std::filesystem::path& path);

/// Найти все подходящие файлы под root (отсортированы).
/// Возвращает пути относительно root. Нечитаемые поддиректории
/// пропускаются с предупреждением в writer.
std::vector<std::filesystem::path> find_config_files(const std::filesystem::path& root,
                                                     output::Writer& writer);

/// Разобрать все конфиги в директории.
///
/// @param root Директория для обхода (путь для ввода-вывода)
/// @param relative true: id = путь относительно root; false: id = id_root / путь
/// @param writer Журнал ошибок разбора
/// @param id_root Префикс id при relative=false (по умолчанию root)
///
/// Правило исключения применяется к пути в том виде, в каком он становится id.
ConfigSet parse_config_folder(const std::filesystem::path& root, bool relative,
                              output::Writer& writer,
                              const std::optional<std::filesystem::path>& id_root = std::nullopt);

}  // namespace sgrep::config

#endif  // SGREP_SCANNER_HPP
