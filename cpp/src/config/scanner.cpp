// ==============================================================================
// scanner.cpp - Рекурсивный обход директории с конфигами
// ==============================================================================
//
// Обход в глубину, symlink на директорию не раскрывается (защита от циклов),
// symlink на файл разбирается как обычный файл.
//
// ==============================================================================

#include "sgrep/scanner.hpp"

#include "sgrep/parser.hpp"
#include "sgrep/platform.hpp"

#include <algorithm>
#include <string>
#include <system_error>

namespace sgrep::config {

namespace {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Рекурсивно обходит директорию и собирает файлы (пути относительно root)
void collect_files_recursive(const std::filesystem::path& root,
                             const std::filesystem::path& relative_dir, output::Writer& writer,
                             std::vector<std::filesystem::path>& result) {
    std::error_code ec;
    std::filesystem::directory_iterator dir_iter(root / relative_dir, ec);

    if (ec) {
        writer.warn("failed to read directory " + platform::path_to_utf8(root / relative_dir) +
                    " - " + ec.message());
        return;
    }

    for (auto it = dir_iter; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }

        const std::filesystem::path entry_path = relative_dir / it->path().filename();

        std::error_code entry_ec;
        auto link_status = it->symlink_status(entry_ec);
        if (entry_ec) {
            writer.warn("failed to get metadata for file " + platform::path_to_utf8(it->path()) +
                        " - " + entry_ec.message());
            continue;
        }

        if (std::filesystem::is_directory(link_status)) {
            collect_files_recursive(root, entry_path, writer, result);
            continue;
        }

        auto status = it->status(entry_ec);
        if (!entry_ec && std::filesystem::is_regular_file(status) &&
            is_yaml_extension(entry_path)) {
            result.push_back(entry_path);
        }
        // Symlinks на директории, special files и т.п. игнорируются
    }

    if (ec) {
        writer.warn("failed to enter directory " + platform::path_to_utf8(root / relative_dir) +
                    " - " + ec.message());
    }
}

}  // namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

bool is_yaml_extension(const std::filesystem::path& path) {
    const std::string ext = path.extension().string();
    for (const char* candidate : YML_EXTENSIONS) {
        if (ext == candidate) {
            return true;
        }
    }
    return false;
}

bool is_hidden_config_dir(const std::filesystem::path& path) {
    const std::filesystem::path parent = path.parent_path();
    for (const auto& component : parent) {
        const std::string part = component.string();
        if (part.empty() || part == "." || part == "..") {
            continue;
        }
        if (part[0] == '.' && part.find(DEFAULT_SGREP_CONFIG_NAME) == std::string::npos) {
            return true;
        }
    }
    return false;
}

std::vector<std::filesystem::path> find_config_files(const std::filesystem::path& root,
                                                     output::Writer& writer) {
    std::vector<std::filesystem::path> result;
    collect_files_recursive(root, std::filesystem::path(), writer, result);

    // Порядок directory_iterator зависит от ОС; сортируем для детерминизма
    std::sort(result.begin(), result.end());
    return result;
}

ConfigSet parse_config_folder(const std::filesystem::path& root, bool relative,
                              output::Writer& writer,
                              const std::optional<std::filesystem::path>& id_root) {
    ConfigSet configs;
    const std::filesystem::path prefix = id_root.value_or(root);

    for (const auto& relative_path : find_config_files(root, writer)) {
        const std::filesystem::path id_path = relative ? relative_path : prefix / relative_path;

        if (is_hidden_config_dir(id_path)) {
            writer.trace("skipping config in hidden directory " + platform::path_to_utf8(id_path));
            continue;
        }

        // Совпадение id перезаписывает более раннюю запись
        for (auto& [id, document] :
             parse_config_at_path(root / relative_path, platform::path_to_utf8(id_path), writer)) {
            configs[id] = std::move(document);
        }
    }

    return configs;
}

}  // namespace sgrep::config
