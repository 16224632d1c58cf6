// ==============================================================================
// sgrep/resolver.hpp - Разрешение спецификатора конфига в набор документов
// ==============================================================================
//
// Назначение:
// - Классификация спецификатора (нет / алиас реестра / URL / локальный путь)
// - Загрузка из локального пути и расположений по умолчанию
// - Загрузка по URL: text/plain либо gzip tarball
// - Генерация шаблона sgrep.yml
// - Конфиг из одиночного паттерна (-e / -l)
//
// Фатальные ошибки возвращаются в ResolveResult; процесс завершает только main.
//
// ==============================================================================

#ifndef SGREP_RESOLVER_HPP
#define SGREP_RESOLVER_HPP

#include <sgrep/config_set.hpp>
#include <sgrep/http.hpp>
#include <sgrep/output.hpp>
#include <sgrep/platform.hpp>
#include <sgrep/registry.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sgrep::config {

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

/// Файл конфига по умолчанию (относительно базовой директории)
constexpr const char* DEFAULT_CONFIG_FILE = "sgrep.yml";

/// Директория конфигов по умолчанию
constexpr const char* DEFAULT_CONFIG_FOLDER = ".sgrep";

/// id документа, полученного по URL как text/plain
constexpr const char* REMOTE_URL_ID = "remote-url";

/// Актуальный шаблон для --generate-config
constexpr const char* TEMPLATE_YAML_URL =
    "https://raw.githubusercontent.com/returntocorp/sgrep-rules/develop/template.yaml";

/// Шаблон на случай недоступности TEMPLATE_YAML_URL
constexpr const char* FALLBACK_TEMPLATE_YAML =
    "rules:\n"
    "  - id: eqeq-is-bad\n"
    "    pattern: $X == $X\n"
    "    message: \"$X == $X is a useless equality check\"\n"
    "    languages: [python]\n"
    "    severity: ERROR";

// ----------------------------------------------------------------------------
// Спецификатор
// ----------------------------------------------------------------------------

namespace specifier {

struct Absent {};

struct RegistryAlias {
    std::string name;
};

struct Url {
    std::string url;
};

struct LocalPath {
    std::string path;
};

}  // namespace specifier

using Specifier = std::variant<specifier::Absent, specifier::RegistryAlias, specifier::Url,
                               specifier::LocalPath>;

/// Классифицировать строку спецификатора.
/// Порядок: отсутствие, точное совпадение с алиасом, URL, локальный путь.
Specifier classify_specifier(const std::optional<std::string>& raw, const Registry& registry);

// ----------------------------------------------------------------------------
// Разрешение
// ----------------------------------------------------------------------------

/// Разрешить спецификатор в набор конфигов.
/// При непустом результате пишет debug "loaded <n> configs in <t>s".
ResolveResult resolve_config(const Specifier& spec, const platform::ExecutionContext& ctx,
                             net::HttpClient& client, const Registry& registry,
                             output::Writer& writer);

/// Загрузить конфиг из локального пути (nullopt: расположения по умолчанию).
///
/// Без пути: <base>/sgrep.yml, затем <base>/.sgrep/ (id относительно папки),
/// иначе {"sgrep.yml": nullopt}. С путём: файл или директория под базой;
/// отсутствующий путь и путь неподдерживаемого типа - фатальные ошибки.
/// id строятся из пути пользователя, база в них не попадает.
ResolveResult load_config_from_local_path(const std::optional<std::string>& location,
                                          const platform::ExecutionContext& ctx,
                                          output::Writer& writer);

/// Загрузить конфиг по URL.
///
/// Статус не 2xx и неизвестный content-type - фатальные ошибки. Сбой
/// транспорта, повреждённый архив и ошибки временной директории дают
/// {url: nullopt}.
ResolveResult download_config(const std::string& url, net::HttpClient& client,
                              output::Writer& writer);

/// Конфиг из одиночного паттерна: {"manual": {rules: [...]}}
ConfigSet manual_config(const std::string& pattern, const std::string& lang);

/// Записать шаблон <base>/sgrep.yml.
/// Существующий файл - TemplateExists; ошибка записи - TemplateWrite.
/// Результат содержит записанный документ под id sgrep.yml.
ResolveResult generate_config(const platform::ExecutionContext& ctx, net::HttpClient& client,
                              output::Writer& writer);

/// Абсолютные цели без изменений, относительные - от базовой директории
std::vector<std::filesystem::path> resolve_targets(const std::vector<std::string>& targets,
                                                   const platform::ExecutionContext& ctx);

}  // namespace sgrep::config

#endif  // SGREP_RESOLVER_HPP
