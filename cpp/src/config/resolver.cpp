// ==============================================================================
// resolver.cpp - Разрешение спецификатора конфига в набор документов
// ==============================================================================
//
// Ввод-вывод идёт по пути под базовой директорией, id строятся из пути в
// том виде, в каком его передал пользователь (после лексической
// нормализации): спецификатор ./rules даёт rules/a.yml при любой базе.
//
// ==============================================================================

#include "sgrep/resolver.hpp"

#include "sgrep/archive.hpp"
#include "sgrep/parser.hpp"
#include "sgrep/scanner.hpp"

#include <chrono>
#include <fstream>
#include <sstream>
#include <system_error>
#include <type_traits>

namespace sgrep::config {

namespace {

constexpr std::chrono::seconds TEMPLATE_DOWNLOAD_TIMEOUT{10};

/// Лексически нормализованный путь без завершающего '/'
std::filesystem::path normalize_location(const std::filesystem::path& location) {
    std::filesystem::path normal = location.lexically_normal();
    if (normal.has_relative_path() && normal.filename().empty()) {
        normal = normal.parent_path();
    }
    return normal;
}

/// Путь для ввода-вывода: абсолютный как есть, иначе под базой
std::filesystem::path location_under_base(const std::filesystem::path& base,
                                          const std::filesystem::path& location) {
    return normalize_location(location.is_absolute() ? location : base / location);
}

ConfigSet absent_entry(const std::string& id) {
    ConfigSet configs;
    configs.emplace(id, std::nullopt);
    return configs;
}

std::string format_seconds(std::chrono::steady_clock::duration elapsed) {
    std::ostringstream out;
    out << std::chrono::duration<double>(elapsed).count() << "s";
    return out.str();
}

/// gzip tarball: распаковать во временную директорию и обойти корень архива
ResolveResult load_tarball(const std::string& url, const std::string& body,
                           output::Writer& writer) {
    try {
        archive::ScratchDirectory scratch;
        archive::ExtractResult extracted = archive::extract_tar_gz(body, scratch.path());
        if (!extracted) {
            return ResolveResult::failure(ErrorKind::ArchiveLayout,
                                          "unable to read config archive from " + url + ": " +
                                              extracted.error,
                                          url);
        }
        writer.trace("extracted " + std::to_string(extracted.members) + " archive members to " +
                     platform::path_to_utf8(scratch.path()));
        // Обход завершается до удаления scratch
        return ResolveResult::success(parse_config_folder(extracted.root, true, writer));
    } catch (const archive::ArchiveError& e) {
        writer.error(e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        writer.error(e.what());
    } catch (const std::runtime_error& e) {
        writer.error(e.what());
    }
    return ResolveResult::success(absent_entry(url));
}

}  // namespace

// ----------------------------------------------------------------------------
// Классификация
// ----------------------------------------------------------------------------

Specifier classify_specifier(const std::optional<std::string>& raw, const Registry& registry) {
    if (!raw) {
        return specifier::Absent{};
    }
    if (registry.contains(*raw)) {
        return specifier::RegistryAlias{*raw};
    }
    if (net::is_url(*raw)) {
        return specifier::Url{*raw};
    }
    return specifier::LocalPath{*raw};
}

// ----------------------------------------------------------------------------
// resolve_config
// ----------------------------------------------------------------------------

ResolveResult resolve_config(const Specifier& spec, const platform::ExecutionContext& ctx,
                             net::HttpClient& client, const Registry& registry,
                             output::Writer& writer) {
    const auto start = std::chrono::steady_clock::now();

    ResolveResult result = std::visit(
        [&](const auto& s) -> ResolveResult {
            using T = std::decay_t<decltype(s)>;

            if constexpr (std::is_same_v<T, specifier::Absent>) {
                return load_config_from_local_path(std::nullopt, ctx, writer);
            } else if constexpr (std::is_same_v<T, specifier::RegistryAlias>) {
                const std::string* url = registry.find(s.name);
                if (url == nullptr) {
                    return load_config_from_local_path(s.name, ctx, writer);
                }
                return download_config(*url, client, writer);
            } else if constexpr (std::is_same_v<T, specifier::Url>) {
                return download_config(s.url, client, writer);
            } else {
                return load_config_from_local_path(s.path, ctx, writer);
            }
        },
        spec);

    if (result.ok && !result.configs.empty()) {
        writer.debug("loaded " + std::to_string(result.configs.size()) + " configs in " +
                     format_seconds(std::chrono::steady_clock::now() - start));
    }
    return result;
}

// ----------------------------------------------------------------------------
// Локальные пути
// ----------------------------------------------------------------------------

ResolveResult load_config_from_local_path(const std::optional<std::string>& location,
                                          const platform::ExecutionContext& ctx,
                                          output::Writer& writer) {
    std::error_code ec;

    if (!location) {
        const std::filesystem::path default_file =
            location_under_base(ctx.base_path, DEFAULT_CONFIG_FILE);
        const std::filesystem::path default_folder =
            location_under_base(ctx.base_path, DEFAULT_CONFIG_FOLDER);

        if (std::filesystem::exists(default_file, ec)) {
            return ResolveResult::success(
                parse_config_at_path(default_file, DEFAULT_CONFIG_FILE, writer));
        }
        if (std::filesystem::exists(default_folder, ec)) {
            return ResolveResult::success(parse_config_folder(default_folder, true, writer));
        }
        return ResolveResult::success(absent_entry(DEFAULT_CONFIG_FILE));
    }

    const std::filesystem::path requested = platform::path_from_utf8(*location);
    const std::filesystem::path loc = location_under_base(ctx.base_path, requested);
    const std::filesystem::path id_path = normalize_location(requested);
    const std::string display = platform::path_to_utf8(id_path);

    auto status = std::filesystem::status(loc, ec);
    if (ec || !std::filesystem::exists(status)) {
        std::string addendum;
        if (ctx.in_docker) {
            addendum =
                " (since you are running in docker, you cannot specify arbitrary paths on the "
                "host; they must be mounted into the container)";
        }
        return ResolveResult::failure(
            ErrorKind::LocationNotFound,
            "unable to find a config; path `" + display + "` does not exist" + addendum, display);
    }

    if (std::filesystem::is_regular_file(status)) {
        return ResolveResult::success(parse_config_at_path(loc, display, writer));
    }
    if (std::filesystem::is_directory(status)) {
        // "." как префикс id не пишется
        const std::filesystem::path id_root =
            id_path == "." ? std::filesystem::path() : id_path;
        return ResolveResult::success(parse_config_folder(loc, false, writer, id_root));
    }
    return ResolveResult::failure(ErrorKind::InvalidLocationType,
                                  "config location `" + display + "` is not a file or folder!",
                                  display);
}

// ----------------------------------------------------------------------------
// Загрузка по URL
// ----------------------------------------------------------------------------

ResolveResult download_config(const std::string& url, net::HttpClient& client,
                              output::Writer& writer) {
    writer.debug("trying to download from " + url);

    net::HttpResult fetched = client.get(url, std::nullopt);
    if (!fetched) {
        writer.error(fetched.error);
        return ResolveResult::success(absent_entry(url));
    }

    const net::HttpResponse& response = fetched.response;
    if (!response.is_success()) {
        return ResolveResult::failure(ErrorKind::BadHttpStatus,
                                      "bad status code: " + std::to_string(response.status) +
                                          " returned by config url: " + url,
                                      url);
    }

    switch (net::classify_content_type(response.content_type)) {
        case net::ContentKind::PlainText:
            if (!net::is_valid_utf8(response.body)) {
                writer.error("unable to decode response from " + url + " as UTF-8 text");
                return ResolveResult::success(absent_entry(url));
            }
            return ResolveResult::success(
                parse_config_string(REMOTE_URL_ID, response.body, writer));
        case net::ContentKind::GzipArchive:
            return load_tarball(url, response.body, writer);
        case net::ContentKind::Unrecognized:
            break;
    }

    const std::string content_type =
        response.content_type.empty() ? "None" : response.content_type;
    return ResolveResult::failure(ErrorKind::UnsupportedContentType,
                                  "unknown content-type: " + content_type +
                                      " returned by config url: " + url + ". Can not parse",
                                  url);
}

// ----------------------------------------------------------------------------
// manual_config
// ----------------------------------------------------------------------------

ConfigSet manual_config(const std::string& pattern, const std::string& lang) {
    Value languages = Value::make_array();
    languages.push_back(Value(lang));

    Value rule = Value::make_object();
    rule.set("id", Value("-"));
    rule.set("pattern", Value(pattern));
    rule.set("message", Value(pattern));
    rule.set("languages", std::move(languages));
    rule.set("severity", Value("ERROR"));

    Value rules = Value::make_array();
    rules.push_back(std::move(rule));

    Value document = Value::make_object();
    document.set("rules", std::move(rules));

    ConfigSet configs;
    configs.emplace("manual", std::move(document));
    return configs;
}

// ----------------------------------------------------------------------------
// generate_config
// ----------------------------------------------------------------------------

ResolveResult generate_config(const platform::ExecutionContext& ctx, net::HttpClient& client,
                              output::Writer& writer) {
    const std::filesystem::path destination =
        location_under_base(ctx.base_path, DEFAULT_CONFIG_FILE);
    const std::string display = platform::path_to_utf8(destination);

    std::error_code ec;
    if (std::filesystem::exists(destination, ec)) {
        return ResolveResult::failure(ErrorKind::TemplateExists,
                                      display + " already exists. Please remove and try again",
                                      display);
    }

    std::string template_yaml;
    net::HttpResult fetched = client.get(TEMPLATE_YAML_URL, TEMPLATE_DOWNLOAD_TIMEOUT);
    if (fetched && fetched.response.is_success()) {
        template_yaml = fetched.response.body;
    } else {
        writer.debug(fetched ? "bad status code: " + std::to_string(fetched.response.status) +
                                   " returned by template url: " + TEMPLATE_YAML_URL
                             : fetched.error);
        writer.info(
            "There was a problem downloading the latest template config. Using fallback "
            "template");
        template_yaml = FALLBACK_TEMPLATE_YAML;
    }

    std::ofstream out(destination, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return ResolveResult::failure(ErrorKind::TemplateWrite,
                                      "failed to create file " + display, display);
    }
    out.write(template_yaml.data(), static_cast<std::streamsize>(template_yaml.size()));
    out.close();
    if (!out) {
        return ResolveResult::failure(ErrorKind::TemplateWrite, "failed to write file " + display,
                                      display);
    }

    writer.info("Template config successfully written to " + display);
    return ResolveResult::success(parse_config_string(DEFAULT_CONFIG_FILE, template_yaml, writer));
}

// ----------------------------------------------------------------------------
// resolve_targets
// ----------------------------------------------------------------------------

std::vector<std::filesystem::path> resolve_targets(const std::vector<std::string>& targets,
                                                   const platform::ExecutionContext& ctx) {
    std::vector<std::filesystem::path> result;
    result.reserve(targets.size());
    for (const auto& target : targets) {
        std::filesystem::path p = platform::path_from_utf8(target);
        result.push_back(p.is_absolute() ? p : ctx.base_path / p);
    }
    return result;
}

}  // namespace sgrep::config
