// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Формат ошибок следует clap: "error: ..." + Usage + подсказка про --help.
//
// ==============================================================================

#include "sgrep/cli.hpp"

#include "sgrep/platform.hpp"

#include <cstring>

namespace sgrep::cli {

namespace {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

constexpr const char* USAGE = "Usage: sgrep-lint [OPTIONS] [TARGET]...";

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

std::string render_usage_error(const std::string& error_msg) {
    return error_msg + "\n\n" + USAGE + "\n\nFor more information, try '--help'.\n";
}

/// Опция со значением: "-f X", "--config X" или "--config=X".
/// Возвращает true, если arg - эта опция; value пусто при отсутствии значения.
bool take_value(int argc, char** argv, int& i, const char* short_name, const char* long_name,
                std::optional<std::string>& value, bool& missing) {
    const char* arg = argv[i];
    const std::size_t long_len = std::strlen(long_name);

    if ((short_name != nullptr && str_eq(arg, short_name)) || str_eq(arg, long_name)) {
        if (i + 1 < argc) {
            ++i;
            value = argv[i];
        } else {
            missing = true;
        }
        return true;
    }
    if (starts_with(arg, long_name) && arg[long_len] == '=') {
        value = std::string(arg + long_len + 1);
        return true;
    }
    return false;
}

}  // namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("sgrep-lint ") + VERSION + "\n";
}

std::string render_help() {
    return std::string(ABOUT) +
           "\n"
           "\n" +
           USAGE +
           "\n"
           "\n"
           "Arguments:\n"
           "  [TARGET]...  Files or folders to lint (relative to the base directory)\n"
           "\n"
           "Options:\n"
           "  -f, --config <CONFIG>    Config file, folder, URL or registry alias (r2c)\n"
           "  -g, --generate-config    Write a template sgrep.yml to the current directory\n"
           "  -e, --pattern <PATTERN>  Single pattern to search for\n"
           "  -l, --lang <LANG>        Language of the pattern (requires --pattern)\n"
           "      --validate           Fail when any config could not be loaded\n"
           "  -o, --output <OUTPUT>    Save output to a file\n"
           "  -v...                    Print verbose output\n"
           "  -q                       Suppress informational messages\n"
           "  -h, --help               Print help\n"
           "  -V, --version            Print version\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    ResolveCommand resolve_cmd;
    std::optional<std::string> output;
    bool generate = false;
    bool only_positional = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool missing = false;

        if (only_positional || arg[0] != '-' || str_eq(arg, "-")) {
            resolve_cmd.targets.emplace_back(arg);
            continue;
        }

        if (str_eq(arg, "--")) {
            only_positional = true;
        } else if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[1] == 'v' && arg[1 + std::strspn(arg + 1, "v")] == '\0') {
            // -v, -vv, -vvv
            result.global.verbose += static_cast<int>(std::strlen(arg) - 1);
        } else if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "--precommit")) {
            result.global.precommit = true;
        } else if (str_eq(arg, "--validate")) {
            resolve_cmd.validate = true;
        } else if (str_eq(arg, "-g") || str_eq(arg, "--generate-config")) {
            generate = true;
        } else if (take_value(argc, argv, i, "-f", "--config", resolve_cmd.config, missing) ||
                   take_value(argc, argv, i, "-e", "--pattern", resolve_cmd.pattern, missing) ||
                   take_value(argc, argv, i, "-l", "--lang", resolve_cmd.lang, missing) ||
                   take_value(argc, argv, i, "-o", "--output", output, missing)) {
            if (missing) {
                result.diagnostic.stderr_message = render_usage_error(
                    std::string("error: a value is required for '") + arg +
                    "' but none was supplied");
                return result;
            }
        } else {
            result.diagnostic.stderr_message =
                render_usage_error(std::string("error: unexpected argument '") + arg + "' found");
            return result;
        }
    }

    if (output) {
        resolve_cmd.output = platform::path_from_utf8(*output);
    }

    // --config, --generate-config и --pattern взаимоисключающие
    int sources = (resolve_cmd.config ? 1 : 0) + (generate ? 1 : 0) +
                  (resolve_cmd.pattern ? 1 : 0);
    if (sources > 1) {
        result.diagnostic.stderr_message = render_usage_error(
            "error: only one of '--config', '--generate-config' and '--pattern' can be used");
        return result;
    }

    if (resolve_cmd.pattern.has_value() != resolve_cmd.lang.has_value()) {
        result.diagnostic.stderr_message = render_usage_error(
            resolve_cmd.pattern ? "error: the following required arguments were not provided:\n"
                                  "  --lang <LANG>"
                                : "error: the following required arguments were not provided:\n"
                                  "  --pattern <PATTERN>");
        return result;
    }

    result.ok = true;
    if (generate) {
        result.command = GenerateCommand{};
    } else {
        result.command = std::move(resolve_cmd);
    }
    return result;
}

}  // namespace sgrep::cli
