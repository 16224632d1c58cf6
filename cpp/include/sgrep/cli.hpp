// ==============================================================================
// sgrep/cli.hpp - CLI парсинг
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef SGREP_CLI_HPP
#define SGREP_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sgrep::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q
    bool precommit = false;  // --precommit (скрытая)
};

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// Разрешить конфиг и вывести набор документов (действие по умолчанию)
struct ResolveCommand {
    std::optional<std::string> config;            // -f, --config
    std::optional<std::string> pattern;           // -e, --pattern
    std::optional<std::string> lang;              // -l, --lang
    bool validate = false;                        // --validate
    std::optional<std::filesystem::path> output;  // -o, --output
    std::vector<std::string> targets;             // positional
};

/// -g, --generate-config
struct GenerateCommand {};

struct HelpCommand {};

struct VersionCommand {};

using Command = std::variant<ResolveCommand, GenerateCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help
std::string render_help();

/// Текст --version
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "Resolve sgrep rule configurations";

}  // namespace sgrep::cli

#endif  // SGREP_CLI_HPP
