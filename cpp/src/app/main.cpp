// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv
// 2. Создание Writer
// 3. Выбор контекста выполнения (единственное чтение окружения)
// 4. Dispatch команды
// 5. Возврат exit code: 0 успех, 1 фатальная ошибка, 2 ошибка CLI
//
// ==============================================================================

#include "sgrep/cli.hpp"
#include "sgrep/config_set.hpp"
#include "sgrep/http.hpp"
#include "sgrep/output.hpp"
#include "sgrep/platform.hpp"
#include "sgrep/registry.hpp"
#include "sgrep/resolver.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <type_traits>
#include <variant>

namespace {

// ----------------------------------------------------------------------------
// Выполнение команд
// ----------------------------------------------------------------------------

int run_generate(const sgrep::platform::ExecutionContext& ctx, sgrep::output::Writer& writer) {
    using namespace sgrep;

    net::CurlHttpClient client;
    config::ResolveResult result = config::generate_config(ctx, client, writer);
    if (!result) {
        writer.error(result.error.message);
        return 1;
    }
    return 0;
}

int run_resolve(const sgrep::cli::ResolveCommand& cmd,
                const sgrep::platform::ExecutionContext& ctx, sgrep::output::Writer& writer) {
    using namespace sgrep;

    // --output: отдельный Writer для stdout
    std::unique_ptr<output::Writer> file_writer;
    output::Writer* out = &writer;
    if (cmd.output.has_value()) {
        output::OutputConfig out_cfg = writer.config();
        out_cfg.output_path = cmd.output;
        file_writer = std::make_unique<output::Writer>(out_cfg);
        if (!file_writer->has_output_file()) {
            writer.error("unable to open output file " + platform::path_to_utf8(*cmd.output));
            return 1;
        }
        out = file_writer.get();
    }

    config::ConfigSet configs;
    if (cmd.pattern.has_value()) {
        configs = config::manual_config(*cmd.pattern, cmd.lang.value_or(""));
    } else {
        const config::Registry registry = config::Registry::defaults();
        net::CurlHttpClient client;
        config::ResolveResult result = config::resolve_config(
            config::classify_specifier(cmd.config, registry), ctx, client, registry, writer);
        if (!result) {
            writer.error(result.error.message);
            return 1;
        }
        configs = std::move(result.configs);
    }

    for (const auto& target : config::resolve_targets(cmd.targets, ctx)) {
        writer.debug("target: " + platform::path_to_utf8(target));
    }

    out->write_json_pretty(config::to_json(configs));
    out->flush();

    if (cmd.validate) {
        const std::size_t absent = config::count_absent(configs);
        if (absent > 0) {
            for (const auto& [id, document] : configs) {
                if (!document.has_value()) {
                    writer.error("unable to load config " + id);
                }
            }
            writer.error(std::to_string(absent) + " of " + std::to_string(configs.size()) +
                         " configs could not be loaded");
            return 1;
        }
        writer.info("all " + std::to_string(configs.size()) + " configs are valid");
    }
    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace sgrep;

    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);

    // 2. Создание Writer
    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    output::Writer writer(out_cfg);

    // 3. Ошибки парсинга выводятся без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    if (std::holds_alternative<cli::HelpCommand>(parse_result.command)) {
        writer.write(output::Stream::Stdout, cli::render_help());
        return 0;
    }
    if (std::holds_alternative<cli::VersionCommand>(parse_result.command)) {
        writer.write(output::Stream::Stdout, cli::render_version());
        return 0;
    }

    // 4. Контекст выполнения
    platform::ContextResult ctx =
        platform::select_execution_context(platform::read_environment(),
                                           parse_result.global.precommit);
    if (!ctx) {
        writer.error(ctx.error);
        return 1;
    }
    writer.trace("base path: " + platform::path_to_utf8(ctx.context.base_path));

    // 5. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::GenerateCommand>) {
                return run_generate(ctx.context, writer);
            } else if constexpr (std::is_same_v<T, cli::ResolveCommand>) {
                return run_resolve(cmd, ctx.context, writer);
            } else {
                // Help/Version обработаны выше
                return 0;
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        // Перехват исключений на границе app, формат "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
