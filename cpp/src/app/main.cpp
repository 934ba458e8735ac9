// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Загрузка конфигурации (config), сборка запроса (invocation)
// 4. Перечисление шрифтов и вывод результатов (report)
// 5. Возврат exit code
//
// Исключения перехватываются только здесь, на границе приложения.
//
// ==============================================================================

#include "fontlist/cli.hpp"
#include "fontlist/config.hpp"
#include "fontlist/invocation.hpp"
#include "fontlist/lister.hpp"
#include "fontlist/output.hpp"
#include "fontlist/platform.hpp"
#include "fontlist/report.hpp"

#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += names[i];
    }
    return out;
}

std::string join_scopes(const std::vector<fontlist::Scope>& scopes) {
    std::string out;
    for (size_t i = 0; i < scopes.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += fontlist::scope_to_string(scopes[i]);
    }
    return out;
}

// ----------------------------------------------------------------------------
// Выполнение команды
// ----------------------------------------------------------------------------

int run_list(const fontlist::cli::ListCommand& cmd, fontlist::output::Writer& writer) {
    using namespace fontlist;

    // Конфигурация: значения по умолчанию там, где командная строка молчит
    config::Config cfg;
    if (cmd.config.has_value()) {
        auto loaded = config::load_config(*cmd.config);
        if (!loaded.ok) {
            writer.error(loaded.error.format());
            return 1;
        }
        cfg = std::move(loaded.config);
        writer.debug("loaded config from '" + platform::path_to_utf8(*cmd.config) + "'");
    }

    const app::Invocation invocation = app::build_invocation(cmd, cfg, std::cin);
    const ListOptions& options = invocation.options;
    const output::Format format = invocation.format;

    writer.debug("patterns: " + join_names(options.names));
    writer.debug("scopes: " + join_scopes(options.scopes));
    for (const auto& [scope, dir] : options.overrides) {
        writer.debug(std::string("directory override for ") + scope_to_string(scope) + ": '" +
                     platform::path_to_utf8(dir) + "'");
    }

    FontLister lister;
    lister.set_trace([&writer](std::string_view message) { writer.trace(message); });

    ListResult result = lister.list(options);

    for (const auto& warning : result.warnings) {
        writer.warn(warning);
    }
    if (!result.ok) {
        writer.error(result.error.format());
        return 1;
    }
    // Прерванный обход не ошибка: сообщается только при -v
    if (auto stopped = app::missing_directory_message(result)) {
        writer.debug(*stopped);
    }

    // Результаты: в файл (--output) или в stdout
    std::unique_ptr<output::Writer> file_writer;
    output::Writer* out = &writer;
    if (cmd.output.has_value()) {
        output::OutputConfig out_cfg = writer.config();
        out_cfg.output_path = cmd.output;
        file_writer = std::make_unique<output::Writer>(out_cfg);
        if (!file_writer->has_output_file()) {
            writer.error("failed to open output file '" + platform::path_to_utf8(*cmd.output) +
                         "'");
            return 1;
        }
        out = file_writer.get();
    }

    if (format == output::Format::Std && result.fonts.empty()) {
        writer.info("No fonts found");
    } else {
        out->write(output::Stream::Stdout, report::render(result.fonts, format));
    }
    out->flush();

    writer.info("Found " + std::to_string(result.fonts.size()) + " font(s)");
    if (file_writer) {
        writer.info("Saved output to '" + platform::path_to_utf8(*cmd.output) + "'");
    }
    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace fontlist;

    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    output::Writer writer(out_cfg);

    // Ошибки парсинга выводятся как есть, без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else {
                return run_list(cmd, writer);
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
        // Формат ошибки: "[x] <err>"
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "[x] Unknown error occurred\n";
        return 1;
    }
}
