// ==============================================================================
// fontlist/cli.hpp - CLI парсинг
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// Собственный слой CLI: формат help/errors фиксирован и проверяется тестами.
//
// ==============================================================================

#ifndef FONTLIST_CLI_HPP
#define FONTLIST_CLI_HPP

#include "fontlist/font_dirs.hpp"
#include "fontlist/output.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace fontlist::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;     // -v (repeatable, -vv)
    bool quiet = false;  // -q
};

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// Перечисление шрифтов (единственная рабочая команда)
struct ListCommand {
    /// Позиционные шаблоны в порядке указания; "-" - читать шаблоны из stdin
    std::vector<std::string> names;

    std::vector<Scope> scopes;                    // -s, --scope
    std::optional<output::Format> format;         // -j, --jsonl, --csv
    std::optional<std::filesystem::path> output;  // -o, --output
    std::optional<std::filesystem::path> config;  // -c, --config
    bool skip_errors = false;                     // --skip-errors
};

/// --help
struct HelpCommand {};

/// --version
struct VersionCommand {};

using Command = std::variant<ListCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

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

/// Текст --version: "fontlist <VERSION>\n"
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "List fonts installed for the current user or for all users";

/// Позиционный аргумент, означающий чтение шаблонов из stdin
constexpr const char* STDIN_MARKER = "-";

}  // namespace fontlist::cli

#endif  // FONTLIST_CLI_HPP
