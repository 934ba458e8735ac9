// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Сообщения об ошибках повторяют стиль clap:
//   error: <описание>
//
//   For more information, try '--help'.
//
// ==============================================================================

#include "fontlist/cli.hpp"

#include "fontlist/platform.hpp"

#include <cstring>
#include <string_view>

namespace fontlist::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

constexpr const char* USAGE = "Usage: fontlist [OPTIONS] [NAME]...";
constexpr const char* MORE_INFO = "For more information, try '--help'.\n";

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

/// "-v", "-vv", "-vvv" -> количество 'v'; иначе 0
int count_verbose_flags(const char* arg) {
    if (arg[0] != '-' || arg[1] != 'v') {
        return 0;
    }
    int count = 0;
    for (const char* p = arg + 1; *p != '\0'; ++p) {
        if (*p != 'v') {
            return 0;
        }
        ++count;
    }
    return count;
}

enum class ValueStatus { NoMatch, Ok, Missing };

/// Опция со значением: "-o VALUE", "--output VALUE", "--output=VALUE"
ValueStatus take_value(int argc, char** argv, int& i, const char* short_name,
                       const char* long_name, std::string& value) {
    const char* arg = argv[i];

    if ((short_name != nullptr && str_eq(arg, short_name)) || str_eq(arg, long_name)) {
        if (i + 1 >= argc) {
            return ValueStatus::Missing;
        }
        ++i;
        value = argv[i];
        return ValueStatus::Ok;
    }

    std::string with_eq = std::string(long_name) + "=";
    if (starts_with(arg, with_eq.c_str())) {
        value = arg + with_eq.size();
        if (value.empty()) {
            return ValueStatus::Missing;
        }
        return ValueStatus::Ok;
    }

    return ValueStatus::NoMatch;
}

std::string missing_value_error(const char* display) {
    return std::string("error: a value is required for '") + display +
           "' but none was supplied\n\n" + MORE_INFO;
}

std::string invalid_scope_error(const std::string& value) {
    return "error: invalid value '" + value +
           "' for '--scope <SCOPE>': must be: CurrentUser, AllUsers\n\n" + MORE_INFO;
}

std::string conflict_error(const std::string& first, const std::string& second) {
    return "error: the argument '" + second + "' cannot be used with '" + first + "'\n\n" +
           USAGE + "\n\n" + MORE_INFO;
}

std::string unexpected_argument_error(const char* arg) {
    return std::string("error: unexpected argument '") + arg + "' found\n\n" + USAGE + "\n\n" +
           MORE_INFO;
}

/// "CurrentUser,AllUsers" -> [CurrentUser, AllUsers]
/// @return false и bad_value при неизвестном имени
bool parse_scope_list(const std::string& text, std::vector<Scope>& out, std::string& bad_value) {
    size_t start = 0;
    while (start <= text.size()) {
        size_t comma = text.find(',', start);
        size_t end = (comma == std::string::npos) ? text.size() : comma;
        std::string item = text.substr(start, end - start);

        // Пробелы вокруг элементов списка допускаются
        size_t first = item.find_first_not_of(" \t");
        size_t last = item.find_last_not_of(" \t");
        item = (first == std::string::npos) ? "" : item.substr(first, last - first + 1);

        auto scope = scope_from_string(item);
        if (!scope.has_value()) {
            bad_value = item;
            return false;
        }
        out.push_back(*scope);

        if (comma == std::string::npos) {
            break;
        }
        start = comma + 1;
    }
    return true;
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("fontlist ") + VERSION + "\n";
}

std::string render_help() {
    return std::string(ABOUT) +
           "\n"
           "\n"
           "Usage: fontlist [OPTIONS] [NAME]...\n"
           "\n"
           "Arguments:\n"
           "  [NAME]...  Wildcard patterns matched against font file names (default: *)\n"
           "             Use '-' to read patterns from standard input, one per line\n"
           "\n"
           "Options:\n"
           "  -s, --scope <SCOPE>    Installation scope: CurrentUser, AllUsers\n"
           "                         (repeatable or comma-separated, default: CurrentUser)\n"
           "  -j, --json             Output as JSON\n"
           "      --jsonl            Output as JSON lines\n"
           "      --csv              Output as CSV\n"
           "  -o, --output <OUTPUT>  Save output to a file\n"
           "  -c, --config <CONFIG>  Load defaults from a YAML configuration file\n"
           "      --skip-errors      Skip unreadable directories and continue\n"
           "  -v...                  Print verbose output\n"
           "  -q                     Suppress informational output\n"
           "  -h, --help             Print help\n"
           "  -V, --version          Print version\n"
           "\n"
           "Examples:\n"
           "\n"
           "    List all fonts installed for the current user:\n"
           "        ./fontlist\n"
           "\n"
           "    List Arial variants from both scopes as JSON:\n"
           "        ./fontlist 'Arial*' --scope CurrentUser,AllUsers --json\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;

    ListCommand list_cmd;
    std::string format_flag;  // первый встреченный флаг формата
    bool positional_only = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        std::string value;

        // После "--" все аргументы - шаблоны
        if (positional_only) {
            list_cmd.names.emplace_back(arg);
            continue;
        }
        if (str_eq(arg, "--")) {
            positional_only = true;
            continue;
        }

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        }
        if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        }

        if (int v = count_verbose_flags(arg); v > 0) {
            result.global.verbose += v;
            continue;
        }
        if (str_eq(arg, "-q")) {
            result.global.quiet = true;
            continue;
        }
        if (str_eq(arg, "--skip-errors")) {
            list_cmd.skip_errors = true;
            continue;
        }

        // Формат вывода: взаимоисключающие флаги
        std::optional<output::Format> format;
        if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            format = output::Format::Json;
        } else if (str_eq(arg, "--jsonl")) {
            format = output::Format::Jsonl;
        } else if (str_eq(arg, "--csv")) {
            format = output::Format::Csv;
        }
        if (format.has_value()) {
            if (list_cmd.format.has_value() && *list_cmd.format != *format) {
                result.diagnostic.stderr_message = conflict_error(format_flag, arg);
                return result;
            }
            if (!list_cmd.format.has_value()) {
                format_flag = arg;
            }
            list_cmd.format = format;
            continue;
        }

        switch (take_value(argc, argv, i, "-s", "--scope", value)) {
        case ValueStatus::Ok: {
            std::string bad_value;
            if (!parse_scope_list(value, list_cmd.scopes, bad_value)) {
                result.diagnostic.stderr_message = invalid_scope_error(bad_value);
                return result;
            }
            continue;
        }
        case ValueStatus::Missing:
            result.diagnostic.stderr_message = missing_value_error("--scope <SCOPE>");
            return result;
        case ValueStatus::NoMatch:
            break;
        }

        switch (take_value(argc, argv, i, "-o", "--output", value)) {
        case ValueStatus::Ok:
            list_cmd.output = platform::path_from_utf8(value);
            continue;
        case ValueStatus::Missing:
            result.diagnostic.stderr_message = missing_value_error("--output <OUTPUT>");
            return result;
        case ValueStatus::NoMatch:
            break;
        }

        switch (take_value(argc, argv, i, "-c", "--config", value)) {
        case ValueStatus::Ok:
            list_cmd.config = platform::path_from_utf8(value);
            continue;
        case ValueStatus::Missing:
            result.diagnostic.stderr_message = missing_value_error("--config <CONFIG>");
            return result;
        case ValueStatus::NoMatch:
            break;
        }

        // "-" - маркер stdin, остальное с "-" - неизвестная опция
        if (arg[0] == '-' && !str_eq(arg, STDIN_MARKER)) {
            result.diagnostic.stderr_message = unexpected_argument_error(arg);
            return result;
        }

        list_cmd.names.emplace_back(arg);
    }

    result.ok = true;
    result.command = std::move(list_cmd);
    return result;
}

}  // namespace fontlist::cli
