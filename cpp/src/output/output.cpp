// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Запись идёт через FILE* (fwrite): байты уходят как есть, без std::endl и
// без локалей.
//
// ==============================================================================

#include "fontlist/output.hpp"

#include "fontlist/platform.hpp"

#include <algorithm>
#include <cstdio>

namespace fontlist::output {

namespace {

constexpr const char* ANSI_RESET = "\x1b[0m";

// │ U+2502, ─ U+2500
constexpr const char* BOX_VERTICAL = "\xe2\x94\x82";
constexpr const char* BOX_HORIZONTAL = "\xe2\x94\x80";

/// Символы рамки для одной горизонтальной линии: левый угол, стык, правый угол
struct BorderGlyphs {
    const char* left;
    const char* join;
    const char* right;
};

constexpr BorderGlyphs TOP_GLYPHS{"\xe2\x94\x8c", "\xe2\x94\xac", "\xe2\x94\x90"};        // ┌ ┬ ┐
constexpr BorderGlyphs SEPARATOR_GLYPHS{"\xe2\x94\x9c", "\xe2\x94\xbc", "\xe2\x94\xa4"};  // ├ ┼ ┤
constexpr BorderGlyphs BOTTOM_GLYPHS{"\xe2\x94\x94", "\xe2\x94\xb4", "\xe2\x94\x98"};     // └ ┴ ┘

}  // namespace

// ----------------------------------------------------------------------------
// Level
// ----------------------------------------------------------------------------

const char* level_prefix(Level level) {
    switch (level) {
    case Level::Info:
        return "[+]";
    case Level::Warn:
        return "[!]";
    case Level::Error:
        return "[x]";
    case Level::Debug:
        return "[*]";
    case Level::Trace:
        return "[~]";
    }
    return "";
}

Color level_color(Level level) {
    switch (level) {
    case Level::Info:
        return Color::Green;
    case Level::Warn:
        return Color::Yellow;
    case Level::Error:
        return Color::Red;
    case Level::Debug:
        return Color::Cyan;
    case Level::Trace:
        return Color::Magenta;
    }
    return Color::Default;
}

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.output_path.has_value()) {
        open_output_file();
    }
}

Writer::~Writer() {
    close_output_file();
    flush();
}

FILE* Writer::target(Stream s) const {
    if (s == Stream::Stdout) {
        return output_file_ != nullptr ? output_file_ : stdout;
    }
    return stderr;
}

void Writer::write(Stream s, std::string_view bytes) {
    if (bytes.empty()) {
        return;
    }
    std::fwrite(bytes.data(), 1, bytes.size(), target(s));
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

bool Writer::enabled(Level level) const {
    switch (level) {
    case Level::Info:
    case Level::Warn:
        return !config_.quiet;
    case Level::Error:
        return true;
    case Level::Debug:
        return config_.verbose > 0;
    case Level::Trace:
        return config_.verbose > 1;
    }
    return false;
}

void Writer::log(Level level, std::string_view message) {
    if (!enabled(level)) {
        return;
    }

    // Сообщения всегда в stderr: stdout может быть файлом результатов
    if (!supports_color(Stream::Stderr)) {
        write(Stream::Stderr, format_message(level, message));
        return;
    }
    write(Stream::Stderr, ansi_color_code(level_color(level)));
    write(Stream::Stderr, level_prefix(level));
    write(Stream::Stderr, ansi_reset_code());
    write(Stream::Stderr, " ");
    write_line(Stream::Stderr, message);
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
}

bool Writer::open_output_file() {
    close_output_file();
    if (!config_.output_path.has_value()) {
        return false;
    }

    const std::filesystem::path& path = *config_.output_path;
#ifdef _WIN32
    output_file_ = _wfopen(path.c_str(), L"wb");
#else
    output_file_ = std::fopen(platform::path_to_utf8(path).c_str(), "wb");
#endif
    return output_file_ != nullptr;
}

void Writer::close_output_file() {
    if (output_file_ == nullptr) {
        return;
    }
    std::fflush(output_file_);
    std::fclose(output_file_);
    output_file_ = nullptr;
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
}

std::vector<size_t> Table::column_widths() const {
    std::vector<size_t> widths;

    auto widen = [&widths](const std::vector<std::string>& cells) {
        if (cells.size() > widths.size()) {
            widths.resize(cells.size(), 0);
        }
        for (size_t i = 0; i < cells.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(cells[i]));
        }
    };

    widen(headers_);
    for (const auto& row : rows_) {
        widen(row);
    }
    return widths;
}

std::string Table::border(Border kind, const std::vector<size_t>& widths) {
    const BorderGlyphs& glyphs = kind == Border::Top         ? TOP_GLYPHS
                                 : kind == Border::Separator ? SEPARATOR_GLYPHS
                                                             : BOTTOM_GLYPHS;

    std::string line = glyphs.left;
    for (size_t i = 0; i < widths.size(); ++i) {
        if (i > 0) {
            line += glyphs.join;
        }
        // Ячейка + по пробелу с каждой стороны
        for (size_t j = 0; j < widths[i] + 2; ++j) {
            line += BOX_HORIZONTAL;
        }
    }
    line += glyphs.right;
    line += '\n';
    return line;
}

std::string Table::row_line(const std::vector<std::string>& cells,
                            const std::vector<size_t>& widths) {
    std::string line = BOX_VERTICAL;
    for (size_t i = 0; i < widths.size(); ++i) {
        std::string_view cell = i < cells.size() ? std::string_view(cells[i]) : std::string_view();
        line += ' ';
        line.append(cell);
        line.append(widths[i] - display_width(cell), ' ');
        line += ' ';
        line += BOX_VERTICAL;
    }
    line += '\n';
    return line;
}

std::string Table::to_string() const {
    const std::vector<size_t> widths = column_widths();

    std::string result = border(Border::Top, widths);
    if (!headers_.empty()) {
        result += row_line(headers_, widths);
        result += border(Border::Separator, widths);
    }
    for (const auto& row : rows_) {
        result += row_line(row, widths);
    }
    result += border(Border::Bottom, widths);
    return result;
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string format_message(Level level, std::string_view message) {
    std::string result = level_prefix(level);
    result += ' ';
    result.append(message);
    result += '\n';
    return result;
}

size_t display_width(std::string_view text) {
    // Байты продолжения UTF-8 (10xxxxxx) не начинают новый символ
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return "\x1b[32m";
    case Color::Yellow:
        return "\x1b[33m";
    case Color::Red:
        return "\x1b[31m";
    case Color::Cyan:
        return "\x1b[36m";
    case Color::Magenta:
        return "\x1b[35m";
    case Color::Default:
        break;
    }
    return "";
}

std::string ansi_reset_code() {
    return ANSI_RESET;
}

bool supports_color(Stream s) {
    return s == Stream::Stdout ? platform::is_tty_stdout() : platform::is_tty_stderr();
}

}  // namespace fontlist::output
