// ==============================================================================
// fontlist/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Writer: единственная точка записи в stdout/stderr
// - Диагностика по уровням (Level): info / warn / error / debug / trace
// - Результаты в stdout либо в файл (--output)
// - Table: таблица с рамкой из Unicode box-drawing
//
// Цвет (ANSI) применяется только к префиксу уровня и только на TTY.
// Сообщения уровней никогда не попадают в файл результатов.
//
// ==============================================================================

#ifndef FONTLIST_OUTPUT_HPP
#define FONTLIST_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fontlist::output {

enum class Stream { Stdout, Stderr };

/// Представление результатов
enum class Format {
    Std,   // Таблица
    Csv,
    Json,  // Массив с отступами
    Jsonl  // Объект на строку
};

enum class Color { Default, Green, Yellow, Red, Cyan, Magenta };

// ----------------------------------------------------------------------------
// Level - уровень диагностического сообщения
// ----------------------------------------------------------------------------
//
//   Level   префикс  цвет     когда печатается
//   Info    [+]      green    если не -q
//   Warn    [!]      yellow   если не -q
//   Error   [x]      red      всегда
//   Debug   [*]      cyan     -v
//   Trace   [~]      magenta  -vv
//
enum class Level { Info, Warn, Error, Debug, Trace };

/// "[+]", "[!]", "[x]", "[*]", "[~]"
const char* level_prefix(Level level);

Color level_color(Level level);

// ----------------------------------------------------------------------------
// OutputConfig
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;  // -q
    int verbose = 0;     // количество -v

    /// --output: файл для результатов (Stream::Stdout)
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

class Writer {
public:
    /// Если задан output_path, файл открывается сразу (см. has_output_file)
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// Байты как есть. Stdout уходит в файл, если он открыт.
    void write(Stream s, std::string_view bytes);

    void write_line(Stream s, std::string_view bytes);

    /// Будет ли сообщение уровня напечатано при текущих -q / -v
    bool enabled(Level level) const;

    /// "<prefix> <message>\n" в stderr, если уровень включён
    void log(Level level, std::string_view message);

    void info(std::string_view message) { log(Level::Info, message); }
    void warn(std::string_view message) { log(Level::Warn, message); }
    void error(std::string_view message) { log(Level::Error, message); }
    void debug(std::string_view message) { log(Level::Debug, message); }
    void trace(std::string_view message) { log(Level::Trace, message); }

    void flush();

    const OutputConfig& config() const { return config_; }

    /// (Пере)открыть файл из config().output_path
    /// @return false если путь не задан или файл не открылся
    bool open_output_file();

    void close_output_file();

    bool has_output_file() const { return output_file_ != nullptr; }

private:
    FILE* target(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;
};

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------
//
//   ┌──────┬──────┐
//   │ Name │ Path │   <- заголовок (если задан)
//   ├──────┼──────┤
//   │ ...  │ ...  │
//   └──────┴──────┘
//
// Ширина столбца считается в кодовых точках UTF-8.
//
class Table {
public:
    void set_headers(const std::vector<std::string>& headers);

    /// Недостающие ячейки печатаются пустыми
    void add_row(const std::vector<std::string>& cells);

    std::string to_string() const;

private:
    enum class Border { Top, Separator, Bottom };

    std::vector<size_t> column_widths() const;
    static std::string border(Border kind, const std::vector<size_t>& widths);
    static std::string row_line(const std::vector<std::string>& cells,
                                const std::vector<size_t>& widths);

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// "<prefix> <message>\n" без цвета
std::string format_message(Level level, std::string_view message);

/// Ширина строки в кодовых точках UTF-8
size_t display_width(std::string_view text);

std::string ansi_color_code(Color color);
std::string ansi_reset_code();

/// Цвет только для TTY
bool supports_color(Stream s);

}  // namespace fontlist::output

#endif  // FONTLIST_OUTPUT_HPP
