// ==============================================================================
// fontlist/config.hpp - Файл конфигурации (YAML)
// ==============================================================================
//
// Назначение:
// - Значения по умолчанию для шаблонов, scope, формата вывода
// - Переопределение каталогов шрифтов по scope
//
// Формат:
//   names: ["*.ttf", "*.otf"]
//   scopes: [CurrentUser, AllUsers]
//   format: table            # table | json | jsonl | csv
//   skip_errors: false
//   directories:
//     CurrentUser: ~/fonts
//     AllUsers: /opt/fonts
//
// Все ключи необязательны, неизвестные ключи верхнего уровня игнорируются.
// Вместо списка допускается одиночное скалярное значение.
// Относительные пути в directories отсчитываются от каталога файла
// конфигурации; "~" и %VAR% раскрываются.
//
// ==============================================================================

#ifndef FONTLIST_CONFIG_HPP
#define FONTLIST_CONFIG_HPP

#include "fontlist/font_dirs.hpp"
#include "fontlist/output.hpp"
#include "fontlist/platform.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fontlist::config {

struct Config {
    std::optional<std::vector<std::string>> names;
    std::optional<std::vector<Scope>> scopes;
    std::optional<output::Format> format;
    std::optional<bool> skip_errors;
    DirectoryOverrides directories;
};

struct ConfigError {
    std::string message;
    std::string path;

    /// "failed to load config '<path>' - <message>"
    std::string format() const;
};

struct ConfigResult {
    bool ok = false;
    Config config;
    ConfigError error;

    explicit operator bool() const { return ok; }
};

/// Загрузить конфигурацию из файла
ConfigResult load_config(const std::filesystem::path& path,
                         const platform::EnvLookup& env = platform::process_env());

/// Разобрать конфигурацию из строки.
/// @param source имя источника для сообщений об ошибках
/// @param base_dir база для относительных путей в directories
ConfigResult parse_config(const std::string& yaml_text, const std::string& source,
                          const std::filesystem::path& base_dir,
                          const platform::EnvLookup& env = platform::process_env());

/// "table" / "json" / "jsonl" / "csv" (без учёта регистра)
std::optional<output::Format> format_from_string(std::string_view text);

}  // namespace fontlist::config

#endif  // FONTLIST_CONFIG_HPP
