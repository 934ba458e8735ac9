// ==============================================================================
// fontlist/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Определение платформы хоста (Windows / Linux / MacOS)
// - Преобразования path <-> UTF-8
// - TTY detection
// - Доступ к переменным окружения и раскрытие шаблонов путей (~, %VAR%)
//
// Вся платформенная специфика (#ifdef _WIN32 и т.п.) изолирована здесь.
//
// ==============================================================================

#ifndef FONTLIST_PLATFORM_HPP
#define FONTLIST_PLATFORM_HPP

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace fontlist::platform {

// ----------------------------------------------------------------------------
// Platform - семейство ОС хоста
// ----------------------------------------------------------------------------

enum class Platform { Windows, Linux, MacOS };

/// Строковое представление: "Windows", "Linux", "MacOS"
const char* platform_to_string(Platform p);

/// Определить платформу хоста.
/// @return nullopt если ОС не относится ни к одной из известных платформ
std::optional<Platform> detect_platform();

/// Имя ОС для диагностики ("Windows", "Linux", "macOS" или "Unknown")
std::string os_name();

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// UTF-8 строка -> native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path -> UTF-8 строка
std::string path_to_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Окружение
// ----------------------------------------------------------------------------

/// Поиск переменной окружения. nullopt = переменная не задана.
using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

/// Чтение переменной окружения процесса (UTF-8)
std::optional<std::string> get_env(std::string_view name);

/// EnvLookup поверх окружения процесса
EnvLookup process_env();

/// Переменная с домашним каталогом для раскрытия "~"
/// (HOME на Unix, USERPROFILE на Windows)
const char* home_env_name();

/// Раскрыть шаблон пути.
///
/// - ведущий "~" заменяется значением home_env_name()
/// - "%NAME%" заменяется значением переменной NAME
///
/// Если хотя бы одна переменная не задана или пуста, возвращается пустая
/// строка. Одиночный "%" без пары сохраняется как есть.
std::string expand_path_template(std::string_view tmpl, const EnvLookup& env);

}  // namespace fontlist::platform

#endif  // FONTLIST_PLATFORM_HPP
