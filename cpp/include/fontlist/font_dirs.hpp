// ==============================================================================
// fontlist/font_dirs.hpp - Scope и таблица каталогов шрифтов
// ==============================================================================
//
// Назначение:
// - Scope enum (CurrentUser / AllUsers) и его строковое представление
// - Статическая таблица (Platform, Scope) -> шаблон пути
// - Разрешение шаблона в конкретный каталог (с учётом переопределений)
//
// ==============================================================================

#ifndef FONTLIST_FONT_DIRS_HPP
#define FONTLIST_FONT_DIRS_HPP

#include "fontlist/platform.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fontlist {

// ----------------------------------------------------------------------------
// Scope - уровень установки шрифтов
// ----------------------------------------------------------------------------

enum class Scope { CurrentUser, AllUsers };

/// Все значения Scope в порядке объявления
const std::vector<Scope>& all_scopes();

/// "CurrentUser" / "AllUsers"
const char* scope_to_string(Scope scope);

/// Разбор имени scope без учёта регистра ("allusers" -> AllUsers)
/// @return nullopt для неизвестного имени
std::optional<Scope> scope_from_string(std::string_view text);

// ----------------------------------------------------------------------------
// Таблица каталогов
// ----------------------------------------------------------------------------

/// Переопределения каталогов по scope (из конфигурации)
using DirectoryOverrides = std::map<Scope, std::filesystem::path>;

/// Шаблон пути для пары (Platform, Scope), до раскрытия ~ и %VAR%.
///
/// | Platform | CurrentUser                               | AllUsers           |
/// |----------|-------------------------------------------|--------------------|
/// | Windows  | %LOCALAPPDATA%\Microsoft\Windows\Fonts    | %WINDIR%\Fonts     |
/// | Linux    | ~/.local/share/fonts                      | /usr/share/fonts   |
/// | MacOS    | ~/Library/Fonts                           | /Library/Fonts     |
const char* font_directory_template(platform::Platform host, Scope scope);

/// Разрешить каталог шрифтов для scope.
///
/// Переопределение для scope имеет приоритет над таблицей. Пустой путь
/// означает, что шаблон не удалось раскрыть (переменная окружения не задана),
/// и scope нужно пропустить.
std::filesystem::path resolve_font_directory(platform::Platform host, Scope scope,
                                             const platform::EnvLookup& env,
                                             const DirectoryOverrides& overrides = {});

}  // namespace fontlist

#endif  // FONTLIST_FONT_DIRS_HPP
