// ==============================================================================
// fontlist/lister.hpp - Перечисление установленных шрифтов
// ==============================================================================
//
// Назначение:
// - FontRecord: имя / путь / scope найденного файла
// - FontLister: обход каталогов по scope, фильтрация по glob-шаблонам
// - ListRequest: поэлементная (потоковая) сборка параметров запроса
//
// Порядок результатов: scope (в порядке запроса) -> шаблон (в порядке
// запроса) -> файл (в порядке чтения каталога). Файл, подходящий под два
// шаблона, попадает в результат дважды.
//
// Отсутствующий каталог прерывает весь обход: возвращаются записи,
// накопленные до этого scope. Это не ошибка.
//
// ==============================================================================

#ifndef FONTLIST_LISTER_HPP
#define FONTLIST_LISTER_HPP

#include "fontlist/discovery.hpp"
#include "fontlist/font_dirs.hpp"
#include "fontlist/platform.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fontlist {

// ----------------------------------------------------------------------------
// FontRecord
// ----------------------------------------------------------------------------

struct FontRecord {
    /// Имя файла без расширения ("Arial" для "Arial.ttf")
    std::string name;

    /// Абсолютный путь к файлу (UTF-8)
    std::string path;

    /// Строковое значение scope ("CurrentUser" / "AllUsers")
    std::string scope;

    bool operator==(const FontRecord& other) const {
        return name == other.name && path == other.path && scope == other.scope;
    }
    bool operator!=(const FontRecord& other) const { return !(*this == other); }
};

// ----------------------------------------------------------------------------
// Параметры и результат
// ----------------------------------------------------------------------------

struct ListOptions {
    /// Glob-шаблоны имён файлов
    std::vector<std::string> names{"*"};

    /// Scope в порядке обхода
    std::vector<Scope> scopes{Scope::CurrentUser};

    /// Каталоги, заменяющие таблицу для текущей платформы
    DirectoryOverrides overrides;

    /// true: ошибка чтения каталога -> предупреждение, scope пропускается
    bool skip_errors = false;
};

enum class ListErrorKind {
    UnsupportedPlatform,  // ОС хоста не относится к известным платформам
    IoError               // Каталог существует, но прочитать его не удалось
};

struct ListError {
    ListErrorKind kind = ListErrorKind::IoError;
    std::string message;
    std::string path;

    /// "<message>" или "<message> (<path>)"
    std::string format() const;
};

struct ListResult {
    bool ok = false;
    std::vector<FontRecord> fonts;

    /// Каталог, на котором обход был прерван (если был)
    std::optional<std::filesystem::path> missing_directory;

    /// Scope, каталог которого отсутствует
    std::optional<Scope> stopped_at;

    /// Пропущенные ошибки чтения каталогов (при skip_errors)
    std::vector<std::string> warnings;

    ListError error;

    explicit operator bool() const { return ok; }
};

/// Приёмник трассировочных сообщений. Пустой - трассировка отключена.
using TraceSink = std::function<void(std::string_view)>;

// ----------------------------------------------------------------------------
// FontLister
// ----------------------------------------------------------------------------

class FontLister {
public:
    /// Lister для текущего хоста: detect_platform(), NativeFileSystem,
    /// окружение процесса
    FontLister();

    /// @param host платформа хоста; nullopt - неподдерживаемая ОС
    /// @param fs провайдер файловой системы (должен пережить FontLister)
    /// @param env поиск переменных окружения для шаблонов путей
    FontLister(std::optional<platform::Platform> host, const io::FileSystem& fs,
               platform::EnvLookup env);

    /// Подключить приёмник трассировки
    void set_trace(TraceSink sink) { trace_ = std::move(sink); }

    /// Выполнить перечисление
    ListResult list(const ListOptions& options) const;

private:
    void trace(const std::string& message) const;

    std::optional<platform::Platform> host_;
    const io::FileSystem* fs_;
    platform::EnvLookup env_;
    TraceSink trace_;
};

/// Перечислить шрифты на текущем хосте
ListResult list_fonts(const ListOptions& options = {});

/// Построить запись по пути файла (name = stem, path = absolute)
FontRecord make_font_record(const std::filesystem::path& file, Scope scope);

// ----------------------------------------------------------------------------
// ListRequest - потоковая сборка параметров
// ----------------------------------------------------------------------------

/// Шаблоны и scope добавляются по одному. Если ни одного шаблона
/// (scope) не было добавлено, finish() берёт их из base; для ListOptions
/// по умолчанию это "*" и CurrentUser.
class ListRequest {
public:
    void add_name(std::string pattern);
    void add_scope(Scope scope);

    /// Собрать ListOptions (overrides и skip_errors всегда берутся из base)
    ListOptions finish(const ListOptions& base = {}) const;

private:
    std::vector<std::string> names_;
    std::vector<Scope> scopes_;
};

}  // namespace fontlist

#endif  // FONTLIST_LISTER_HPP
