// ==============================================================================
// fontlist/discovery.hpp - Перечисление файлов в каталоге
// ==============================================================================
//
// Назначение:
// - Проверка существования каталога
// - Список обычных файлов непосредственно в каталоге (без рекурсии)
// - Порядок результатов - порядок, в котором их отдаёт ОС (без сортировки)
//
// FileSystem - точка подмены для тестов (in-memory реализация).
//
// ==============================================================================

#ifndef FONTLIST_DISCOVERY_HPP
#define FONTLIST_DISCOVERY_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace fontlist::io {

// ----------------------------------------------------------------------------
// DirectoryListing - результат чтения каталога
// ----------------------------------------------------------------------------

struct DirectoryListing {
    bool ok = false;

    /// Пути обычных файлов (dir / filename), в порядке чтения каталога
    std::vector<std::filesystem::path> files;

    /// Сообщение об ошибке (при ok == false)
    std::string error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// FileSystem - провайдер файловой системы
// ----------------------------------------------------------------------------

class FileSystem {
public:
    virtual ~FileSystem() = default;

    /// Существует ли каталог. Путь к обычному файлу - не каталог.
    virtual bool directory_exists(const std::filesystem::path& dir) const = 0;

    /// Обычные файлы непосредственно в каталоге.
    /// Подкаталоги, сокеты, устройства и битые symlink'и пропускаются.
    virtual DirectoryListing list_files(const std::filesystem::path& dir) const = 0;

protected:
    FileSystem() = default;
};

/// Реализация поверх std::filesystem
class NativeFileSystem : public FileSystem {
public:
    bool directory_exists(const std::filesystem::path& dir) const override;
    DirectoryListing list_files(const std::filesystem::path& dir) const override;
};

/// Общий экземпляр NativeFileSystem
const FileSystem& native_filesystem();

}  // namespace fontlist::io

#endif  // FONTLIST_DISCOVERY_HPP
