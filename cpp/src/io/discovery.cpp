// ==============================================================================
// discovery.cpp - Перечисление файлов в каталоге
// ==============================================================================

#include "fontlist/discovery.hpp"

#include "fontlist/platform.hpp"

#include <system_error>

namespace fontlist::io {

bool NativeFileSystem::directory_exists(const std::filesystem::path& dir) const {
    if (dir.empty()) {
        return false;
    }
    // Ошибка stat (нет доступа к родителю и т.п.) трактуется как "не существует"
    std::error_code ec;
    return std::filesystem::is_directory(dir, ec) && !ec;
}

DirectoryListing NativeFileSystem::list_files(const std::filesystem::path& dir) const {
    DirectoryListing listing;

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        listing.error = "failed to read directory '" + platform::path_to_utf8(dir) + "' - " +
                        ec.message();
        return listing;
    }

    for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }

        // is_regular_file следует по symlink'ам: ссылка на файл шрифта считается файлом
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) && !entry_ec) {
            listing.files.push_back(it->path());
        }
    }

    if (ec) {
        listing.files.clear();
        listing.error = "failed to read directory '" + platform::path_to_utf8(dir) + "' - " +
                        ec.message();
        return listing;
    }

    listing.ok = true;
    return listing;
}

const FileSystem& native_filesystem() {
    static const NativeFileSystem instance{};
    return instance;
}

}  // namespace fontlist::io
