// ==============================================================================
// lister.cpp - Перечисление установленных шрифтов
// ==============================================================================

#include "fontlist/lister.hpp"

#include "fontlist/glob.hpp"

#include <system_error>

namespace fontlist {

// ----------------------------------------------------------------------------
// ListError
// ----------------------------------------------------------------------------

std::string ListError::format() const {
    if (path.empty()) {
        return message;
    }
    return message + " (" + path + ")";
}

// ----------------------------------------------------------------------------
// FontRecord
// ----------------------------------------------------------------------------

FontRecord make_font_record(const std::filesystem::path& file, Scope scope) {
    FontRecord record;
    record.name = platform::path_to_utf8(file.stem());

    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(file, ec);
    if (ec) {
        absolute = file;
    }
    record.path = platform::path_to_utf8(absolute.lexically_normal());
    record.scope = scope_to_string(scope);
    return record;
}

// ----------------------------------------------------------------------------
// FontLister
// ----------------------------------------------------------------------------

FontLister::FontLister()
    : host_(platform::detect_platform()),
      fs_(&io::native_filesystem()),
      env_(platform::process_env()) {}

FontLister::FontLister(std::optional<platform::Platform> host, const io::FileSystem& fs,
                       platform::EnvLookup env)
    : host_(host), fs_(&fs), env_(std::move(env)) {}

void FontLister::trace(const std::string& message) const {
    if (trace_) {
        trace_(message);
    }
}

ListResult FontLister::list(const ListOptions& options) const {
    ListResult result;

    // Платформа определяется один раз, до обработки scope
    if (!host_.has_value()) {
        result.error.kind = ListErrorKind::UnsupportedPlatform;
        result.error.message = "unsupported platform - " + platform::os_name();
        return result;
    }
    const platform::Platform host = *host_;
    trace(std::string("platform: ") + platform::platform_to_string(host));

    std::vector<search::GlobPattern> patterns;
    patterns.reserve(options.names.size());
    for (const auto& name : options.names) {
        patterns.emplace_back(name);
    }

    for (Scope scope : options.scopes) {
        const std::string scope_name = scope_to_string(scope);

        std::filesystem::path dir =
            resolve_font_directory(host, scope, env_, options.overrides);
        if (dir.empty()) {
            trace("scope " + scope_name + ": font directory could not be resolved, skipping");
            continue;
        }

        const std::string dir_utf8 = platform::path_to_utf8(dir);
        trace("scope " + scope_name + ": searching '" + dir_utf8 + "'");

        // Отсутствующий каталог завершает весь обход, а не только этот scope
        if (!fs_->directory_exists(dir)) {
            trace("scope " + scope_name + ": directory does not exist, stopping");
            result.missing_directory = dir;
            result.stopped_at = scope;
            result.ok = true;
            return result;
        }

        io::DirectoryListing listing = fs_->list_files(dir);
        if (!listing.ok) {
            if (options.skip_errors) {
                result.warnings.push_back(listing.error);
                continue;
            }
            result.fonts.clear();
            result.error.kind = ListErrorKind::IoError;
            result.error.message = listing.error;
            result.error.path = dir_utf8;
            return result;
        }
        trace("scope " + scope_name + ": " + std::to_string(listing.files.size()) + " file(s)");

        for (const auto& pattern : patterns) {
            size_t matched = 0;
            for (const auto& file : listing.files) {
                if (pattern.matches(platform::path_to_utf8(file.filename()))) {
                    result.fonts.push_back(make_font_record(file, scope));
                    ++matched;
                }
            }
            trace("scope " + scope_name + ": pattern '" + pattern.pattern() + "' matched " +
                  std::to_string(matched) + " file(s)");
        }
    }

    result.ok = true;
    return result;
}

ListResult list_fonts(const ListOptions& options) {
    return FontLister().list(options);
}

// ----------------------------------------------------------------------------
// ListRequest
// ----------------------------------------------------------------------------

void ListRequest::add_name(std::string pattern) {
    names_.push_back(std::move(pattern));
}

void ListRequest::add_scope(Scope scope) {
    scopes_.push_back(scope);
}

ListOptions ListRequest::finish(const ListOptions& base) const {
    ListOptions options = base;
    if (!names_.empty()) {
        options.names = names_;
    }
    if (!scopes_.empty()) {
        options.scopes = scopes_;
    }
    return options;
}

}  // namespace fontlist
