// ==============================================================================
// font_dirs.cpp - Scope и таблица каталогов шрифтов
// ==============================================================================

#include "fontlist/font_dirs.hpp"

#include <cctype>

namespace fontlist {

namespace {

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

// ----------------------------------------------------------------------------
// Scope
// ----------------------------------------------------------------------------

const std::vector<Scope>& all_scopes() {
    static const std::vector<Scope> scopes = {Scope::CurrentUser, Scope::AllUsers};
    return scopes;
}

const char* scope_to_string(Scope scope) {
    switch (scope) {
    case Scope::CurrentUser:
        return "CurrentUser";
    case Scope::AllUsers:
        return "AllUsers";
    }
    return "";
}

std::optional<Scope> scope_from_string(std::string_view text) {
    for (Scope scope : all_scopes()) {
        if (iequals(text, scope_to_string(scope))) {
            return scope;
        }
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// Таблица каталогов
// ----------------------------------------------------------------------------

const char* font_directory_template(platform::Platform host, Scope scope) {
    using platform::Platform;

    switch (host) {
    case Platform::Windows:
        switch (scope) {
        case Scope::CurrentUser:
            return "%LOCALAPPDATA%\\Microsoft\\Windows\\Fonts";
        case Scope::AllUsers:
            return "%WINDIR%\\Fonts";
        }
        break;
    case Platform::Linux:
        switch (scope) {
        case Scope::CurrentUser:
            return "~/.local/share/fonts";
        case Scope::AllUsers:
            return "/usr/share/fonts";
        }
        break;
    case Platform::MacOS:
        switch (scope) {
        case Scope::CurrentUser:
            return "~/Library/Fonts";
        case Scope::AllUsers:
            return "/Library/Fonts";
        }
        break;
    }
    return "";
}

std::filesystem::path resolve_font_directory(platform::Platform host, Scope scope,
                                             const platform::EnvLookup& env,
                                             const DirectoryOverrides& overrides) {
    auto it = overrides.find(scope);
    if (it != overrides.end()) {
        return it->second;
    }

    std::string expanded = platform::expand_path_template(font_directory_template(host, scope),
                                                          env);
    if (expanded.empty()) {
        return {};
    }
    return platform::path_from_utf8(expanded);
}

}  // namespace fontlist
