// ==============================================================================
// platform.cpp - Платформенные абстракции
// ==============================================================================
//
// Всё, что зависит от ОС: семейство платформы, кодировка путей, TTY и
// окружение процесса. Остальной код не содержит #ifdef _WIN32.
//
// ==============================================================================

#include "fontlist/platform.hpp"

#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#define NOMINMAX
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace fontlist::platform {

// ----------------------------------------------------------------------------
// Платформа хоста
// ----------------------------------------------------------------------------

const char* platform_to_string(Platform p) {
    switch (p) {
    case Platform::Windows:
        return "Windows";
    case Platform::Linux:
        return "Linux";
    case Platform::MacOS:
        return "MacOS";
    }
    return "Unknown";
}

std::optional<Platform> detect_platform() {
#ifdef _WIN32
    return Platform::Windows;
#elif defined(__APPLE__)
    return Platform::MacOS;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return std::nullopt;
#endif
}

std::string os_name() {
#ifdef _WIN32
    return "Windows";
#elif defined(__APPLE__)
    return "macOS";
#elif defined(__linux__)
    return "Linux";
#else
    return "Unknown";
#endif
}

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

#ifdef _WIN32
namespace {

std::wstring widen(std::string_view u8) {
    const int n = static_cast<int>(u8.size());
    const int len = MultiByteToWideChar(CP_UTF8, 0, u8.data(), n, nullptr, 0);
    if (len <= 0) {
        return {};
    }
    std::wstring out(static_cast<size_t>(len), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, u8.data(), n, out.data(), len);
    return out;
}

std::string narrow(std::wstring_view w) {
    const int n = static_cast<int>(w.size());
    const int len = WideCharToMultiByte(CP_UTF8, 0, w.data(), n, nullptr, 0, nullptr, nullptr);
    if (len <= 0) {
        return {};
    }
    std::string out(static_cast<size_t>(len), '\0');
    WideCharToMultiByte(CP_UTF8, 0, w.data(), n, out.data(), len, nullptr, nullptr);
    return out;
}

}  // namespace
#endif

std::filesystem::path path_from_utf8(std::string_view u8str) {
#ifdef _WIN32
    if (u8str.empty()) {
        return {};
    }
    std::wstring wide = widen(u8str);
    // Невалидный UTF-8: отдаём байты как есть
    return wide.empty() ? std::filesystem::path(u8str) : std::filesystem::path(wide);
#else
    return std::filesystem::path(u8str);
#endif
}

std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
    if (p.empty()) {
        return {};
    }
    std::string u8 = narrow(p.native());
    return u8.empty() ? p.string() : u8;
#else
    return p.string();
#endif
}

// ----------------------------------------------------------------------------
// TTY
// ----------------------------------------------------------------------------

namespace {

bool is_tty(FILE* stream) {
#ifdef _WIN32
    return _isatty(_fileno(stream)) != 0;
#else
    return isatty(fileno(stream)) != 0;
#endif
}

}  // namespace

bool is_tty_stdout() {
    return is_tty(stdout);
}

bool is_tty_stderr() {
    return is_tty(stderr);
}

// ----------------------------------------------------------------------------
// Окружение
// ----------------------------------------------------------------------------

std::optional<std::string> get_env(std::string_view name) {
#ifdef _WIN32
    const std::wstring wname = widen(name);
    DWORD len = GetEnvironmentVariableW(wname.c_str(), nullptr, 0);
    if (len == 0) {
        return std::nullopt;
    }
    std::wstring value(static_cast<size_t>(len), L'\0');
    value.resize(GetEnvironmentVariableW(wname.c_str(), value.data(), len));
    return narrow(value);
#else
    std::string key(name);
    const char* value = std::getenv(key.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
#endif
}

EnvLookup process_env() {
    return [](std::string_view name) { return get_env(name); };
}

const char* home_env_name() {
#ifdef _WIN32
    return "USERPROFILE";
#else
    return "HOME";
#endif
}

std::string expand_path_template(std::string_view tmpl, const EnvLookup& env) {
    std::string result;
    result.reserve(tmpl.size());

    size_t pos = 0;

    // Ведущий "~" -> домашний каталог ("~user" не поддерживается)
    if (!tmpl.empty() && tmpl[0] == '~' &&
        (tmpl.size() == 1 || tmpl[1] == '/' || tmpl[1] == '\\')) {
        auto home = env ? env(home_env_name()) : std::nullopt;
        if (!home.has_value() || home->empty()) {
            return {};
        }
        result += *home;
        pos = 1;
    }

    while (pos < tmpl.size()) {
        char c = tmpl[pos];
        if (c != '%') {
            result += c;
            ++pos;
            continue;
        }

        size_t close = tmpl.find('%', pos + 1);
        if (close == std::string_view::npos || close == pos + 1) {
            // Нет пары или "%%" - оставляем как есть
            size_t end = (close == std::string_view::npos) ? tmpl.size() : close + 1;
            result.append(tmpl.substr(pos, end - pos));
            pos = end;
            continue;
        }

        std::string_view name = tmpl.substr(pos + 1, close - pos - 1);
        auto value = env ? env(name) : std::nullopt;
        if (!value.has_value() || value->empty()) {
            return {};
        }
        result += *value;
        pos = close + 1;
    }

    return result;
}

}  // namespace fontlist::platform
