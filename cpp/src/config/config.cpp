// ==============================================================================
// config.cpp - Файл конфигурации (YAML)
// ==============================================================================

#include "fontlist/config.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace fontlist::config {

namespace {

std::string to_lower(std::string_view text) {
    std::string out(text);
    for (auto& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

/// Скаляр или список скаляров -> список строк
std::vector<std::string> parse_string_list(const YAML::Node& node, const std::string& key) {
    std::vector<std::string> values;
    if (node.IsScalar()) {
        values.push_back(node.as<std::string>());
        return values;
    }
    if (!node.IsSequence()) {
        throw std::runtime_error("'" + key + "' must be a string or a list of strings");
    }
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            throw std::runtime_error("'" + key + "' must contain only strings");
        }
        values.push_back(item.as<std::string>());
    }
    return values;
}

Scope parse_scope(const std::string& text) {
    auto scope = scope_from_string(text);
    if (!scope.has_value()) {
        throw std::runtime_error("invalid scope '" + text + "', must be: CurrentUser or AllUsers");
    }
    return *scope;
}

DirectoryOverrides parse_directories(const YAML::Node& node, const std::filesystem::path& base_dir,
                                     const platform::EnvLookup& env) {
    if (!node.IsMap()) {
        throw std::runtime_error("'directories' must be a mapping of scope to path");
    }

    DirectoryOverrides overrides;
    for (const auto& entry : node) {
        const std::string key = entry.first.as<std::string>();
        Scope scope = parse_scope(key);

        if (!entry.second.IsScalar()) {
            throw std::runtime_error("directory for '" + key + "' must be a string");
        }
        const std::string raw = entry.second.as<std::string>();
        std::string expanded = platform::expand_path_template(raw, env);
        if (expanded.empty()) {
            throw std::runtime_error("directory for '" + key + "' could not be expanded - " + raw);
        }

        std::filesystem::path dir = platform::path_from_utf8(expanded);
        if (dir.is_relative() && !base_dir.empty()) {
            dir = base_dir / dir;
        }
        overrides[scope] = dir;
    }
    return overrides;
}

}  // namespace

// ----------------------------------------------------------------------------
// Формат вывода
// ----------------------------------------------------------------------------

std::optional<output::Format> format_from_string(std::string_view text) {
    const std::string lower = to_lower(text);
    if (lower == "table") {
        return output::Format::Std;
    }
    if (lower == "json") {
        return output::Format::Json;
    }
    if (lower == "jsonl") {
        return output::Format::Jsonl;
    }
    if (lower == "csv") {
        return output::Format::Csv;
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// ConfigError
// ----------------------------------------------------------------------------

std::string ConfigError::format() const {
    return "failed to load config '" + path + "' - " + message;
}

// ----------------------------------------------------------------------------
// Загрузка
// ----------------------------------------------------------------------------

ConfigResult parse_config(const std::string& yaml_text, const std::string& source,
                          const std::filesystem::path& base_dir, const platform::EnvLookup& env) {
    ConfigResult result;
    result.error.path = source;

    try {
        YAML::Node root = YAML::Load(yaml_text);

        // Пустой файл - пустая конфигурация
        if (root.IsNull()) {
            result.ok = true;
            return result;
        }
        if (!root.IsMap()) {
            result.error.message = "top level must be a mapping";
            return result;
        }

        Config& cfg = result.config;

        if (auto node = root["names"]; node && !node.IsNull()) {
            cfg.names = parse_string_list(node, "names");
        }

        if (auto node = root["scopes"]; node && !node.IsNull()) {
            std::vector<Scope> scopes;
            for (const auto& text : parse_string_list(node, "scopes")) {
                scopes.push_back(parse_scope(text));
            }
            cfg.scopes = std::move(scopes);
        }

        if (auto node = root["format"]; node && !node.IsNull()) {
            const std::string text = node.as<std::string>();
            auto format = format_from_string(text);
            if (!format.has_value()) {
                result.error.message =
                    "invalid format '" + text + "', must be: table, json, jsonl or csv";
                return result;
            }
            cfg.format = *format;
        }

        if (auto node = root["skip_errors"]; node && !node.IsNull()) {
            cfg.skip_errors = node.as<bool>();
        }

        if (auto node = root["directories"]; node && !node.IsNull()) {
            cfg.directories = parse_directories(node, base_dir, env);
        }

        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.config = Config{};
        result.error.message = e.what();
    } catch (const std::exception& e) {
        result.config = Config{};
        result.error.message = e.what();
    }

    return result;
}

ConfigResult load_config(const std::filesystem::path& path, const platform::EnvLookup& env) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        ConfigResult result;
        result.error.path = platform::path_to_utf8(path);
        result.error.message = "file could not be opened";
        return result;
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();

    return parse_config(buffer.str(), platform::path_to_utf8(path), path.parent_path(), env);
}

}  // namespace fontlist::config
