// ==============================================================================
// invocation.cpp - Сборка запроса из командной строки и конфигурации
// ==============================================================================

#include "fontlist/invocation.hpp"

#include "fontlist/platform.hpp"

namespace fontlist::app {

void read_names(std::istream& in, ListRequest& request) {
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }
        request.add_name(line);
    }
}

Invocation build_invocation(const cli::ListCommand& cmd, const config::Config& cfg,
                            std::istream& in) {
    ListOptions base;
    if (cfg.names.has_value()) {
        base.names = *cfg.names;
    }
    if (cfg.scopes.has_value()) {
        base.scopes = *cfg.scopes;
    }
    base.overrides = cfg.directories;
    base.skip_errors = cmd.skip_errors || cfg.skip_errors.value_or(false);

    ListRequest request;
    bool stdin_consumed = false;
    for (const auto& name : cmd.names) {
        if (name != cli::STDIN_MARKER) {
            request.add_name(name);
            continue;
        }
        if (!stdin_consumed) {
            read_names(in, request);
            stdin_consumed = true;
        }
    }
    for (Scope scope : cmd.scopes) {
        request.add_scope(scope);
    }

    Invocation invocation;
    invocation.options = request.finish(base);
    invocation.format = cmd.format.value_or(cfg.format.value_or(output::Format::Std));
    return invocation;
}

std::optional<std::string> missing_directory_message(const ListResult& result) {
    if (!result.missing_directory.has_value() || !result.stopped_at.has_value()) {
        return std::nullopt;
    }
    return std::string("font directory for ") + scope_to_string(*result.stopped_at) +
           " does not exist - " + platform::path_to_utf8(*result.missing_directory);
}

}  // namespace fontlist::app
