#include "persist/engine_config_file.hpp"

#include <string>

#include "core/json_reader.hpp"
#include "core/value.hpp"
#include "persist/atomic_file.hpp"

namespace persist {

bool parse_engine_config(std::string_view text,
                         const std::filesystem::path& base_dir,
                         core::EngineConfig& config,
                         core::EngineError& err) {
    core::Value root;
    std::string parse_err;
    if (!core::parse_json(text, root, parse_err)) {
        err.set(core::ErrorKind::InvalidConfig, "Config is not valid JSON: " + parse_err);
        return false;
    }
    if (!root.is_mapping()) {
        err.set(core::ErrorKind::InvalidConfig, "Config must be a JSON object");
        return false;
    }

    core::EngineConfig next = config;
    for (const auto& entry : root.as_mapping()) {
        const auto& key = entry.key;
        const auto& v = entry.value;
        if (key == "workspace_root") {
            if (!v.is_text() || v.as_text().empty()) {
                err.set(core::ErrorKind::InvalidConfig, "workspace_root must be a non-empty string");
                return false;
            }
            std::filesystem::path p(v.as_text());
            if (p.is_relative()) {
                p = base_dir / p;
            }
            next.workspace_root = p.lexically_normal();
        } else if (key == "on_mismatch") {
            const auto action = v.is_text() ? core::mismatch_action_from_string(v.as_text()) : std::nullopt;
            if (!action) {
                err.set(core::ErrorKind::InvalidConfig, "on_mismatch must be \"fail\" or \"warn\"");
                return false;
            }
            next.policy.on_mismatch = *action;
        } else if (key == "pending") {
            const auto mode = v.is_text() ? core::pending_persistence_from_string(v.as_text()) : std::nullopt;
            if (!mode) {
                err.set(core::ErrorKind::InvalidConfig, "pending must be \"always\", \"on_failure\" or \"never\"");
                return false;
            }
            next.policy.pending = *mode;
        } else if (key == "auto_accept") {
            if (!v.is_bool()) {
                err.set(core::ErrorKind::InvalidConfig, "auto_accept must be a boolean");
                return false;
            }
            next.policy.auto_accept = v.as_bool();
        } else {
            err.set(core::ErrorKind::InvalidConfig, "Unknown config field '" + key + "'");
            return false;
        }
    }
    config = std::move(next);
    return true;
}

bool load_engine_config(const std::filesystem::path& path, core::EngineConfig& config, core::EngineError& err) {
    std::string raw;
    switch (read_file(path, raw, err)) {
    case ReadStatus::NotFound:
        err.set(core::ErrorKind::InvalidConfig, "Config file not found", path);
        return false;
    case ReadStatus::Error:
        return false;
    case ReadStatus::Ok:
        break;
    }
    if (!parse_engine_config(raw, path.parent_path(), config, err)) {
        err.path = path;
        return false;
    }
    return true;
}

} // namespace persist
