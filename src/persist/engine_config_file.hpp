#pragma once

#include <filesystem>
#include <string_view>

#include "core/engine_error.hpp"
#include "core/policy.hpp"

namespace persist {

inline constexpr std::string_view kDefaultConfigFileName = "snapgate.json";

// Reads a JSON configuration file onto `config`:
//
//   {"workspace_root": "..", "on_mismatch": "warn",
//    "pending": "always", "auto_accept": false}
//
// Every field is optional; fields not present leave `config` unchanged.
// Unknown fields and wrong value types are InvalidConfig. A relative
// workspace_root is resolved against the file's directory. On failure
// `config` is untouched.
bool load_engine_config(const std::filesystem::path& path, core::EngineConfig& config, core::EngineError& err);

// Same, from text already in memory; `base_dir` resolves relative roots.
bool parse_engine_config(std::string_view text,
                         const std::filesystem::path& base_dir,
                         core::EngineConfig& config,
                         core::EngineError& err);

} // namespace persist
