#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "core/engine_error.hpp"
#include "core/snapshot_records.hpp"

namespace persist {

inline constexpr std::string_view kAcceptedMagic = "# snapgate snapshot v1";

std::string encode_accepted(const core::AcceptedSnapshot& snap);
bool decode_accepted(std::string_view text, core::AcceptedSnapshot& out, std::string& err);

// Absence is not an error: returns true with `out` empty. A file that does
// not parse is CorruptAcceptedFile; an unreadable one StorageIO.
bool read_accepted(const std::filesystem::path& path,
                   std::optional<core::AcceptedSnapshot>& out,
                   core::EngineError& err);

// Atomic replace of the accepted file with `snap` as given.
bool write_accepted(const std::filesystem::path& path, const core::AcceptedSnapshot& snap, core::EngineError& err);

// Writes `snap` with its revision set to one past the file currently at
// `path` (1 if there is none). A corrupt existing file restarts at 1.
// Only promotion and force updates call this.
bool store_next_revision(const std::filesystem::path& path, core::AcceptedSnapshot snap, core::EngineError& err);

} // namespace persist
