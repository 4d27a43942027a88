#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "core/engine_error.hpp"
#include "core/snapshot_records.hpp"

namespace persist {

inline constexpr std::string_view kPendingMagic = "# snapgate pending v1";

// Header plus length-prefixed sections:
//
//   # snapgate pending v1
//   # source: ...          (identity, ordinal, format, ...)
//   # old: <bytes>|absent
//   # new: <bytes>
//   # diff: <bytes>
//   # checksum: <crc32c of old+new+diff>
//
//   --- old                (omitted when absent)
//   <old bytes>
//   --- new
//   <new bytes>
//   --- diff
//   <diff bytes>
//
// Each section body is followed by a single '\n'. Bodies are never scanned
// for markers, so any content round-trips.
std::string encode_pending(const core::PendingArtifact& artifact);
bool decode_pending(std::string_view text, core::PendingArtifact& out, std::string& err);

// Atomically replaces any artifact already at `pending_path`.
bool write_pending(const std::filesystem::path& pending_path,
                   const core::PendingArtifact& artifact,
                   core::EngineError& err);

// Missing file: UnknownPendingArtifact. Parse or checksum failure:
// CorruptPendingArtifact.
bool read_pending(const std::filesystem::path& pending_path, core::PendingArtifact& out, core::EngineError& err);

// Writes the artifact's new body as the next revision of the accepted
// snapshot next to it, then deletes the pending file.
bool promote_pending(const std::filesystem::path& pending_path,
                     const core::PendingArtifact& artifact,
                     core::EngineError& err);

// Deletes the pending file without promotion. Missing file:
// UnknownPendingArtifact.
bool discard_pending(const std::filesystem::path& pending_path, core::EngineError& err);

} // namespace persist
