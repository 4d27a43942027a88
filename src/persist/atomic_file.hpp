#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "core/engine_error.hpp"

namespace persist {

struct IoResult {
    bool ok{false};
    int error_code{0};
};

enum class ReadStatus : std::uint8_t { Ok, NotFound, Error };
enum class RemoveStatus : std::uint8_t { Removed, NotFound, Error };

// Replaces `target` with `data` so that readers see either the old file or
// the complete new one: the bytes go to a temp file in the same directory,
// which is fsynced and renamed over the target, then the directory is
// fsynced. Missing parent directories are created. On failure the target is
// untouched and the temp file removed.
bool atomic_write(const std::filesystem::path& target, std::string_view data, core::EngineError& err);

// Whole-file read. A missing file is NotFound and leaves `err` clear.
ReadStatus read_file(const std::filesystem::path& path, std::string& out, core::EngineError& err);

// Unlinks `path` and syncs its directory. A missing file is NotFound.
RemoveStatus remove_file(const std::filesystem::path& path, core::EngineError& err);

bool file_exists(const std::filesystem::path& path) noexcept;

// Temp file name used by atomic_write; exposed so directory scans can skip them.
bool is_temp_name(std::string_view filename) noexcept;

} // namespace persist
