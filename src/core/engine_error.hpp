#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace core {

enum class ErrorKind : std::uint8_t {
    None,
    MalformedValue,         // value tree violates what the chosen format requires
    InvalidSelector,        // redaction selector failed to parse
    StorageIO,              // read/write/rename/remove failure
    CorruptAcceptedFile,    // accepted snapshot header/body did not parse
    CorruptPendingArtifact, // pending artifact did not parse or checksum mismatch
    UnknownPendingArtifact, // review handle points at an artifact that no longer exists
    InvalidConfig           // configuration file, test locator or CLI argument error
};

const char* error_kind_name(ErrorKind kind) noexcept;

// Errors are returned through an out-parameter next to a bool/enum result.
// Nothing in the engine retries; the caller decides what to do with the kind.
struct EngineError {
    ErrorKind kind{ErrorKind::None};
    std::string message;
    std::filesystem::path path;
    int sys_errno{0};

    bool ok() const noexcept { return kind == ErrorKind::None; }

    void set(ErrorKind k, std::string msg, std::filesystem::path p = {}, int err_no = 0) {
        kind = k;
        message = std::move(msg);
        path = std::move(p);
        sys_errno = err_no;
    }

    void clear() noexcept {
        kind = ErrorKind::None;
        message.clear();
        path.clear();
        sys_errno = 0;
    }

    // "StorageIO: rename failed (No such file or directory) [path=/ws/snapshots/x.snap]"
    std::string describe() const;
};

} // namespace core
