#include "core/engine_error.hpp"

#include <cstring>
#include <sstream>

namespace core {

const char* error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::None: return "None";
        case ErrorKind::MalformedValue: return "MalformedValue";
        case ErrorKind::InvalidSelector: return "InvalidSelector";
        case ErrorKind::StorageIO: return "StorageIO";
        case ErrorKind::CorruptAcceptedFile: return "CorruptAcceptedFile";
        case ErrorKind::CorruptPendingArtifact: return "CorruptPendingArtifact";
        case ErrorKind::UnknownPendingArtifact: return "UnknownPendingArtifact";
        case ErrorKind::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

std::string EngineError::describe() const {
    std::ostringstream oss;
    oss << error_kind_name(kind) << ": " << message;
    if (sys_errno != 0) {
        oss << " (" << std::strerror(sys_errno) << ")";
    }
    if (!path.empty()) {
        oss << " [path=" << path.string() << "]";
    }
    return oss.str();
}

} // namespace core
