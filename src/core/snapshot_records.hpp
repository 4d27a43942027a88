#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/canonical.hpp"
#include "core/snapshot_identity.hpp"

namespace core {

// Accepted snapshot as stored on disk: header metadata plus the canonical
// body verbatim.
struct AcceptedSnapshot {
    std::string source; // TestIdentity::key() of the test that produced it
    Format format{Format::Json};
    std::uint32_t revision{1};
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::string body;
};

// A proposed change awaiting review. `old_body` is absent when there was no
// accepted snapshot (a New verdict).
struct PendingArtifact {
    TestIdentity test;
    std::optional<std::string> name;
    std::uint32_t ordinal{1};
    Format format{Format::Json};
    std::optional<std::string> description;
    std::optional<std::string> old_body;
    std::string new_body;
    std::string diff;
};

} // namespace core
