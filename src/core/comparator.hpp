#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/line_diff.hpp"
#include "core/snapshot_records.hpp"

namespace core {

enum class VerdictKind : std::uint8_t { Pass, New, Mismatch };

const char* verdict_name(VerdictKind kind) noexcept;

struct Verdict {
    VerdictKind kind{VerdictKind::Pass};
    std::vector<DiffHunk> hunks; // Mismatch of a text format only

    bool is_pass() const noexcept { return kind == VerdictKind::Pass; }

    // Unified diff text of the hunks; empty unless Mismatch.
    std::string render_diff() const;
};

// Strict byte equality on canonical text. No trimming, no normalization.
// A Binary snapshot mismatch carries no hunks.
Verdict compare(std::string_view canonical, const std::optional<AcceptedSnapshot>& stored);

} // namespace core
