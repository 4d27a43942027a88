#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/engine_error.hpp"
#include "core/snapshot_records.hpp"

namespace api {

enum class Decision : std::uint8_t { Accept, Reject, Skip };
enum class SessionState : std::uint8_t { Idle, Enumerated, Reviewing, Done };

const char* decision_name(Decision d) noexcept;
const char* session_state_name(SessionState s) noexcept;

struct ReviewOptions {
    std::filesystem::path root;
    // Glob ('*', '?') over the pending file name, or over the path relative
    // to `root` when it contains '/'. Empty means every pending artifact.
    std::string name_filter;
};

struct PendingHandle {
    std::filesystem::path pending_path;
    std::filesystem::path accepted_path;
    std::string relative; // pending path relative to the review root, '/' separated
};

struct ReviewCounts {
    std::size_t accepted{0};
    std::size_t rejected{0};
    std::size_t skipped{0};
};

// Walks the pending artifacts under a root and applies one decision per
// item. Each decision is final when decide() returns; stopping midway leaves
// undecided items pending for a later session.
//
//   Idle -> enumerate() -> Enumerated -> next() -> Reviewing -> decide()
//        -> Enumerated -> ... -> next() == nullptr -> Done
class ReviewSession {
public:
    explicit ReviewSession(ReviewOptions options);

    // Scans the root (sorted, restartable). Resets the cursor and counts.
    bool enumerate(core::EngineError& err);

    // Next item to review, or nullptr once the list is exhausted (Done).
    const PendingHandle* next();

    bool load(const PendingHandle& handle, core::PendingArtifact& out, core::EngineError& err) const;

    // Accept promotes the new body and removes the artifact, Reject removes it,
    // Skip leaves it untouched. A handle whose file has disappeared is
    // UnknownPendingArtifact for every decision.
    bool decide(const PendingHandle& handle, Decision decision, core::EngineError& err);

    SessionState state() const noexcept { return state_; }
    const ReviewCounts& counts() const noexcept { return counts_; }
    const std::vector<PendingHandle>& items() const noexcept { return items_; }

private:
    ReviewOptions options_;
    std::vector<PendingHandle> items_;
    std::size_t cursor_{0};
    SessionState state_{SessionState::Idle};
    ReviewCounts counts_{};
};

// Sorted list of pending artifacts under `options.root`. Missing root is
// StorageIO.
bool list_pending(const ReviewOptions& options, std::vector<PendingHandle>& out, core::EngineError& err);

} // namespace api
