#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <type_traits>

#include "core/comparator.hpp"
#include "core/engine_error.hpp"

namespace core {

enum class MismatchAction : std::uint8_t { Fail, Warn };
enum class PendingPersistence : std::uint8_t { Always, OnFailureOnly, Never };

// Run-mode behavior for snapshot assertions.
struct Policy {
    // Fail: a Mismatch verdict is reported to the caller as a failure.
    // Warn: a Mismatch is logged and the assertion passes.
    MismatchAction on_mismatch{MismatchAction::Fail};

    // When a pending artifact is written for New/Mismatch verdicts.
    PendingPersistence pending{PendingPersistence::OnFailureOnly};

    // Promote every New/Mismatch immediately; no pending artifact, no failure.
    // Bulk-update runs only.
    bool auto_accept{false};

    friend bool operator==(const Policy&, const Policy&) = default;
};

static_assert(std::is_trivially_copyable_v<Policy>, "Policy must be trivially copyable");

[[nodiscard]] inline constexpr Policy default_policy() noexcept {
    return Policy{};
}

struct EngineConfig {
    std::filesystem::path workspace_root;
    Policy policy{default_policy()};
};

// New always fails unless auto_accept; Mismatch fails under on_mismatch=Fail.
[[nodiscard]] bool is_failure(const Policy& policy, VerdictKind verdict) noexcept;

[[nodiscard]] bool should_persist_pending(const Policy& policy, VerdictKind verdict) noexcept;

[[nodiscard]] bool should_promote(const Policy& policy, VerdictKind verdict) noexcept;

const char* mismatch_action_name(MismatchAction a) noexcept;
const char* pending_persistence_name(PendingPersistence p) noexcept;

// "fail" | "warn"
std::optional<MismatchAction> mismatch_action_from_string(std::string_view s) noexcept;
// "always" | "on_failure" | "never"
std::optional<PendingPersistence> pending_persistence_from_string(std::string_view s) noexcept;

// Applies an update mode word on top of `policy`:
//   auto   - keep the pending setting
//   always - pending artifacts for every non-Pass verdict
//   no     - never write pending artifacts
//   force  - auto-accept
// Every word except force turns auto-accept off.
// Unknown words fail with InvalidConfig.
bool apply_update_mode(std::string_view mode, Policy& policy, EngineError& err);

} // namespace core
