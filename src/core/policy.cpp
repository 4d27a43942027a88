#include "core/policy.hpp"

#include <string>

namespace core {

bool is_failure(const Policy& policy, VerdictKind verdict) noexcept {
    if (policy.auto_accept) {
        return false;
    }
    switch (verdict) {
    case VerdictKind::Pass: return false;
    case VerdictKind::New: return true;
    case VerdictKind::Mismatch: return policy.on_mismatch == MismatchAction::Fail;
    }
    return true;
}

bool should_persist_pending(const Policy& policy, VerdictKind verdict) noexcept {
    if (verdict == VerdictKind::Pass || policy.auto_accept) {
        return false;
    }
    switch (policy.pending) {
    case PendingPersistence::Always: return true;
    case PendingPersistence::OnFailureOnly: return is_failure(policy, verdict);
    case PendingPersistence::Never: return false;
    }
    return false;
}

bool should_promote(const Policy& policy, VerdictKind verdict) noexcept {
    return policy.auto_accept && verdict != VerdictKind::Pass;
}

const char* mismatch_action_name(MismatchAction a) noexcept {
    switch (a) {
    case MismatchAction::Fail: return "fail";
    case MismatchAction::Warn: return "warn";
    }
    return "unknown";
}

const char* pending_persistence_name(PendingPersistence p) noexcept {
    switch (p) {
    case PendingPersistence::Always: return "always";
    case PendingPersistence::OnFailureOnly: return "on_failure";
    case PendingPersistence::Never: return "never";
    }
    return "unknown";
}

std::optional<MismatchAction> mismatch_action_from_string(std::string_view s) noexcept {
    if (s == "fail") return MismatchAction::Fail;
    if (s == "warn") return MismatchAction::Warn;
    return std::nullopt;
}

std::optional<PendingPersistence> pending_persistence_from_string(std::string_view s) noexcept {
    if (s == "always") return PendingPersistence::Always;
    if (s == "on_failure") return PendingPersistence::OnFailureOnly;
    if (s == "never") return PendingPersistence::Never;
    return std::nullopt;
}

bool apply_update_mode(std::string_view mode, Policy& policy, EngineError& err) {
    if (mode == "auto") {
        policy.auto_accept = false;
        return true;
    }
    if (mode == "always") {
        policy.pending = PendingPersistence::Always;
        policy.auto_accept = false;
        return true;
    }
    if (mode == "no") {
        policy.pending = PendingPersistence::Never;
        policy.auto_accept = false;
        return true;
    }
    if (mode == "force") {
        policy.auto_accept = true;
        return true;
    }
    err.set(ErrorKind::InvalidConfig,
            "Unknown update mode '" + std::string(mode) + "' (expected auto, always, no or force)");
    return false;
}

} // namespace core
