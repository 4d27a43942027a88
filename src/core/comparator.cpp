#include "core/comparator.hpp"

namespace core {

const char* verdict_name(VerdictKind kind) noexcept {
    switch (kind) {
    case VerdictKind::Pass: return "pass";
    case VerdictKind::New: return "new";
    case VerdictKind::Mismatch: return "mismatch";
    }
    return "unknown";
}

std::string Verdict::render_diff() const {
    return render_unified(hunks);
}

Verdict compare(std::string_view canonical, const std::optional<AcceptedSnapshot>& stored) {
    Verdict v;
    if (!stored) {
        v.kind = VerdictKind::New;
        return v;
    }
    if (stored->body == canonical) {
        v.kind = VerdictKind::Pass;
        return v;
    }
    v.kind = VerdictKind::Mismatch;
    if (stored->format != Format::Binary) {
        v.hunks = diff_hunks(stored->body, canonical);
    }
    return v;
}

} // namespace core
