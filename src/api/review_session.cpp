#include "api/review_session.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include "core/snapshot_identity.hpp"
#include "persist/atomic_file.hpp"
#include "persist/pending_artifact.hpp"
#include "util/glob.hpp"
#include "util/log.hpp"

namespace api {
namespace {

bool ends_with(std::string_view s, std::string_view suffix) noexcept {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool matches_filter(const std::string& filter, const std::string& relative) noexcept {
    return filter.empty() || util::path_glob_match(filter, relative);
}

} // namespace

const char* decision_name(Decision d) noexcept {
    switch (d) {
    case Decision::Accept: return "accept";
    case Decision::Reject: return "reject";
    case Decision::Skip: return "skip";
    }
    return "unknown";
}

const char* session_state_name(SessionState s) noexcept {
    switch (s) {
    case SessionState::Idle: return "idle";
    case SessionState::Enumerated: return "enumerated";
    case SessionState::Reviewing: return "reviewing";
    case SessionState::Done: return "done";
    }
    return "unknown";
}

bool list_pending(const ReviewOptions& options, std::vector<PendingHandle>& out, core::EngineError& err) {
    std::error_code ec;
    if (!std::filesystem::is_directory(options.root, ec)) {
        err.set(core::ErrorKind::StorageIO, "Review root is not a directory", options.root, ec.value());
        return false;
    }
    std::vector<PendingHandle> found;
    auto it = std::filesystem::recursive_directory_iterator(
        options.root, std::filesystem::directory_options::skip_permission_denied, ec);
    for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        const auto& path = it->path();
        const std::string filename = path.filename().string();
        if (!ends_with(filename, core::kPendingSuffix) || persist::is_temp_name(filename)) {
            continue;
        }
        const auto accepted = core::accepted_path_for(path);
        if (!accepted) {
            continue;
        }
        PendingHandle h;
        h.pending_path = path;
        h.accepted_path = *accepted;
        h.relative = std::filesystem::relative(path, options.root, ec).lexically_normal().generic_string();
        if (ec) {
            h.relative = path.generic_string();
            ec.clear();
        }
        if (matches_filter(options.name_filter, h.relative)) {
            found.push_back(std::move(h));
        }
    }
    if (ec) {
        err.set(core::ErrorKind::StorageIO, "Failed to scan review root: " + ec.message(), options.root, ec.value());
        return false;
    }
    std::sort(found.begin(), found.end(), [](const PendingHandle& a, const PendingHandle& b) {
        return a.relative < b.relative;
    });
    out = std::move(found);
    return true;
}

ReviewSession::ReviewSession(ReviewOptions options) : options_(std::move(options)) {}

bool ReviewSession::enumerate(core::EngineError& err) {
    std::vector<PendingHandle> items;
    if (!list_pending(options_, items, err)) {
        return false;
    }
    items_ = std::move(items);
    cursor_ = 0;
    counts_ = ReviewCounts{};
    state_ = SessionState::Enumerated;
    SNAPGATE_LOG_DEBUG("review: %zu pending under %s", items_.size(), options_.root.c_str());
    return true;
}

const PendingHandle* ReviewSession::next() {
    if (state_ == SessionState::Idle) {
        return nullptr;
    }
    if (cursor_ >= items_.size()) {
        state_ = SessionState::Done;
        return nullptr;
    }
    state_ = SessionState::Reviewing;
    return &items_[cursor_++];
}

bool ReviewSession::load(const PendingHandle& handle, core::PendingArtifact& out, core::EngineError& err) const {
    return persist::read_pending(handle.pending_path, out, err);
}

bool ReviewSession::decide(const PendingHandle& handle, Decision decision, core::EngineError& err) {
    switch (decision) {
    case Decision::Accept: {
        core::PendingArtifact artifact;
        if (!persist::read_pending(handle.pending_path, artifact, err) ||
            !persist::promote_pending(handle.pending_path, artifact, err)) {
            return false;
        }
        ++counts_.accepted;
        break;
    }
    case Decision::Reject:
        if (!persist::discard_pending(handle.pending_path, err)) {
            return false;
        }
        ++counts_.rejected;
        break;
    case Decision::Skip:
        if (!persist::file_exists(handle.pending_path)) {
            err.set(core::ErrorKind::UnknownPendingArtifact, "Pending artifact no longer exists", handle.pending_path);
            return false;
        }
        ++counts_.skipped;
        break;
    }
    SNAPGATE_LOG_DEBUG("review: %s %s", decision_name(decision), handle.relative.c_str());
    if (state_ == SessionState::Reviewing) {
        state_ = SessionState::Enumerated;
    }
    return true;
}

} // namespace api
