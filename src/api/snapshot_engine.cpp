#include "api/snapshot_engine.hpp"

#include <utility>

#include "core/csv_reader.hpp"
#include "core/json_reader.hpp"
#include "persist/atomic_file.hpp"
#include "persist/pending_artifact.hpp"
#include "persist/snapshot_store.hpp"
#include "util/log.hpp"

namespace api {

SnapshotEngine::SnapshotEngine(core::EngineConfig config) : config_(std::move(config)) {}

void SnapshotEngine::begin_invocation(const core::TestIdentity& test) {
    counters_.reset(test.key());
}

core::SnapshotIdentity SnapshotEngine::make_identity(const core::TestIdentity& test,
                                                     const AssertOptions& options,
                                                     std::uint32_t ordinal) const {
    core::SnapshotIdentity id;
    id.workspace_root = config_.workspace_root;
    id.module_dir = test.module_dir;
    id.module_id = test.module_id;
    id.test_name = test.test_name;
    id.explicit_name = options.explicit_name;
    id.ordinal = options.explicit_name ? 1 : ordinal;
    id.extension = core::extension_for(options.format, options.binary_extension);
    return id;
}

std::uint32_t SnapshotEngine::pick_ordinal(const core::TestIdentity& test, const AssertOptions& options) const {
    // Named snapshots do not take part in numbering.
    if (options.explicit_name) {
        return 1;
    }
    const auto key = test.key();
    if (options.allow_duplicates && counters_.peek_next(key) > 1) {
        return counters_.peek_last(key);
    }
    return counters_.peek_next(key);
}

// Only assertions that ran to completion take a number; an error leaves the
// counter where it was so later file names do not shift.
void SnapshotEngine::commit_ordinal(const core::TestIdentity& test, const core::SnapshotIdentity& id) {
    if (id.explicit_name) {
        return;
    }
    const auto key = test.key();
    if (id.ordinal == counters_.peek_next(key)) {
        counters_.next(key);
    }
}

bool SnapshotEngine::fail_at(const std::filesystem::path& accepted_path, core::EngineError& err) const {
    if (err.path.empty()) {
        err.path = accepted_path;
    }
    return false;
}

core::SnapshotIdentity SnapshotEngine::next_identity(const core::TestIdentity& test,
                                                     const AssertOptions& options) const {
    return make_identity(test, options, counters_.peek_next(test.key()));
}

core::SnapshotIdentity SnapshotEngine::last_identity(const core::TestIdentity& test,
                                                     const AssertOptions& options) const {
    return make_identity(test, options, counters_.peek_last(test.key()));
}

bool SnapshotEngine::render(const core::Value& value,
                            const AssertOptions& options,
                            std::string& out,
                            core::EngineError& err) const {
    const core::Value redacted = core::redact(value, options.rules);
    core::CanonicalOptions canon;
    canon.csv_columns = options.csv_columns;
    return core::canonicalize(redacted, options.format, out, err, canon);
}

bool SnapshotEngine::clear_stale_pending(const std::filesystem::path& pending_path, core::EngineError& err) const {
    switch (persist::remove_file(pending_path, err)) {
    case persist::RemoveStatus::Removed:
        SNAPGATE_LOG_WARN("removed stale pending snapshot %s", pending_path.c_str());
        return true;
    case persist::RemoveStatus::NotFound:
        return true;
    case persist::RemoveStatus::Error:
        return false;
    }
    return false;
}

core::AcceptedSnapshot SnapshotEngine::make_accepted(const core::SnapshotIdentity& id,
                                                     const AssertOptions& options,
                                                     const std::string& body) const {
    core::AcceptedSnapshot snap;
    snap.source = id.test().key();
    snap.format = options.format;
    snap.name = options.explicit_name;
    snap.description = options.description;
    snap.body = body;
    return snap;
}

bool SnapshotEngine::assert_value(const core::Value& value,
                                  const core::TestIdentity& test,
                                  const AssertOptions& options,
                                  AssertOutcome& out,
                                  core::EngineError& err) {
    AssertOutcome result;
    result.identity = make_identity(test, options, pick_ordinal(test, options));
    result.accepted_path = core::resolve_snapshot_path(result.identity);
    const auto pending_path = core::pending_path_for(result.accepted_path);

    if (!render(value, options, result.canonical, err)) {
        return fail_at(result.accepted_path, err);
    }

    std::optional<core::AcceptedSnapshot> stored;
    if (!persist::read_accepted(result.accepted_path, stored, err)) {
        return fail_at(result.accepted_path, err);
    }

    result.verdict = core::compare(result.canonical, stored);
    const auto kind = result.verdict.kind;
    const auto& policy = config_.policy;
    result.failed = core::is_failure(policy, kind);
    SNAPGATE_LOG_DEBUG("%s: %s", result.accepted_path.c_str(), core::verdict_name(kind));

    if (kind == core::VerdictKind::Pass) {
        if (!clear_stale_pending(pending_path, err)) {
            return fail_at(result.accepted_path, err);
        }
    } else if (core::should_promote(policy, kind)) {
        if (!persist::store_next_revision(result.accepted_path, make_accepted(result.identity, options, result.canonical), err) ||
            !clear_stale_pending(pending_path, err)) {
            return fail_at(result.accepted_path, err);
        }
        result.promoted = true;
    } else if (core::should_persist_pending(policy, kind)) {
        core::PendingArtifact artifact;
        artifact.test = test;
        artifact.name = options.explicit_name;
        artifact.ordinal = result.identity.ordinal;
        artifact.format = options.format;
        artifact.description = options.description;
        if (stored) {
            artifact.old_body = stored->body;
        }
        artifact.new_body = result.canonical;
        artifact.diff = result.verdict.render_diff();
        if (!persist::write_pending(pending_path, artifact, err)) {
            return fail_at(result.accepted_path, err);
        }
        result.pending_path = pending_path;
    }
    commit_ordinal(test, result.identity);

    if (kind == core::VerdictKind::Mismatch && !result.failed && !result.promoted) {
        SNAPGATE_LOG_WARN("snapshot mismatch tolerated by policy: %s", result.accepted_path.c_str());
    }
    out = std::move(result);
    return true;
}

bool SnapshotEngine::assert_json_text(std::string_view json,
                                      const core::TestIdentity& test,
                                      AssertOptions options,
                                      AssertOutcome& out,
                                      core::EngineError& err) {
    options.format = core::Format::Json;
    core::Value value;
    std::string parse_err;
    if (!core::parse_json(json, value, parse_err)) {
        err.set(core::ErrorKind::MalformedValue, "Input is not valid JSON: " + parse_err);
        return fail_at(core::resolve_snapshot_path(make_identity(test, options, pick_ordinal(test, options))), err);
    }
    return assert_value(value, test, options, out, err);
}

bool SnapshotEngine::assert_csv_text(std::string_view csv,
                                     const core::TestIdentity& test,
                                     AssertOptions options,
                                     AssertOutcome& out,
                                     core::EngineError& err) {
    options.format = core::Format::Csv;
    core::Value value;
    std::string parse_err;
    if (!core::parse_csv(csv, value, parse_err)) {
        err.set(core::ErrorKind::MalformedValue, "Input is not valid CSV: " + parse_err);
        return fail_at(core::resolve_snapshot_path(make_identity(test, options, pick_ordinal(test, options))), err);
    }
    return assert_value(value, test, options, out, err);
}

bool SnapshotEngine::assert_text(std::string_view text,
                                 const core::TestIdentity& test,
                                 AssertOptions options,
                                 AssertOutcome& out,
                                 core::EngineError& err) {
    options.format = core::Format::Text;
    return assert_value(core::Value::from_text(std::string(text)), test, options, out, err);
}

bool SnapshotEngine::assert_binary(std::string_view bytes,
                                   std::string_view extension,
                                   const core::TestIdentity& test,
                                   AssertOptions options,
                                   AssertOutcome& out,
                                   core::EngineError& err) {
    if (!core::valid_binary_extension(extension)) {
        err.set(core::ErrorKind::InvalidConfig, "Invalid binary snapshot extension '" + std::string(extension) + "'");
        return false;
    }
    if (!options.rules.empty()) {
        err.set(core::ErrorKind::InvalidConfig, "Redaction rules do not apply to binary snapshots");
        return false;
    }
    options.format = core::Format::Binary;
    options.binary_extension = std::string(extension);
    return assert_value(core::Value::from_text(std::string(bytes)), test, options, out, err);
}

bool SnapshotEngine::force_update(const core::Value& value,
                                  const core::TestIdentity& test,
                                  const AssertOptions& options,
                                  AssertOutcome& out,
                                  core::EngineError& err) {
    AssertOutcome result;
    result.identity = make_identity(test, options, pick_ordinal(test, options));
    result.accepted_path = core::resolve_snapshot_path(result.identity);
    if (!render(value, options, result.canonical, err)) {
        return fail_at(result.accepted_path, err);
    }

    std::optional<core::AcceptedSnapshot> stored;
    core::EngineError read_err;
    if (persist::read_accepted(result.accepted_path, stored, read_err)) {
        result.verdict = core::compare(result.canonical, stored);
    } else if (read_err.kind == core::ErrorKind::CorruptAcceptedFile) {
        result.verdict.kind = core::VerdictKind::Mismatch;
    } else {
        err = std::move(read_err);
        return fail_at(result.accepted_path, err);
    }

    if (!persist::store_next_revision(result.accepted_path, make_accepted(result.identity, options, result.canonical), err) ||
        !clear_stale_pending(core::pending_path_for(result.accepted_path), err)) {
        return fail_at(result.accepted_path, err);
    }
    commit_ordinal(test, result.identity);
    result.promoted = true;
    out = std::move(result);
    return true;
}

bool SnapshotEngine::load_accepted(const core::SnapshotIdentity& identity,
                                   std::optional<core::AcceptedSnapshot>& out,
                                   core::EngineError& err) const {
    return persist::read_accepted(core::resolve_snapshot_path(identity), out, err);
}

} // namespace api
