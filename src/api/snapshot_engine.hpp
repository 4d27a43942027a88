#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/canonical.hpp"
#include "core/comparator.hpp"
#include "core/engine_error.hpp"
#include "core/policy.hpp"
#include "core/redaction.hpp"
#include "core/snapshot_identity.hpp"
#include "core/snapshot_records.hpp"
#include "core/value.hpp"

namespace api {

struct AssertOptions {
    std::optional<std::string> explicit_name;
    core::Format format{core::Format::Json};
    std::vector<core::RedactionRule> rules;
    std::vector<std::string> csv_columns;
    std::optional<std::string> description;
    // Binary only: the accepted file is "<stem>.snap.<binary_extension>".
    std::string binary_extension{core::kDefaultBinaryExtension};
    // Reuse the ordinal of the previous unnamed assertion instead of
    // advancing; the assertion then targets the same snapshot file.
    bool allow_duplicates{false};
};

struct AssertOutcome {
    core::Verdict verdict;
    // Policy says the caller should report this assertion as failed.
    bool failed{false};
    std::string canonical;
    core::SnapshotIdentity identity;
    std::filesystem::path accepted_path;
    // Set when this assertion wrote a pending artifact.
    std::optional<std::filesystem::path> pending_path;
    // Set when the accepted snapshot was written (auto-accept or force update).
    bool promoted{false};
};

// Entry point for test adapters. One engine per test runner thread; it owns
// the ordinal counters for unnamed assertions.
//
// Returns false only for errors (EngineError filled in). New and Mismatch
// verdicts are ordinary results; `AssertOutcome::failed` carries the policy
// decision.
class SnapshotEngine {
public:
    explicit SnapshotEngine(core::EngineConfig config);

    const core::EngineConfig& config() const noexcept { return config_; }

    // Starts (or restarts, for retries) an invocation of `test`: its next
    // unnamed assertion is ordinal 1 again.
    void begin_invocation(const core::TestIdentity& test);

    bool assert_value(const core::Value& value,
                      const core::TestIdentity& test,
                      const AssertOptions& options,
                      AssertOutcome& out,
                      core::EngineError& err);

    // JSON text is parsed, then snapshotted in the Json format.
    bool assert_json_text(std::string_view json,
                          const core::TestIdentity& test,
                          AssertOptions options,
                          AssertOutcome& out,
                          core::EngineError& err);

    // CSV text (header row first) is parsed, then snapshotted in the Csv format.
    bool assert_csv_text(std::string_view csv,
                         const core::TestIdentity& test,
                         AssertOptions options,
                         AssertOutcome& out,
                         core::EngineError& err);

    // Plain text snapshot, stored verbatim.
    bool assert_text(std::string_view text,
                     const core::TestIdentity& test,
                     AssertOptions options,
                     AssertOutcome& out,
                     core::EngineError& err);

    // Raw bytes compared for equality only; a mismatch has no diff. Redaction
    // rules are rejected and `extension` must pass valid_binary_extension
    // (InvalidConfig otherwise).
    bool assert_binary(std::string_view bytes,
                       std::string_view extension,
                       const core::TestIdentity& test,
                       AssertOptions options,
                       AssertOutcome& out,
                       core::EngineError& err);

    // Writes the accepted snapshot unconditionally and removes any pending
    // artifact for it. Consumes an ordinal like an assertion. Neither call
    // consumes an ordinal when it fails with an error.
    bool force_update(const core::Value& value,
                      const core::TestIdentity& test,
                      const AssertOptions& options,
                      AssertOutcome& out,
                      core::EngineError& err);

    // Identity the next unnamed assertion of `test` would use (no counter change).
    core::SnapshotIdentity next_identity(const core::TestIdentity& test, const AssertOptions& options) const;
    // Identity of the most recent unnamed assertion of `test`.
    core::SnapshotIdentity last_identity(const core::TestIdentity& test, const AssertOptions& options) const;

    bool load_accepted(const core::SnapshotIdentity& identity,
                       std::optional<core::AcceptedSnapshot>& out,
                       core::EngineError& err) const;

private:
    core::SnapshotIdentity make_identity(const core::TestIdentity& test,
                                         const AssertOptions& options,
                                         std::uint32_t ordinal) const;
    std::uint32_t pick_ordinal(const core::TestIdentity& test, const AssertOptions& options) const;
    void commit_ordinal(const core::TestIdentity& test, const core::SnapshotIdentity& id);
    // Fills in `err.path` when the failing step did not; always returns false.
    bool fail_at(const std::filesystem::path& accepted_path, core::EngineError& err) const;
    bool render(const core::Value& value, const AssertOptions& options, std::string& out, core::EngineError& err) const;
    bool clear_stale_pending(const std::filesystem::path& pending_path, core::EngineError& err) const;
    core::AcceptedSnapshot make_accepted(const core::SnapshotIdentity& id,
                                         const AssertOptions& options,
                                         const std::string& body) const;

    core::EngineConfig config_;
    core::OrdinalCounter counters_;
};

} // namespace api
