#include <gtest/gtest.h>

#include <cmath>
#include <optional>
#include <string>
#include <vector>

#include "api/snapshot_engine.hpp"
#include "harness/temp_workspace.hpp"
#include "persist/atomic_file.hpp"
#include "persist/pending_artifact.hpp"
#include "persist/snapshot_store.hpp"

namespace {

using core::Value;
using core::VerdictKind;

const core::TestIdentity kTest{"tests/unit", "test_parser", "test_roundtrip"};

core::EngineConfig config_for(const harness::TempWorkspace& ws, core::Policy policy = core::default_policy()) {
    core::EngineConfig cfg;
    cfg.workspace_root = ws.root();
    cfg.policy = policy;
    return cfg;
}

Value one_key(const std::string& key, Value v) {
    Value out;
    out.set(key, std::move(v));
    return out;
}

api::AssertOutcome check(api::SnapshotEngine& engine,
                         const Value& v,
                         const api::AssertOptions& opts = {},
                         const core::TestIdentity& test = kTest) {
    api::AssertOutcome out;
    core::EngineError err;
    EXPECT_TRUE(engine.assert_value(v, test, opts, out, err)) << err.describe();
    return out;
}

std::filesystem::path accepted_at(const harness::TempWorkspace& ws, const std::string& file) {
    return ws.root() / "tests" / "unit" / "snapshots" / file;
}

core::AcceptedSnapshot accepted_body(const std::string& body) {
    core::AcceptedSnapshot snap;
    snap.source = kTest.key();
    snap.body = body;
    return snap;
}

TEST(SnapshotEngineTest, FirstAssertionIsNewAndOnlyWritesPending) {
    harness::TempWorkspace ws("engine_new");
    api::SnapshotEngine engine(config_for(ws));
    const auto out = check(engine, one_key("hello", Value::from_text("world")));

    EXPECT_EQ(out.verdict.kind, VerdictKind::New);
    EXPECT_TRUE(out.failed);
    EXPECT_FALSE(out.promoted);
    EXPECT_EQ(out.accepted_path, accepted_at(ws, "test_parser__test_roundtrip.snap"));
    EXPECT_FALSE(persist::file_exists(out.accepted_path));
    ASSERT_TRUE(out.pending_path.has_value());

    core::PendingArtifact artifact;
    core::EngineError err;
    ASSERT_TRUE(persist::read_pending(*out.pending_path, artifact, err)) << err.describe();
    EXPECT_FALSE(artifact.old_body.has_value());
    EXPECT_EQ(artifact.new_body, "{\n  \"hello\": \"world\"\n}");
    EXPECT_EQ(artifact.test, kTest);
    EXPECT_EQ(artifact.ordinal, 1u);
}

TEST(SnapshotEngineTest, MatchingSnapshotPassesWithoutWriting) {
    harness::TempWorkspace ws("engine_pass");
    const auto path = accepted_at(ws, "test_parser__test_roundtrip.snap");
    core::EngineError err;
    ASSERT_TRUE(persist::write_accepted(path, accepted_body("{\n  \"hello\": \"world\"\n}"), err));
    const auto before = harness::read_text(path);

    api::SnapshotEngine engine(config_for(ws));
    const auto out = check(engine, one_key("hello", Value::from_text("world")));
    EXPECT_TRUE(out.verdict.is_pass());
    EXPECT_FALSE(out.failed);
    EXPECT_FALSE(out.pending_path.has_value());
    EXPECT_EQ(harness::read_text(path), before);
    EXPECT_EQ(harness::list_files(ws.root()),
              (std::vector<std::string>{"tests/unit/snapshots/test_parser__test_roundtrip.snap"}));
}

TEST(SnapshotEngineTest, MismatchDiffsAndLeavesAcceptedUntouched) {
    harness::TempWorkspace ws("engine_mismatch");
    const auto path = accepted_at(ws, "test_parser__test_roundtrip.snap");
    core::EngineError err;
    ASSERT_TRUE(persist::write_accepted(path, accepted_body("{\n  \"a\": 1\n}"), err));
    const auto before = harness::read_text(path);

    api::SnapshotEngine engine(config_for(ws));
    const auto out = check(engine, one_key("a", Value::from_int(2)));
    EXPECT_EQ(out.verdict.kind, VerdictKind::Mismatch);
    EXPECT_TRUE(out.failed);
    ASSERT_EQ(out.verdict.hunks.size(), 1u);
    const std::vector<core::DiffLine> expected{
        {core::DiffOp::Context, "{"},
        {core::DiffOp::Removed, "  \"a\": 1"},
        {core::DiffOp::Added, "  \"a\": 2"},
        {core::DiffOp::Context, "}"},
    };
    EXPECT_EQ(out.verdict.hunks[0].lines, expected);
    EXPECT_EQ(harness::read_text(path), before);

    ASSERT_TRUE(out.pending_path.has_value());
    core::PendingArtifact artifact;
    ASSERT_TRUE(persist::read_pending(*out.pending_path, artifact, err)) << err.describe();
    EXPECT_EQ(artifact.old_body, std::optional<std::string>("{\n  \"a\": 1\n}"));
    EXPECT_EQ(artifact.diff, out.verdict.render_diff());
}

TEST(SnapshotEngineTest, AcceptedPendingPassesOnNextRun) {
    harness::TempWorkspace ws("engine_roundtrip");
    const auto value = one_key("items", Value::from_sequence({Value::from_int(1), Value::from_float(2.5)}));
    core::EngineError err;

    api::SnapshotEngine first(config_for(ws));
    const auto out = check(first, value);
    ASSERT_TRUE(out.pending_path.has_value());
    core::PendingArtifact artifact;
    ASSERT_TRUE(persist::read_pending(*out.pending_path, artifact, err));
    ASSERT_TRUE(persist::promote_pending(*out.pending_path, artifact, err)) << err.describe();

    api::SnapshotEngine second(config_for(ws));
    const auto again = check(second, value);
    EXPECT_TRUE(again.verdict.is_pass());
    EXPECT_EQ(harness::list_files(ws.root()),
              (std::vector<std::string>{"tests/unit/snapshots/test_parser__test_roundtrip.snap"}));
}

TEST(SnapshotEngineTest, RedactedVolatileFieldKeepsPassing) {
    harness::TempWorkspace ws("engine_redact");
    api::AssertOptions opts;
    core::RedactionRule rule;
    core::EngineError err;
    ASSERT_TRUE(core::make_rule(".timestamp", core::RedactionAction::replace_with(Value::from_text("[ts]")), rule, err));
    opts.rules.push_back(rule);

    auto make = [](const std::string& ts) {
        Value v;
        v.set("timestamp", Value::from_text(ts));
        v.set("v", Value::from_int(1));
        return v;
    };

    core::Policy accept_all;
    accept_all.auto_accept = true;
    api::SnapshotEngine recorder(config_for(ws, accept_all));
    const auto recorded = check(recorder, make("2024-01-01T00:00:00Z"), opts);
    EXPECT_TRUE(recorded.promoted);
    EXPECT_NE(recorded.canonical.find("\"timestamp\": \"[ts]\""), std::string::npos);

    api::SnapshotEngine engine(config_for(ws));
    EXPECT_TRUE(check(engine, make("2025-06-30T12:34:56Z"), opts).verdict.is_pass());
}

TEST(SnapshotEngineTest, UnnamedAssertionsAreNumberedPerTest) {
    harness::TempWorkspace ws("engine_ordinals");
    api::SnapshotEngine engine(config_for(ws));
    const auto v = Value::from_int(1);

    EXPECT_EQ(check(engine, v).accepted_path.filename(), "test_parser__test_roundtrip.snap");
    EXPECT_EQ(check(engine, v).accepted_path.filename(), "test_parser__test_roundtrip-2.snap");

    // Named snapshots neither use nor advance the counter.
    api::AssertOptions named;
    named.explicit_name = "response";
    const auto n = check(engine, v, named);
    EXPECT_EQ(n.accepted_path.filename(), "test_parser__test_roundtrip__response.snap");
    EXPECT_EQ(n.identity.ordinal, 1u);

    EXPECT_EQ(check(engine, v).accepted_path.filename(), "test_parser__test_roundtrip-3.snap");

    // Another test has its own counter.
    const core::TestIdentity other{"tests/unit", "test_parser", "test_other"};
    EXPECT_EQ(check(engine, v, {}, other).accepted_path.filename(), "test_parser__test_other.snap");
}

TEST(SnapshotEngineTest, RetriedInvocationRestartsNumbering) {
    harness::TempWorkspace ws("engine_retry");
    api::SnapshotEngine engine(config_for(ws));
    const auto v = Value::from_int(1);
    engine.begin_invocation(kTest);
    check(engine, v);
    check(engine, v);
    EXPECT_EQ(engine.next_identity(kTest, {}).ordinal, 3u);

    engine.begin_invocation(kTest);
    EXPECT_EQ(engine.next_identity(kTest, {}).ordinal, 1u);
    EXPECT_EQ(check(engine, v).identity.ordinal, 1u);
}

TEST(SnapshotEngineTest, AllowDuplicatesTargetsThePreviousSnapshot) {
    harness::TempWorkspace ws("engine_duplicates");
    api::SnapshotEngine engine(config_for(ws));
    api::AssertOptions dup;
    dup.allow_duplicates = true;

    // Nothing claimed yet: the first ordinal is taken normally.
    EXPECT_EQ(check(engine, Value::from_int(1), dup).identity.ordinal, 1u);
    EXPECT_EQ(check(engine, Value::from_int(1), dup).identity.ordinal, 1u);
    EXPECT_EQ(check(engine, Value::from_int(1)).identity.ordinal, 2u);
    EXPECT_EQ(check(engine, Value::from_int(1), dup).identity.ordinal, 2u);
    EXPECT_EQ(engine.last_identity(kTest, {}).ordinal, 2u);
}

TEST(SnapshotEngineTest, WarnPolicyToleratesMismatchButNotNew) {
    harness::TempWorkspace ws("engine_warn");
    const auto path = accepted_at(ws, "test_parser__test_roundtrip.snap");
    core::EngineError err;
    ASSERT_TRUE(persist::write_accepted(path, accepted_body("1"), err));

    core::Policy warn;
    warn.on_mismatch = core::MismatchAction::Warn;
    api::SnapshotEngine engine(config_for(ws, warn));
    const auto mismatch = check(engine, Value::from_int(2));
    EXPECT_EQ(mismatch.verdict.kind, VerdictKind::Mismatch);
    EXPECT_FALSE(mismatch.failed);
    EXPECT_FALSE(mismatch.pending_path.has_value());

    const auto fresh = check(engine, Value::from_int(2));
    EXPECT_EQ(fresh.verdict.kind, VerdictKind::New);
    EXPECT_TRUE(fresh.failed);
}

TEST(SnapshotEngineTest, PendingAlwaysRecordsToleratedMismatch) {
    harness::TempWorkspace ws("engine_pending_always");
    const auto path = accepted_at(ws, "test_parser__test_roundtrip.snap");
    core::EngineError err;
    ASSERT_TRUE(persist::write_accepted(path, accepted_body("1"), err));

    core::Policy policy;
    policy.on_mismatch = core::MismatchAction::Warn;
    policy.pending = core::PendingPersistence::Always;
    api::SnapshotEngine engine(config_for(ws, policy));
    const auto out = check(engine, Value::from_int(2));
    EXPECT_FALSE(out.failed);
    ASSERT_TRUE(out.pending_path.has_value());
    EXPECT_TRUE(persist::file_exists(*out.pending_path));
}

TEST(SnapshotEngineTest, PendingNeverFailsWithoutArtifacts) {
    harness::TempWorkspace ws("engine_pending_never");
    core::Policy policy;
    policy.pending = core::PendingPersistence::Never;
    api::SnapshotEngine engine(config_for(ws, policy));
    const auto out = check(engine, Value::from_int(1));
    EXPECT_EQ(out.verdict.kind, VerdictKind::New);
    EXPECT_TRUE(out.failed);
    EXPECT_FALSE(out.pending_path.has_value());
    EXPECT_TRUE(harness::list_files(ws.root()).empty());
}

TEST(SnapshotEngineTest, AutoAcceptPromotesWithRevisions) {
    harness::TempWorkspace ws("engine_auto_accept");
    core::Policy policy;
    policy.auto_accept = true;
    api::AssertOptions opts;
    opts.description = "parser output";
    core::EngineError err;

    api::SnapshotEngine engine(config_for(ws, policy));
    const auto first = check(engine, Value::from_int(1), opts);
    EXPECT_EQ(first.verdict.kind, VerdictKind::New);
    EXPECT_FALSE(first.failed);
    EXPECT_TRUE(first.promoted);
    EXPECT_FALSE(first.pending_path.has_value());

    engine.begin_invocation(kTest);
    const auto second = check(engine, Value::from_int(2), opts);
    EXPECT_EQ(second.verdict.kind, VerdictKind::Mismatch);
    EXPECT_TRUE(second.promoted);

    std::optional<core::AcceptedSnapshot> stored;
    ASSERT_TRUE(engine.load_accepted(second.identity, stored, err)) << err.describe();
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->revision, 2u);
    EXPECT_EQ(stored->body, "2");
    EXPECT_EQ(stored->description, std::optional<std::string>("parser output"));
    EXPECT_EQ(harness::list_files(ws.root()).size(), 1u);
}

TEST(SnapshotEngineTest, ForceUpdateOverwritesAndClearsPending) {
    harness::TempWorkspace ws("engine_force");
    api::SnapshotEngine engine(config_for(ws));
    const auto out = check(engine, Value::from_int(1));
    ASSERT_TRUE(out.pending_path.has_value());

    engine.begin_invocation(kTest);
    api::AssertOutcome forced;
    core::EngineError err;
    ASSERT_TRUE(engine.force_update(Value::from_int(7), kTest, {}, forced, err)) << err.describe();
    EXPECT_TRUE(forced.promoted);
    EXPECT_EQ(forced.verdict.kind, VerdictKind::New);
    EXPECT_FALSE(persist::file_exists(*out.pending_path));

    std::optional<core::AcceptedSnapshot> stored;
    ASSERT_TRUE(persist::read_accepted(forced.accepted_path, stored, err));
    EXPECT_EQ(stored->body, "7");
    EXPECT_EQ(stored->revision, 1u);
}

TEST(SnapshotEngineTest, PassRemovesStalePending) {
    harness::TempWorkspace ws("engine_stale");
    const auto path = accepted_at(ws, "test_parser__test_roundtrip.snap");
    core::EngineError err;
    ASSERT_TRUE(persist::write_accepted(path, accepted_body("1"), err));

    api::SnapshotEngine engine(config_for(ws));
    const auto mismatch = check(engine, Value::from_int(2));
    ASSERT_TRUE(mismatch.pending_path.has_value());

    engine.begin_invocation(kTest);
    const auto pass = check(engine, Value::from_int(1));
    EXPECT_TRUE(pass.verdict.is_pass());
    EXPECT_FALSE(persist::file_exists(*mismatch.pending_path));
}

TEST(SnapshotEngineTest, CorruptAcceptedFileIsAnError) {
    harness::TempWorkspace ws("engine_corrupt");
    const auto path = accepted_at(ws, "test_parser__test_roundtrip.snap");
    harness::write_text(path, "hand edited\n");

    api::SnapshotEngine engine(config_for(ws));
    api::AssertOutcome out;
    core::EngineError err;
    EXPECT_FALSE(engine.assert_value(Value::from_int(1), kTest, {}, out, err));
    EXPECT_EQ(err.kind, core::ErrorKind::CorruptAcceptedFile);
    EXPECT_EQ(harness::read_text(path), "hand edited\n");
    EXPECT_EQ(harness::list_files(ws.root()).size(), 1u);
}

TEST(SnapshotEngineTest, MalformedInputsAreErrors) {
    harness::TempWorkspace ws("engine_malformed");
    api::SnapshotEngine engine(config_for(ws));
    api::AssertOutcome out;
    core::EngineError err;
    EXPECT_FALSE(engine.assert_json_text("{\"a\": ", kTest, {}, out, err));
    EXPECT_EQ(err.kind, core::ErrorKind::MalformedValue);

    api::AssertOptions csv;
    csv.format = core::Format::Csv;
    err.clear();
    EXPECT_FALSE(engine.assert_value(Value::from_int(1), kTest, csv, out, err));
    EXPECT_EQ(err.kind, core::ErrorKind::MalformedValue);
    EXPECT_TRUE(harness::list_files(ws.root()).empty());
}

TEST(SnapshotEngineTest, TextAndCsvWrappersRecordTheirFormat) {
    harness::TempWorkspace ws("engine_formats");
    core::Policy policy;
    policy.auto_accept = true;
    api::SnapshotEngine recorder(config_for(ws, policy));
    api::AssertOutcome out;
    core::EngineError err;
    ASSERT_TRUE(recorder.assert_text("line one\nline two\n", kTest, {}, out, err)) << err.describe();
    EXPECT_EQ(out.canonical, "line one\nline two\n");
    ASSERT_TRUE(recorder.assert_csv_text("b,a\n1,2\n", kTest, {}, out, err)) << err.describe();

    std::optional<core::AcceptedSnapshot> stored;
    ASSERT_TRUE(persist::read_accepted(out.accepted_path, stored, err));
    EXPECT_EQ(stored->format, core::Format::Csv);

    api::SnapshotEngine engine(config_for(ws));
    ASSERT_TRUE(engine.assert_text("line one\nline two\n", kTest, {}, out, err));
    EXPECT_TRUE(out.verdict.is_pass());
    // Same cells with different quoting and line endings: same canonical CSV.
    ASSERT_TRUE(engine.assert_csv_text("\"b\",a\r\n1,\"2\"", kTest, {}, out, err));
    EXPECT_TRUE(out.verdict.is_pass());
}

TEST(SnapshotEngineTest, FailedAssertionDoesNotConsumeAnOrdinal) {
    harness::TempWorkspace ws("engine_error_ordinal");
    api::SnapshotEngine engine(config_for(ws));
    engine.begin_invocation(kTest);

    api::AssertOutcome out;
    core::EngineError err;
    EXPECT_FALSE(engine.assert_value(Value::from_float(std::nan("")), kTest, {}, out, err));
    EXPECT_EQ(err.kind, core::ErrorKind::MalformedValue);
    EXPECT_EQ(err.path, accepted_at(ws, "test_parser__test_roundtrip.snap"));

    const auto next = check(engine, Value::from_int(1));
    EXPECT_EQ(next.identity.ordinal, 1u);
    EXPECT_EQ(next.accepted_path, accepted_at(ws, "test_parser__test_roundtrip.snap"));
}

TEST(SnapshotEngineTest, ErrorsNameTheSnapshotFile) {
    harness::TempWorkspace ws("engine_error_path");
    api::SnapshotEngine engine(config_for(ws));
    api::AssertOutcome out;
    core::EngineError err;
    EXPECT_FALSE(engine.assert_json_text("[1, ", kTest, {}, out, err));
    EXPECT_EQ(err.kind, core::ErrorKind::MalformedValue);
    EXPECT_EQ(err.path, accepted_at(ws, "test_parser__test_roundtrip.snap"));
    EXPECT_NE(err.describe().find("test_parser__test_roundtrip.snap"), std::string::npos) << err.describe();

    err.clear();
    EXPECT_FALSE(engine.force_update(Value::from_float(INFINITY), kTest, {}, out, err));
    EXPECT_EQ(err.path, accepted_at(ws, "test_parser__test_roundtrip.snap"));
    EXPECT_TRUE(harness::list_files(ws.root()).empty());
}

TEST(SnapshotEngineTest, RepeatedMismatchReplacesThePendingArtifact) {
    harness::TempWorkspace ws("engine_pending_replace");
    const auto path = accepted_at(ws, "test_parser__test_roundtrip.snap");
    core::EngineError err;
    ASSERT_TRUE(persist::write_accepted(path, accepted_body("1"), err));

    api::SnapshotEngine engine(config_for(ws));
    engine.begin_invocation(kTest);
    EXPECT_EQ(check(engine, Value::from_int(2)).verdict.kind, VerdictKind::Mismatch);
    engine.begin_invocation(kTest);
    const auto out = check(engine, Value::from_int(3));
    EXPECT_EQ(out.verdict.kind, VerdictKind::Mismatch);

    EXPECT_EQ(harness::list_files(ws.root()),
              (std::vector<std::string>{"tests/unit/snapshots/test_parser__test_roundtrip.snap",
                                        "tests/unit/snapshots/test_parser__test_roundtrip.snap.pending"}));
    ASSERT_TRUE(out.pending_path.has_value());
    core::PendingArtifact artifact;
    ASSERT_TRUE(persist::read_pending(*out.pending_path, artifact, err)) << err.describe();
    EXPECT_EQ(artifact.new_body, "3");
    EXPECT_EQ(artifact.old_body, std::optional<std::string>("1"));
}

TEST(SnapshotEngineTest, BinarySnapshotsCompareBytesUnderTheirOwnExtension) {
    harness::TempWorkspace ws("engine_binary");
    const std::string image("\x89PNG\r\n\x1a\n\x00\x00", 10);
    core::EngineError err;

    api::SnapshotEngine first(config_for(ws));
    api::AssertOutcome out;
    ASSERT_TRUE(first.assert_binary(image, "png", kTest, {}, out, err)) << err.describe();
    EXPECT_EQ(out.verdict.kind, VerdictKind::New);
    EXPECT_EQ(out.accepted_path, accepted_at(ws, "test_parser__test_roundtrip.snap.png"));
    ASSERT_TRUE(out.pending_path.has_value());
    core::PendingArtifact artifact;
    ASSERT_TRUE(persist::read_pending(*out.pending_path, artifact, err)) << err.describe();
    EXPECT_EQ(artifact.format, core::Format::Binary);
    EXPECT_EQ(artifact.new_body, image);
    ASSERT_TRUE(persist::promote_pending(*out.pending_path, artifact, err)) << err.describe();

    api::SnapshotEngine second(config_for(ws));
    ASSERT_TRUE(second.assert_binary(image, "png", kTest, {}, out, err)) << err.describe();
    EXPECT_TRUE(out.verdict.is_pass());

    std::string changed = image;
    changed.back() = '\x01';
    second.begin_invocation(kTest);
    ASSERT_TRUE(second.assert_binary(changed, "png", kTest, {}, out, err)) << err.describe();
    EXPECT_EQ(out.verdict.kind, VerdictKind::Mismatch);
    EXPECT_TRUE(out.failed);
    EXPECT_TRUE(out.verdict.hunks.empty());
    ASSERT_TRUE(out.pending_path.has_value());
    ASSERT_TRUE(persist::read_pending(*out.pending_path, artifact, err)) << err.describe();
    EXPECT_EQ(artifact.old_body, std::optional<std::string>(image));
    EXPECT_EQ(artifact.diff, "");

    std::optional<core::AcceptedSnapshot> stored;
    ASSERT_TRUE(persist::read_accepted(out.accepted_path, stored, err));
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->format, core::Format::Binary);
    EXPECT_EQ(stored->body, image);
}

TEST(SnapshotEngineTest, BinaryRejectsBadExtensionAndRedaction) {
    harness::TempWorkspace ws("engine_binary_invalid");
    api::SnapshotEngine engine(config_for(ws));
    api::AssertOutcome out;
    core::EngineError err;
    EXPECT_FALSE(engine.assert_binary("abc", "../png", kTest, {}, out, err));
    EXPECT_EQ(err.kind, core::ErrorKind::InvalidConfig);

    api::AssertOptions opts;
    core::RedactionRule rule;
    ASSERT_TRUE(core::make_rule(".", core::RedactionAction::remove(), rule, err)) << err.describe();
    opts.rules.push_back(rule);
    err.clear();
    EXPECT_FALSE(engine.assert_binary("abc", "bin", kTest, opts, out, err));
    EXPECT_EQ(err.kind, core::ErrorKind::InvalidConfig);
    EXPECT_TRUE(harness::list_files(ws.root()).empty());

    // Neither error took an ordinal.
    EXPECT_EQ(engine.next_identity(kTest, {}).ordinal, 1u);
}

} // namespace
