#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "core/canonical.hpp"
#include "core/engine_error.hpp"

namespace core {

// What an adapter knows about the running test.
struct TestIdentity {
    std::string module_dir; // relative to the workspace root, e.g. "tests/unit"
    std::string module_id;  // e.g. "test_parser"
    std::string test_name;  // e.g. "test_roundtrip"

    // "tests/unit/test_parser::test_roundtrip"; also the header `source:` value.
    std::string key() const;

    friend bool operator==(const TestIdentity&, const TestIdentity&) = default;
};

struct SnapshotIdentity {
    std::filesystem::path workspace_root;
    std::string module_dir;
    std::string module_id;
    std::string test_name;
    std::optional<std::string> explicit_name;
    std::uint32_t ordinal{1};
    std::string extension{"snap"};

    TestIdentity test() const { return TestIdentity{module_dir, module_id, test_name}; }

    friend bool operator==(const SnapshotIdentity&, const SnapshotIdentity&) = default;
};

inline constexpr std::string_view kSnapshotDirName = "snapshots";
inline constexpr std::string_view kPendingSuffix = ".pending";

inline constexpr std::string_view kDefaultBinaryExtension = "bin";

// Text formats store as ".snap" and the header records the format. Binary
// snapshots store as ".snap.<binary_extension>" ("bin" when empty) so the
// accepted file keeps a suffix that viewers recognise.
std::string extension_for(Format format, std::string_view binary_extension = {});

// A caller-chosen binary extension: 1-16 of [A-Za-z0-9_-].
bool valid_binary_extension(std::string_view ext) noexcept;

// Replaces "::" with "__" and characters that are unsafe in file names with '_'.
std::string sanitize_name_component(std::string_view s);

// "<module>__<test>[__<name>][-<ordinal>]"; the ordinal is omitted for 1 and
// whenever an explicit name is present.
std::string snapshot_stem(const SnapshotIdentity& id);

// <root>/<module_dir>/snapshots/<stem>.<extension>. Pure: no filesystem access.
std::filesystem::path resolve_snapshot_path(const SnapshotIdentity& id);

std::filesystem::path pending_path_for(const std::filesystem::path& accepted_path);

// Inverse of pending_path_for; nullopt when `pending_path` lacks the suffix.
std::optional<std::filesystem::path> accepted_path_for(const std::filesystem::path& pending_path);

// Parses a runner test locator such as "tests/a/test_x.py::test_y (call)".
// The file stem becomes the module id and its directory the module dir; a
// trailing " (stage)" is dropped. Fails with InvalidConfig if "::" is absent.
bool parse_test_locator(std::string_view locator, TestIdentity& out, EngineError& err);

// Per-invocation counters for unnamed assertions, keyed by TestIdentity::key().
// Not synchronized: one engine instance belongs to one test runner thread.
class OrdinalCounter {
public:
    // Advances and returns the ordinal for this assertion (first call: 1).
    std::uint32_t next(const std::string& test_key);
    // Ordinal of the most recent assertion (1 if none yet).
    std::uint32_t peek_last(const std::string& test_key) const;
    // Ordinal the next assertion would get.
    std::uint32_t peek_next(const std::string& test_key) const;

    void reset(const std::string& test_key);
    void reset_all() noexcept { counters_.clear(); }

private:
    std::map<std::string, std::uint32_t> counters_;
};

} // namespace core
