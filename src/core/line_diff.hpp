#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace core {

enum class DiffOp : std::uint8_t { Context, Removed, Added };

struct DiffLine {
    DiffOp op{DiffOp::Context};
    std::string text;

    friend bool operator==(const DiffLine&, const DiffLine&) = default;
};

// One unified-diff hunk. Line numbers are 1-based; a count of 0 means the
// hunk has no lines on that side (start then names the line before it).
struct DiffHunk {
    std::size_t old_start{0};
    std::size_t old_count{0};
    std::size_t new_start{0};
    std::size_t new_count{0};
    std::vector<DiffLine> lines;
};

inline constexpr std::size_t kDiffContextLines = 3;
// LCS table budget (cells). Larger inputs fall back to replacing the whole
// differing middle block, which is still a correct, just not minimal, diff.
inline constexpr std::size_t kMaxLcsCells = 16u * 1024u * 1024u;

// Splits on '\n'. "a\nb" -> {a, b}; "a\n" -> {a, ""}; "" -> {""}.
std::vector<std::string_view> split_lines(std::string_view text);

// Full edit script from `old_text` to `new_text` (longest common subsequence
// over lines, common prefix and suffix trimmed first).
std::vector<DiffLine> diff_lines(std::string_view old_text, std::string_view new_text);

// Groups an edit script into hunks with `context` unchanged lines around
// each change. No hunks when the texts are equal.
std::vector<DiffHunk> make_hunks(const std::vector<DiffLine>& script,
                                 std::size_t context = kDiffContextLines);

std::vector<DiffHunk> diff_hunks(std::string_view old_text,
                                 std::string_view new_text,
                                 std::size_t context = kDiffContextLines);

// "--- old\n+++ new\n@@ -1,3 +1,3 @@\n ..." text; empty when there are no hunks.
std::string render_unified(const std::vector<DiffHunk>& hunks,
                           std::string_view old_label = "old",
                           std::string_view new_label = "new");

} // namespace core
