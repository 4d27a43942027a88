#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "core/engine_error.hpp"
#include "core/value.hpp"

namespace core {

enum class SegmentKind : std::uint8_t {
    Key,          // .name or ["name"]
    Index,        // [3]
    Wildcard,     // .* or [*]: every key of a mapping or every index of a sequence
    DeepWildcard  // .**: zero or more levels
};

struct Segment {
    SegmentKind kind{SegmentKind::Key};
    std::string key;
    std::size_t index{0};

    friend bool operator==(const Segment&, const Segment&) = default;
};

// An empty selector addresses the root value.
struct Selector {
    std::vector<Segment> segments;

    std::string to_string() const;
    friend bool operator==(const Selector&, const Selector&) = default;
};

// Parses ".a.b", ".items[*].id", "[0]", ".**.ts", "[\"odd.key\"]", "." (root).
bool parse_selector(std::string_view text, Selector& out, EngineError& err);

enum class RedactionActionKind : std::uint8_t {
    ReplaceWith,
    Delete,
    RoundFloat,
    SortSequence
};

struct RedactionAction {
    RedactionActionKind kind{RedactionActionKind::ReplaceWith};
    Value replacement;   // ReplaceWith
    int precision{0};    // RoundFloat: decimal places

    static RedactionAction replace_with(Value v);
    static RedactionAction remove();
    static RedactionAction round_float(int decimals);
    static RedactionAction sort();
};

struct RedactionRule {
    Selector selector;
    RedactionAction action;
};

// Convenience: parse `selector` and pair it with `action`.
bool make_rule(std::string_view selector, RedactionAction action, RedactionRule& out, EngineError& err);

// Applies rules in declaration order, each to the output of the previous one.
// A selector matching nothing is not an error.
Value redact(const Value& value, const std::vector<RedactionRule>& rules);

// In-place variant; returns the number of locations acted on.
std::size_t apply_rule(Value& root, const RedactionRule& rule);

} // namespace core
