#include "core/redaction.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <span>
#include <system_error>

#include "core/canonical.hpp"

namespace core {
namespace {

constexpr int kMaxRoundPrecision = 15;

bool is_plain_key_char(char c) noexcept {
    return c != '.' && c != '[' && c != ']' && c != '"' && c != '*';
}

void round_floats(Value& v, int precision) {
    if (v.is_float()) {
        const double scale = std::pow(10.0, precision);
        const double scaled = std::round(v.as_float() * scale);
        if (std::isfinite(scaled)) {
            v = Value::from_float(scaled / scale);
        }
        return;
    }
    if (v.is_sequence()) {
        for (auto& item : v.as_sequence()) {
            round_floats(item, precision);
        }
    } else if (v.is_mapping()) {
        for (auto& entry : v.as_mapping()) {
            round_floats(entry.value, precision);
        }
    }
}

void sort_sequence(Value& v) {
    if (!v.is_sequence()) {
        return;
    }
    auto& items = v.as_sequence();
    std::vector<std::pair<std::string, Value>> keyed;
    keyed.reserve(items.size());
    for (auto& item : items) {
        std::string key;
        EngineError ignored;
        // A value that cannot be canonicalized sorts first with an empty key;
        // the canonicalizer reports it later anyway.
        if (!canonicalize(item, Format::Json, key, ignored)) {
            key.clear();
        }
        keyed.emplace_back(std::move(key), std::move(item));
    }
    std::stable_sort(keyed.begin(), keyed.end(), [](const auto& a, const auto& b) {
        return a.first < b.first;
    });
    items.clear();
    for (auto& kv : keyed) {
        items.push_back(std::move(kv.second));
    }
}

void act(Value& target, const RedactionAction& action) {
    switch (action.kind) {
        case RedactionActionKind::ReplaceWith:
            target = action.replacement;
            break;
        case RedactionActionKind::RoundFloat:
            round_floats(target, action.precision);
            break;
        case RedactionActionKind::SortSequence:
            sort_sequence(target);
            break;
        case RedactionActionKind::Delete:
            // Deletion needs the parent; handled in act_on_children.
            break;
    }
}

bool key_matches(const Segment& seg, const std::string& key) noexcept {
    return seg.kind == SegmentKind::Wildcard || (seg.kind == SegmentKind::Key && seg.key == key);
}

bool index_matches(const Segment& seg, std::size_t idx) noexcept {
    return seg.kind == SegmentKind::Wildcard || (seg.kind == SegmentKind::Index && seg.index == idx);
}

void act_on_children(Value& node, const Segment& seg, const RedactionAction& action, std::size_t& count) {
    const bool deleting = action.kind == RedactionActionKind::Delete;
    if (node.is_mapping()) {
        auto& entries = node.as_mapping();
        if (deleting) {
            const auto before = entries.size();
            entries.erase(std::remove_if(entries.begin(), entries.end(),
                                         [&](const MapEntry& e) { return key_matches(seg, e.key); }),
                          entries.end());
            count += before - entries.size();
            return;
        }
        for (auto& e : entries) {
            if (key_matches(seg, e.key)) {
                act(e.value, action);
                ++count;
            }
        }
    } else if (node.is_sequence()) {
        auto& items = node.as_sequence();
        if (deleting) {
            // Indices refer to positions before this rule removed anything.
            if (seg.kind == SegmentKind::Wildcard) {
                count += items.size();
                items.clear();
            } else if (seg.kind == SegmentKind::Index && seg.index < items.size()) {
                items.erase(items.begin() + static_cast<std::ptrdiff_t>(seg.index));
                ++count;
            }
            return;
        }
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (index_matches(seg, i)) {
                act(items[i], action);
                ++count;
            }
        }
    }
}

void visit(Value& node, std::span<const Segment> rest, const RedactionAction& action, std::size_t& count) {
    if (rest.empty()) {
        return;
    }
    const Segment& seg = rest.front();
    const auto tail = rest.subspan(1);

    if (seg.kind == SegmentKind::DeepWildcard) {
        // Children first so a replacement value is never re-visited.
        if (node.is_mapping()) {
            for (auto& e : node.as_mapping()) {
                visit(e.value, rest, action, count);
            }
        } else if (node.is_sequence()) {
            for (auto& item : node.as_sequence()) {
                visit(item, rest, action, count);
            }
        }
        visit(node, tail, action, count);
        return;
    }

    if (tail.empty()) {
        act_on_children(node, seg, action, count);
        return;
    }
    if (node.is_mapping()) {
        for (auto& e : node.as_mapping()) {
            if (key_matches(seg, e.key)) {
                visit(e.value, tail, action, count);
            }
        }
    } else if (node.is_sequence()) {
        auto& items = node.as_sequence();
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (index_matches(seg, i)) {
                visit(items[i], tail, action, count);
            }
        }
    }
}

class SelectorParser {
public:
    explicit SelectorParser(std::string_view s) : src_(s) {}

    bool parse(Selector& out, EngineError& err) {
        Selector sel;
        if (src_.empty() || src_ == ".") {
            out = std::move(sel);
            return true;
        }
        if (src_.front() != '.' && src_.front() != '[') {
            // Bare leading key: "timestamp" == ".timestamp"
            Segment seg;
            if (!parse_plain_key(seg)) {
                return fail(err, "Expected key");
            }
            sel.segments.push_back(std::move(seg));
        }
        while (pos_ < src_.size()) {
            const char c = src_[pos_];
            Segment seg;
            if (c == '.') {
                ++pos_;
                if (src_.substr(pos_, 2) == "**") {
                    pos_ += 2;
                    seg.kind = SegmentKind::DeepWildcard;
                } else if (src_.substr(pos_, 1) == "*") {
                    ++pos_;
                    seg.kind = SegmentKind::Wildcard;
                } else if (!parse_plain_key(seg)) {
                    return fail(err, "Expected key after '.'");
                }
            } else if (c == '[') {
                ++pos_;
                if (!parse_bracket(seg, err)) {
                    return false;
                }
            } else {
                return fail(err, "Unexpected character");
            }
            sel.segments.push_back(std::move(seg));
        }
        if (!sel.segments.empty() && sel.segments.back().kind == SegmentKind::DeepWildcard) {
            return fail(err, "'**' must be followed by another segment");
        }
        out = std::move(sel);
        return true;
    }

private:
    bool fail(EngineError& err, const std::string& msg) {
        err.set(ErrorKind::InvalidSelector,
                msg + " at offset " + std::to_string(pos_) + " in selector \"" + std::string(src_) + "\"");
        return false;
    }

    bool parse_plain_key(Segment& seg) {
        const std::size_t start = pos_;
        while (pos_ < src_.size() && is_plain_key_char(src_[pos_])) {
            ++pos_;
        }
        if (pos_ == start) {
            return false;
        }
        seg.kind = SegmentKind::Key;
        seg.key = std::string(src_.substr(start, pos_ - start));
        return true;
    }

    bool parse_bracket(Segment& seg, EngineError& err) {
        if (pos_ >= src_.size()) {
            return fail(err, "Unterminated '['");
        }
        const char c = src_[pos_];
        if (c == '*') {
            ++pos_;
            seg.kind = SegmentKind::Wildcard;
        } else if (c == '"') {
            ++pos_;
            std::string key;
            bool closed = false;
            while (pos_ < src_.size()) {
                const char k = src_[pos_++];
                if (k == '\\' && pos_ < src_.size()) {
                    key.push_back(src_[pos_++]);
                } else if (k == '"') {
                    closed = true;
                    break;
                } else {
                    key.push_back(k);
                }
            }
            if (!closed) {
                return fail(err, "Unterminated quoted key");
            }
            seg.kind = SegmentKind::Key;
            seg.key = std::move(key);
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            const std::size_t start = pos_;
            while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
                ++pos_;
            }
            std::size_t idx = 0;
            const auto res = std::from_chars(src_.data() + start, src_.data() + pos_, idx);
            if (res.ec != std::errc()) {
                return fail(err, "Index out of range");
            }
            seg.kind = SegmentKind::Index;
            seg.index = idx;
        } else {
            return fail(err, "Expected '*', index or quoted key after '['");
        }
        if (pos_ >= src_.size() || src_[pos_] != ']') {
            return fail(err, "Expected ']'");
        }
        ++pos_;
        return true;
    }

    std::string_view src_;
    std::size_t pos_{0};
};

} // namespace

std::string Selector::to_string() const {
    if (segments.empty()) {
        return ".";
    }
    std::string out;
    for (const auto& seg : segments) {
        switch (seg.kind) {
            case SegmentKind::Key: {
                const bool plain = !seg.key.empty() &&
                                   std::all_of(seg.key.begin(), seg.key.end(), is_plain_key_char);
                if (plain) {
                    out += '.';
                    out += seg.key;
                } else {
                    out += "[\"";
                    for (char c : seg.key) {
                        if (c == '"' || c == '\\') {
                            out += '\\';
                        }
                        out += c;
                    }
                    out += "\"]";
                }
                break;
            }
            case SegmentKind::Index:
                out += "[" + std::to_string(seg.index) + "]";
                break;
            case SegmentKind::Wildcard:
                out += "[*]";
                break;
            case SegmentKind::DeepWildcard:
                out += ".**";
                break;
        }
    }
    return out;
}

bool parse_selector(std::string_view text, Selector& out, EngineError& err) {
    SelectorParser parser(text);
    return parser.parse(out, err);
}

RedactionAction RedactionAction::replace_with(Value v) {
    RedactionAction a;
    a.kind = RedactionActionKind::ReplaceWith;
    a.replacement = std::move(v);
    return a;
}

RedactionAction RedactionAction::remove() {
    RedactionAction a;
    a.kind = RedactionActionKind::Delete;
    return a;
}

RedactionAction RedactionAction::round_float(int decimals) {
    RedactionAction a;
    a.kind = RedactionActionKind::RoundFloat;
    a.precision = std::clamp(decimals, 0, kMaxRoundPrecision);
    return a;
}

RedactionAction RedactionAction::sort() {
    RedactionAction a;
    a.kind = RedactionActionKind::SortSequence;
    return a;
}

bool make_rule(std::string_view selector, RedactionAction action, RedactionRule& out, EngineError& err) {
    Selector sel;
    if (!parse_selector(selector, sel, err)) {
        return false;
    }
    out.selector = std::move(sel);
    out.action = std::move(action);
    return true;
}

std::size_t apply_rule(Value& root, const RedactionRule& rule) {
    std::size_t count = 0;
    if (rule.selector.segments.empty()) {
        if (rule.action.kind == RedactionActionKind::Delete) {
            root = Value::null();
        } else {
            act(root, rule.action);
        }
        return 1;
    }
    visit(root, rule.selector.segments, rule.action, count);
    return count;
}

Value redact(const Value& value, const std::vector<RedactionRule>& rules) {
    Value out = value;
    for (const auto& rule : rules) {
        apply_rule(out, rule);
    }
    return out;
}

} // namespace core
