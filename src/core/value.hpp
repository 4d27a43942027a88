#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace core {

// Value is the closed intermediate form every input is lowered to before
// redaction and canonicalization. Integer and Float are distinct kinds so the
// canonicalizer can control formatting precision.
class Value;
struct MapEntry;

using Sequence = std::vector<Value>;
// Mapping keeps insertion order; canonicalization sorts, not the container.
using Mapping = std::vector<MapEntry>;

enum class ValueKind : std::uint8_t {
    Null,
    Bool,
    Integer,
    Float,
    Text,
    Sequence,
    Mapping
};

const char* value_kind_name(ValueKind kind) noexcept;

class Value {
public:
    Value() = default;

    static Value null();
    static Value from_bool(bool b);
    static Value from_int(std::int64_t i);
    static Value from_float(double d);
    static Value from_text(std::string s);
    static Value from_sequence(Sequence items);
    static Value from_mapping(Mapping entries);
    static Value empty_sequence();
    static Value empty_mapping();

    ValueKind kind() const noexcept { return static_cast<ValueKind>(storage_.index()); }

    bool is_null() const noexcept { return kind() == ValueKind::Null; }
    bool is_bool() const noexcept { return kind() == ValueKind::Bool; }
    bool is_int() const noexcept { return kind() == ValueKind::Integer; }
    bool is_float() const noexcept { return kind() == ValueKind::Float; }
    bool is_number() const noexcept { return is_int() || is_float(); }
    bool is_text() const noexcept { return kind() == ValueKind::Text; }
    bool is_sequence() const noexcept { return kind() == ValueKind::Sequence; }
    bool is_mapping() const noexcept { return kind() == ValueKind::Mapping; }

    // Accessors require the matching kind (std::get semantics).
    bool as_bool() const { return std::get<bool>(storage_); }
    std::int64_t as_int() const { return std::get<std::int64_t>(storage_); }
    double as_float() const { return std::get<double>(storage_); }
    const std::string& as_text() const { return std::get<std::string>(storage_); }
    const Sequence& as_sequence() const { return std::get<Sequence>(storage_); }
    Sequence& as_sequence() { return std::get<Sequence>(storage_); }
    const Mapping& as_mapping() const { return std::get<Mapping>(storage_); }
    Mapping& as_mapping() { return std::get<Mapping>(storage_); }

    // First entry with the given key, or nullptr (also for non-mappings).
    const Value* find(std::string_view key) const noexcept;
    Value* find(std::string_view key) noexcept;

    // Builders: set() replaces an existing key in place or appends; push()
    // appends to a sequence. Both convert a Null value to the container kind.
    Value& set(std::string key, Value v);
    Value& push(Value v);

    std::size_t size() const noexcept;

    friend bool operator==(const Value& a, const Value& b);
    friend bool operator!=(const Value& a, const Value& b) { return !(a == b); }

private:
    using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string, Sequence, Mapping>;

    Storage storage_{};
};

struct MapEntry {
    std::string key;
    Value value;

    friend bool operator==(const MapEntry& a, const MapEntry& b) {
        return a.key == b.key && a.value == b.value;
    }
};

} // namespace core
