#include "core/value.hpp"

#include <utility>

namespace core {

const char* value_kind_name(ValueKind kind) noexcept {
    switch (kind) {
        case ValueKind::Null: return "null";
        case ValueKind::Bool: return "bool";
        case ValueKind::Integer: return "integer";
        case ValueKind::Float: return "float";
        case ValueKind::Text: return "text";
        case ValueKind::Sequence: return "sequence";
        case ValueKind::Mapping: return "mapping";
    }
    return "unknown";
}

Value Value::null() {
    return Value();
}

Value Value::from_bool(bool b) {
    Value v;
    v.storage_ = b;
    return v;
}

Value Value::from_int(std::int64_t i) {
    Value v;
    v.storage_ = i;
    return v;
}

Value Value::from_float(double d) {
    Value v;
    v.storage_ = d;
    return v;
}

Value Value::from_text(std::string s) {
    Value v;
    v.storage_ = std::move(s);
    return v;
}

Value Value::from_sequence(Sequence items) {
    Value v;
    v.storage_ = std::move(items);
    return v;
}

Value Value::from_mapping(Mapping entries) {
    Value v;
    v.storage_ = std::move(entries);
    return v;
}

Value Value::empty_sequence() {
    return from_sequence(Sequence{});
}

Value Value::empty_mapping() {
    return from_mapping(Mapping{});
}

const Value* Value::find(std::string_view key) const noexcept {
    if (!is_mapping()) {
        return nullptr;
    }
    for (const auto& entry : std::get<Mapping>(storage_)) {
        if (entry.key == key) {
            return &entry.value;
        }
    }
    return nullptr;
}

Value* Value::find(std::string_view key) noexcept {
    return const_cast<Value*>(std::as_const(*this).find(key));
}

Value& Value::set(std::string key, Value v) {
    if (is_null()) {
        storage_ = Mapping{};
    }
    auto& entries = std::get<Mapping>(storage_);
    for (auto& entry : entries) {
        if (entry.key == key) {
            entry.value = std::move(v);
            return *this;
        }
    }
    entries.push_back(MapEntry{std::move(key), std::move(v)});
    return *this;
}

Value& Value::push(Value v) {
    if (is_null()) {
        storage_ = Sequence{};
    }
    std::get<Sequence>(storage_).push_back(std::move(v));
    return *this;
}

std::size_t Value::size() const noexcept {
    if (is_sequence()) {
        return std::get<Sequence>(storage_).size();
    }
    if (is_mapping()) {
        return std::get<Mapping>(storage_).size();
    }
    return 0;
}

// Structural equality; mapping order matters here (canonical text is what the
// comparator uses, so this is only for tests and in-memory checks).
bool operator==(const Value& a, const Value& b) {
    return a.storage_ == b.storage_;
}

} // namespace core
