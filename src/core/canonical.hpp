#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "core/engine_error.hpp"
#include "core/value.hpp"

namespace core {

enum class Format : std::uint8_t {
    Json, // structured text: sorted keys, two-space indent
    Csv,  // delimited records
    Text, // a single scalar rendered verbatim
    Binary // raw bytes held in a Text value; equality only, never diffed
};

const char* format_name(Format f) noexcept;
std::optional<Format> format_from_string(std::string_view s) noexcept;

// Fixed rendering constants. Changing any of them invalidates every accepted
// snapshot, so they are not configurable.
inline constexpr std::size_t kIndentWidth = 2;
inline constexpr int kFloatSignificantDigits = 15;
inline constexpr char kCsvDelimiter = ',';

struct CanonicalOptions {
    // Csv only: explicit column order for mapping records. When empty the
    // first record's keys, sorted, are used.
    std::vector<std::string> csv_columns;
};

// Deterministic rendering of `value`. Returns false with a MalformedValue
// error when the value cannot be represented in `format` (duplicate mapping
// keys, non-finite floats, non-scalar CSV cells, ...).
bool canonicalize(const Value& value,
                  Format format,
                  std::string& out,
                  EngineError& err,
                  const CanonicalOptions& options = {});

// Float formatting shared with the redactor's sort key: 15 significant
// digits, never "-0", always a '.' or exponent so it reads back as a float.
// Returns nullopt for NaN and infinities.
std::optional<std::string> format_float(double d);

// JSON string literal with quotes; escapes only '"', '\\' and control bytes.
std::string quote_json_string(std::string_view s);

} // namespace core
