#pragma once

#include <string>
#include <string_view>

#include "core/value.hpp"

namespace core {

// Reads delimited text (comma, RFC 4180 quoting) into a Sequence of rows,
// each row a Sequence of cells. The first row is the header and is kept as
// text; cells of later rows are type-inferred: integer, float, true/false,
// otherwise text. Every row must have the header's column count.
bool parse_csv(std::string_view text, Value& out, std::string& error) noexcept;

// The inference applied to non-header cells, exposed for tests.
Value infer_cell(std::string_view cell);

} // namespace core
