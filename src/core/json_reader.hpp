#pragma once

#include <string>
#include <string_view>

#include "core/value.hpp"

namespace core {

// Strict JSON reader lowering text into a Value. Numbers containing '.', 'e'
// or 'E' become Float, everything else Integer (out-of-range integers are an
// error rather than silently turning into floats). Mapping order is kept as
// written. Does not throw; on failure `error` names the byte offset.
bool parse_json(std::string_view text, Value& out, std::string& error) noexcept;

} // namespace core
