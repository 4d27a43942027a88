#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace persist {

// Comment-style header shared by accepted and pending files:
//
//   # snapgate snapshot v1
//   # source: tests/unit/test_parser::test_roundtrip
//   # format: json
//   <blank line>
//
// Keys are lowercase words joined by '-'. Values are single-line; '\n', '\r'
// and '\\' are escaped on write.
struct HeaderBlock {
    std::string magic;
    std::vector<std::pair<std::string, std::string>> fields;

    void add(std::string key, std::string value) { fields.emplace_back(std::move(key), std::move(value)); }
    const std::string* find(std::string_view key) const noexcept;
};

// Magic line, field lines, blank separator line.
std::string render_header(const HeaderBlock& header);

// Parses the header at the start of `text`. `expected_magic` must be the
// first line. On success `body_offset` is the first byte after the blank
// separator line. Duplicate keys and malformed lines are errors.
bool parse_header(std::string_view text,
                  std::string_view expected_magic,
                  HeaderBlock& out,
                  std::size_t& body_offset,
                  std::string& err);

} // namespace persist
