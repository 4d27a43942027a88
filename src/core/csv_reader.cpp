#include "core/csv_reader.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <new>
#include <system_error>
#include <vector>

namespace core {
namespace {

constexpr char kDelimiter = ',';
constexpr char kQuote = '"';

bool looks_numeric(std::string_view s, bool& is_float) noexcept {
    std::size_t i = 0;
    if (i < s.size() && (s[i] == '-' || s[i] == '+')) {
        ++i;
    }
    bool digits = false;
    is_float = false;
    for (; i < s.size(); ++i) {
        const char c = s[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits = true;
        } else if (c == '.' || c == 'e' || c == 'E') {
            is_float = true;
        } else if ((c == '-' || c == '+') && i > 0 && (s[i - 1] == 'e' || s[i - 1] == 'E')) {
            continue;
        } else {
            return false;
        }
    }
    return digits;
}

} // namespace

Value infer_cell(std::string_view cell) {
    if (cell == "true") {
        return Value::from_bool(true);
    }
    if (cell == "false") {
        return Value::from_bool(false);
    }
    bool is_float = false;
    if (!cell.empty() && looks_numeric(cell, is_float)) {
        // from_chars rejects a leading '+'.
        std::string_view digits = cell.front() == '+' ? cell.substr(1) : cell;
        const char* begin = digits.data();
        const char* end = digits.data() + digits.size();
        if (!is_float) {
            std::int64_t i = 0;
            const auto res = std::from_chars(begin, end, i);
            if (res.ec == std::errc() && res.ptr == end) {
                return Value::from_int(i);
            }
        } else {
            double d = 0.0;
            const auto res = std::from_chars(begin, end, d);
            if (res.ec == std::errc() && res.ptr == end && std::isfinite(d)) {
                return Value::from_float(d);
            }
        }
    }
    return Value::from_text(std::string(cell));
}

bool parse_csv(std::string_view text, Value& out, std::string& error) noexcept {
    try {
        std::vector<std::vector<std::string>> rows;
        std::vector<std::string> row;
        std::string cell;
        bool in_quotes = false;
        bool cell_was_quoted = false;
        std::size_t line = 1;

        auto end_cell = [&]() {
            row.push_back(std::move(cell));
            cell.clear();
            cell_was_quoted = false;
        };
        auto end_row = [&]() {
            end_cell();
            rows.push_back(std::move(row));
            row.clear();
        };

        for (std::size_t i = 0; i < text.size(); ++i) {
            const char c = text[i];
            if (in_quotes) {
                if (c == kQuote) {
                    if (i + 1 < text.size() && text[i + 1] == kQuote) {
                        cell.push_back(kQuote);
                        ++i;
                    } else {
                        in_quotes = false;
                    }
                } else {
                    if (c == '\n') {
                        ++line;
                    }
                    cell.push_back(c);
                }
                continue;
            }
            if (c == kQuote) {
                if (!cell.empty() || cell_was_quoted) {
                    error = "Unexpected quote on line " + std::to_string(line);
                    return false;
                }
                in_quotes = true;
                cell_was_quoted = true;
            } else if (c == kDelimiter) {
                end_cell();
            } else if (c == '\r') {
                if (i + 1 < text.size() && text[i + 1] == '\n') {
                    continue;
                }
                end_row();
                ++line;
            } else if (c == '\n') {
                end_row();
                ++line;
            } else {
                if (cell_was_quoted) {
                    error = "Characters after closing quote on line " + std::to_string(line);
                    return false;
                }
                cell.push_back(c);
            }
        }
        if (in_quotes) {
            error = "Unterminated quoted field";
            return false;
        }
        // A final line without a terminator still counts; a trailing newline does not add a row.
        if (!cell.empty() || cell_was_quoted || !row.empty()) {
            end_row();
        }
        if (rows.empty()) {
            error = "Expected a header row";
            return false;
        }

        const std::size_t columns = rows.front().size();
        Sequence result;
        result.reserve(rows.size());
        for (std::size_t r = 0; r < rows.size(); ++r) {
            if (rows[r].size() != columns) {
                error = "Row " + std::to_string(r + 1) + " has " + std::to_string(rows[r].size()) +
                        " fields, header has " + std::to_string(columns);
                return false;
            }
            Sequence cells;
            cells.reserve(columns);
            for (auto& c : rows[r]) {
                cells.push_back(r == 0 ? Value::from_text(std::move(c)) : infer_cell(c));
            }
            result.push_back(Value::from_sequence(std::move(cells)));
        }
        out = Value::from_sequence(std::move(result));
        return true;
    } catch (const std::bad_alloc&) {
        error = "Out of memory while parsing CSV";
        return false;
    }
}

} // namespace core
