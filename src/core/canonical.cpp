#include "core/canonical.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <system_error>

namespace core {
namespace {

void append_indent(std::string& out, std::size_t depth) {
    out.append(depth * kIndentWidth, ' ');
}

bool render_scalar(const Value& v, std::string& out, EngineError& err, const std::string& where) {
    switch (v.kind()) {
        case ValueKind::Null:
            out += "null";
            return true;
        case ValueKind::Bool:
            out += v.as_bool() ? "true" : "false";
            return true;
        case ValueKind::Integer:
            out += std::to_string(v.as_int());
            return true;
        case ValueKind::Float: {
            auto f = format_float(v.as_float());
            if (!f) {
                err.set(ErrorKind::MalformedValue, "Non-finite float at " + where);
                return false;
            }
            out += *f;
            return true;
        }
        case ValueKind::Text:
            out += quote_json_string(v.as_text());
            return true;
        case ValueKind::Sequence:
        case ValueKind::Mapping:
            break;
    }
    err.set(ErrorKind::MalformedValue, "Expected a scalar at " + where);
    return false;
}

class JsonWriter {
public:
    JsonWriter(std::string& out, EngineError& err) : out_(out), err_(err) {}

    bool write(const Value& v, std::size_t depth, const std::string& where) {
        if (v.is_sequence()) {
            return write_sequence(v.as_sequence(), depth, where);
        }
        if (v.is_mapping()) {
            return write_mapping(v.as_mapping(), depth, where);
        }
        return render_scalar(v, out_, err_, where);
    }

private:
    bool write_sequence(const Sequence& items, std::size_t depth, const std::string& where) {
        if (items.empty()) {
            out_ += "[]";
            return true;
        }
        out_ += "[\n";
        for (std::size_t i = 0; i < items.size(); ++i) {
            append_indent(out_, depth + 1);
            if (!write(items[i], depth + 1, where + "[" + std::to_string(i) + "]")) {
                return false;
            }
            out_ += (i + 1 < items.size()) ? ",\n" : "\n";
        }
        append_indent(out_, depth);
        out_ += ']';
        return true;
    }

    bool write_mapping(const Mapping& entries, std::size_t depth, const std::string& where) {
        if (entries.empty()) {
            out_ += "{}";
            return true;
        }
        std::vector<const MapEntry*> sorted;
        sorted.reserve(entries.size());
        for (const auto& e : entries) {
            sorted.push_back(&e);
        }
        std::sort(sorted.begin(), sorted.end(), [](const MapEntry* a, const MapEntry* b) {
            return a->key < b->key;
        });
        for (std::size_t i = 1; i < sorted.size(); ++i) {
            if (sorted[i]->key == sorted[i - 1]->key) {
                err_.set(ErrorKind::MalformedValue,
                         "Duplicate mapping key \"" + sorted[i]->key + "\" at " + where);
                return false;
            }
        }
        out_ += "{\n";
        for (std::size_t i = 0; i < sorted.size(); ++i) {
            append_indent(out_, depth + 1);
            out_ += quote_json_string(sorted[i]->key);
            out_ += ": ";
            if (!write(sorted[i]->value, depth + 1, where + "." + sorted[i]->key)) {
                return false;
            }
            out_ += (i + 1 < sorted.size()) ? ",\n" : "\n";
        }
        append_indent(out_, depth);
        out_ += '}';
        return true;
    }

    std::string& out_;
    EngineError& err_;
};

bool csv_needs_quotes(std::string_view cell) noexcept {
    return cell.find_first_of(std::string_view("\",\r\n", 4)) != std::string_view::npos;
}

void append_csv_cell(std::string& out, std::string_view cell) {
    if (!csv_needs_quotes(cell)) {
        out += cell;
        return;
    }
    out += '"';
    for (char c : cell) {
        if (c == '"') {
            out += "\"\"";
        } else {
            out += c;
        }
    }
    out += '"';
}

// Scalars inside CSV: text unquoted (CSV quoting applies instead), null empty.
bool csv_cell_text(const Value& v, std::string& cell, EngineError& err, const std::string& where) {
    if (v.is_null()) {
        cell.clear();
        return true;
    }
    if (v.is_text()) {
        cell = v.as_text();
        return true;
    }
    cell.clear();
    return render_scalar(v, cell, err, where);
}

bool write_csv(const Value& value, const CanonicalOptions& options, std::string& out, EngineError& err) {
    if (!value.is_sequence()) {
        err.set(ErrorKind::MalformedValue,
                std::string("CSV snapshot expects a sequence of records, got ") + value_kind_name(value.kind()));
        return false;
    }
    const auto& records = value.as_sequence();
    if (records.empty()) {
        return true;
    }
    const bool mapping_records = records.front().is_mapping();
    std::vector<std::string> columns;
    if (mapping_records) {
        if (!options.csv_columns.empty()) {
            columns = options.csv_columns;
        } else {
            for (const auto& e : records.front().as_mapping()) {
                columns.push_back(e.key);
            }
            std::sort(columns.begin(), columns.end());
        }
        for (std::size_t c = 0; c < columns.size(); ++c) {
            if (c > 0) {
                out += kCsvDelimiter;
            }
            append_csv_cell(out, columns[c]);
        }
    }

    std::string cell;
    for (std::size_t r = 0; r < records.size(); ++r) {
        const auto& rec = records[r];
        const std::string where = "[" + std::to_string(r) + "]";
        if (mapping_records != rec.is_mapping() || (!mapping_records && !rec.is_sequence())) {
            err.set(ErrorKind::MalformedValue, "CSV records must all be mappings or all be sequences; record " + where);
            return false;
        }
        if (r > 0 || mapping_records) {
            out += '\n';
        }
        if (mapping_records) {
            for (const auto& e : rec.as_mapping()) {
                if (std::find(columns.begin(), columns.end(), e.key) == columns.end()) {
                    err.set(ErrorKind::MalformedValue, "CSV record " + where + " has column \"" + e.key +
                                                           "\" outside the schema");
                    return false;
                }
            }
            for (std::size_t c = 0; c < columns.size(); ++c) {
                if (c > 0) {
                    out += kCsvDelimiter;
                }
                const Value* v = rec.find(columns[c]);
                if (v == nullptr) {
                    continue;
                }
                if (!csv_cell_text(*v, cell, err, where + "." + columns[c])) {
                    return false;
                }
                append_csv_cell(out, cell);
            }
        } else {
            const auto& cells = rec.as_sequence();
            for (std::size_t c = 0; c < cells.size(); ++c) {
                if (c > 0) {
                    out += kCsvDelimiter;
                }
                if (!csv_cell_text(cells[c], cell, err, where + "[" + std::to_string(c) + "]")) {
                    return false;
                }
                append_csv_cell(out, cell);
            }
        }
    }
    return true;
}

} // namespace

const char* format_name(Format f) noexcept {
    switch (f) {
        case Format::Json: return "json";
        case Format::Csv: return "csv";
        case Format::Text: return "text";
        case Format::Binary: return "binary";
    }
    return "unknown";
}

std::optional<Format> format_from_string(std::string_view s) noexcept {
    if (s == "json") return Format::Json;
    if (s == "csv") return Format::Csv;
    if (s == "text") return Format::Text;
    if (s == "binary") return Format::Binary;
    return std::nullopt;
}

std::optional<std::string> format_float(double d) {
    if (!std::isfinite(d)) {
        return std::nullopt;
    }
    if (d == 0.0) {
        return std::string("0.0");
    }
    std::array<char, 64> buf{};
    const auto res = std::to_chars(buf.data(), buf.data() + buf.size(), d,
                                   std::chars_format::general, kFloatSignificantDigits);
    if (res.ec != std::errc()) {
        return std::nullopt;
    }
    std::string s(buf.data(), res.ptr);
    if (s.find_first_of(".e") == std::string::npos) {
        s += ".0";
    }
    return s;
}

std::string quote_json_string(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out += '"';
    for (char c : s) {
        const auto uc = static_cast<unsigned char>(c);
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (uc < 0x20) {
                    char esc[7]{};
                    std::snprintf(esc, sizeof(esc), "\\u%04x", uc);
                    out += esc;
                } else {
                    out += c;
                }
        }
    }
    out += '"';
    return out;
}

bool canonicalize(const Value& value,
                  Format format,
                  std::string& out,
                  EngineError& err,
                  const CanonicalOptions& options) {
    std::string text;
    switch (format) {
        case Format::Json: {
            JsonWriter writer(text, err);
            if (!writer.write(value, 0, "$")) {
                return false;
            }
            break;
        }
        case Format::Csv:
            if (!write_csv(value, options, text, err)) {
                return false;
            }
            break;
        case Format::Text:
            if (value.is_text()) {
                text = value.as_text();
            } else if (!render_scalar(value, text, err, "$")) {
                return false;
            }
            break;
        case Format::Binary:
            if (!value.is_text()) {
                err.set(ErrorKind::MalformedValue, "Binary snapshots take raw bytes, not a structured value");
                return false;
            }
            text = value.as_text();
            break;
    }
    out = std::move(text);
    return true;
}

} // namespace core
