#include "persist/header_block.hpp"

#include <algorithm>

namespace persist {
namespace {

constexpr std::string_view kLinePrefix = "# ";
constexpr std::string_view kKeySep = ": ";

std::string escape_value(std::string_view v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        default: out += c;
        }
    }
    return out;
}

bool unescape_value(std::string_view v, std::string& out) {
    out.clear();
    for (std::size_t i = 0; i < v.size(); ++i) {
        if (v[i] != '\\') {
            out += v[i];
            continue;
        }
        if (++i >= v.size()) {
            return false;
        }
        switch (v[i]) {
        case '\\': out += '\\'; break;
        case 'n': out += '\n'; break;
        case 'r': out += '\r'; break;
        default: return false;
        }
    }
    return true;
}

bool valid_key(std::string_view k) noexcept {
    if (k.empty() || k.front() == '-' || k.back() == '-') {
        return false;
    }
    return std::all_of(k.begin(), k.end(), [](char c) { return (c >= 'a' && c <= 'z') || c == '-'; });
}

} // namespace

const std::string* HeaderBlock::find(std::string_view key) const noexcept {
    for (const auto& [k, v] : fields) {
        if (k == key) {
            return &v;
        }
    }
    return nullptr;
}

std::string render_header(const HeaderBlock& header) {
    std::string out = header.magic;
    out += '\n';
    for (const auto& [k, v] : header.fields) {
        out += kLinePrefix;
        out += k;
        out += kKeySep;
        out += escape_value(v);
        out += '\n';
    }
    out += '\n';
    return out;
}

bool parse_header(std::string_view text,
                  std::string_view expected_magic,
                  HeaderBlock& out,
                  std::size_t& body_offset,
                  std::string& err) {
    HeaderBlock hdr;
    std::size_t pos = 0;
    bool first = true;
    std::size_t line_no = 0;
    while (true) {
        const auto nl = text.find('\n', pos);
        if (nl == std::string_view::npos) {
            err = first ? "Missing header line" : "Header not terminated by a blank line";
            return false;
        }
        const std::string_view line = text.substr(pos, nl - pos);
        pos = nl + 1;
        ++line_no;
        if (first) {
            if (line != expected_magic) {
                err = "Unexpected first line, expected '" + std::string(expected_magic) + "'";
                return false;
            }
            hdr.magic = std::string(line);
            first = false;
            continue;
        }
        if (line.empty()) {
            break;
        }
        if (line.substr(0, kLinePrefix.size()) != kLinePrefix) {
            err = "Header line " + std::to_string(line_no) + " lacks '# ' prefix";
            return false;
        }
        const auto rest = line.substr(kLinePrefix.size());
        const auto sep = rest.find(kKeySep);
        if (sep == std::string_view::npos) {
            err = "Header line " + std::to_string(line_no) + " lacks ': '";
            return false;
        }
        const auto key = rest.substr(0, sep);
        if (!valid_key(key)) {
            err = "Invalid header key '" + std::string(key) + "'";
            return false;
        }
        if (hdr.find(key) != nullptr) {
            err = "Duplicate header key '" + std::string(key) + "'";
            return false;
        }
        std::string value;
        if (!unescape_value(rest.substr(sep + kKeySep.size()), value)) {
            err = "Bad escape in header key '" + std::string(key) + "'";
            return false;
        }
        hdr.add(std::string(key), std::move(value));
    }
    out = std::move(hdr);
    body_offset = pos;
    return true;
}

} // namespace persist
