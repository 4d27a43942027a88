#include "core/json_reader.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <new>
#include <system_error>

namespace core {
namespace {

constexpr std::size_t kMaxDepth = 512;

class JsonCursor {
public:
    explicit JsonCursor(std::string_view s) : src_(s) {}

    void skip_ws() noexcept {
        while (pos_ < src_.size() && (src_[pos_] == ' ' || src_[pos_] == '\t' ||
                                      src_[pos_] == '\n' || src_[pos_] == '\r')) {
            ++pos_;
        }
    }

    bool consume(char c) noexcept {
        skip_ws();
        if (pos_ < src_.size() && src_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool eof() noexcept {
        skip_ws();
        return pos_ >= src_.size();
    }

    bool parse_value(Value& out, std::size_t depth) {
        if (depth > kMaxDepth) {
            return fail("Nesting too deep");
        }
        skip_ws();
        if (pos_ >= src_.size()) {
            return fail("Unexpected end of input");
        }
        const char c = src_[pos_];
        if (c == '{') {
            return parse_object(out, depth);
        }
        if (c == '[') {
            return parse_array(out, depth);
        }
        if (c == '"') {
            std::string s;
            if (!parse_string(s)) {
                return false;
            }
            out = Value::from_text(std::move(s));
            return true;
        }
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
            return parse_number(out);
        }
        if (parse_literal("true")) {
            out = Value::from_bool(true);
            return true;
        }
        if (parse_literal("false")) {
            out = Value::from_bool(false);
            return true;
        }
        if (parse_literal("null")) {
            out = Value::null();
            return true;
        }
        return fail("Unexpected character");
    }

    const std::string& error() const noexcept { return err_; }

private:
    bool fail(const std::string& msg) {
        err_ = msg + " at offset " + std::to_string(pos_);
        return false;
    }

    bool parse_literal(std::string_view literal) noexcept {
        if (src_.substr(pos_).compare(0, literal.size(), literal) == 0) {
            pos_ += literal.size();
            return true;
        }
        return false;
    }

    bool parse_object(Value& out, std::size_t depth) {
        ++pos_; // '{'
        Mapping entries;
        if (consume('}')) {
            out = Value::from_mapping(std::move(entries));
            return true;
        }
        while (true) {
            skip_ws();
            std::string key;
            if (!parse_string(key)) {
                return false;
            }
            if (!consume(':')) {
                return fail("Expected ':'");
            }
            Value v;
            if (!parse_value(v, depth + 1)) {
                return false;
            }
            entries.push_back(MapEntry{std::move(key), std::move(v)});
            if (consume('}')) {
                break;
            }
            if (!consume(',')) {
                return fail("Expected ',' or '}'");
            }
        }
        out = Value::from_mapping(std::move(entries));
        return true;
    }

    bool parse_array(Value& out, std::size_t depth) {
        ++pos_; // '['
        Sequence items;
        if (consume(']')) {
            out = Value::from_sequence(std::move(items));
            return true;
        }
        while (true) {
            Value v;
            if (!parse_value(v, depth + 1)) {
                return false;
            }
            items.push_back(std::move(v));
            if (consume(']')) {
                break;
            }
            if (!consume(',')) {
                return fail("Expected ',' or ']'");
            }
        }
        out = Value::from_sequence(std::move(items));
        return true;
    }

    std::optional<std::uint32_t> parse_hex4() noexcept {
        if (pos_ + 4 > src_.size()) {
            return std::nullopt;
        }
        std::uint32_t cp = 0;
        const auto res = std::from_chars(src_.data() + pos_, src_.data() + pos_ + 4, cp, 16);
        if (res.ec != std::errc() || res.ptr != src_.data() + pos_ + 4) {
            return std::nullopt;
        }
        pos_ += 4;
        return cp;
    }

    static void append_utf8(std::string& out, std::uint32_t cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    bool parse_string(std::string& out) {
        if (pos_ >= src_.size() || src_[pos_] != '"') {
            return fail("Expected string");
        }
        ++pos_; // opening quote
        while (pos_ < src_.size()) {
            const char c = src_[pos_++];
            if (c == '"') {
                return true;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                return fail("Control character in string");
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= src_.size()) {
                return fail("Invalid escape");
            }
            const char esc = src_[pos_++];
            switch (esc) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    auto cp = parse_hex4();
                    if (!cp) {
                        return fail("Invalid \\u escape");
                    }
                    std::uint32_t code = *cp;
                    if (code >= 0xD800 && code <= 0xDBFF) {
                        if (!parse_literal("\\u")) {
                            return fail("Unpaired surrogate");
                        }
                        auto low = parse_hex4();
                        if (!low || *low < 0xDC00 || *low > 0xDFFF) {
                            return fail("Invalid low surrogate");
                        }
                        code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
                    } else if (code >= 0xDC00 && code <= 0xDFFF) {
                        return fail("Unpaired surrogate");
                    }
                    append_utf8(out, code);
                    break;
                }
                default:
                    return fail("Unsupported escape sequence");
            }
        }
        return fail("Unterminated string");
    }

    bool parse_number(Value& out) {
        const std::size_t start = pos_;
        bool is_float = false;
        if (src_[pos_] == '-') {
            ++pos_;
        }
        const std::size_t int_start = pos_;
        while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
            ++pos_;
        }
        if (pos_ == int_start) {
            return fail("Expected digits");
        }
        if (src_[int_start] == '0' && pos_ - int_start > 1) {
            return fail("Leading zero in number");
        }
        if (pos_ < src_.size() && src_[pos_] == '.') {
            is_float = true;
            ++pos_;
            const std::size_t frac_start = pos_;
            while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
                ++pos_;
            }
            if (pos_ == frac_start) {
                return fail("Expected fraction digits");
            }
        }
        if (pos_ < src_.size() && (src_[pos_] == 'e' || src_[pos_] == 'E')) {
            is_float = true;
            ++pos_;
            if (pos_ < src_.size() && (src_[pos_] == '+' || src_[pos_] == '-')) {
                ++pos_;
            }
            const std::size_t exp_start = pos_;
            while (pos_ < src_.size() && std::isdigit(static_cast<unsigned char>(src_[pos_]))) {
                ++pos_;
            }
            if (pos_ == exp_start) {
                return fail("Expected exponent digits");
            }
        }
        const char* begin = src_.data() + start;
        const char* end = src_.data() + pos_;
        if (is_float) {
            double d = 0.0;
            const auto res = std::from_chars(begin, end, d);
            if (res.ec != std::errc() || res.ptr != end) {
                return fail("Invalid number");
            }
            out = Value::from_float(d);
        } else {
            std::int64_t i = 0;
            const auto res = std::from_chars(begin, end, i);
            if (res.ec != std::errc() || res.ptr != end) {
                return fail("Integer out of range");
            }
            out = Value::from_int(i);
        }
        return true;
    }

    std::size_t pos_{0};
    std::string_view src_;
    std::string err_;
};

} // namespace

bool parse_json(std::string_view text, Value& out, std::string& error) noexcept {
    try {
        JsonCursor cur(text);
        Value v;
        if (!cur.parse_value(v, 0)) {
            error = cur.error();
            return false;
        }
        if (!cur.eof()) {
            error = "Trailing characters after JSON value";
            return false;
        }
        out = std::move(v);
        return true;
    } catch (const std::bad_alloc&) {
        error = "Out of memory while parsing JSON";
        return false;
    }
}

} // namespace core
