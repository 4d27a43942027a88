#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>

namespace util {

// Software CRC32C (Castagnoli), table-driven, deterministic across platforms.
// Used to detect truncated or hand-edited pending artifacts.
namespace detail {

// Reflected Castagnoli polynomial
constexpr std::uint32_t crc32c_poly = 0x82F63B78u;

constexpr std::array<std::uint32_t, 256> make_crc32c_table() noexcept {
    std::array<std::uint32_t, 256> table{};
    for (std::uint32_t i = 0; i < 256; ++i) {
        std::uint32_t c = i;
        for (int k = 0; k < 8; ++k) {
            c = (c & 1u) ? (crc32c_poly ^ (c >> 1)) : (c >> 1);
        }
        table[i] = c;
    }
    return table;
}

inline constexpr auto crc32c_table = make_crc32c_table();

} // namespace detail

class Crc32c {
public:
    static constexpr std::uint32_t initial = 0xFFFFFFFFu;
    static constexpr std::uint32_t xor_out = 0xFFFFFFFFu;

    static constexpr std::uint32_t update(std::uint32_t crc, std::string_view data) noexcept {
        std::uint32_t c = crc;
        for (char ch : data) {
            const auto idx = static_cast<std::uint8_t>((c ^ static_cast<std::uint8_t>(ch)) & 0xFFu);
            c = (c >> 8) ^ detail::crc32c_table[idx];
        }
        return c;
    }

    static constexpr std::uint32_t compute(std::string_view data) noexcept {
        return finalize(update(initial, data));
    }

    static constexpr std::uint32_t finalize(std::uint32_t crc) noexcept { return crc ^ xor_out; }
};

// Fixed-width lowercase hex, e.g. "e3069283".
inline std::string crc32c_hex(std::uint32_t crc) {
    char buf[9]{};
    std::snprintf(buf, sizeof(buf), "%08x", crc);
    return std::string(buf, 8);
}

static_assert(Crc32c::compute("123456789") == 0xE3069283u, "CRC32C check value");

} // namespace util
