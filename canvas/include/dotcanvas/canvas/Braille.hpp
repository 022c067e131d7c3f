#ifndef DOTCANVAS_BRAILLE_HPP
#define DOTCANVAS_BRAILLE_HPP

#include <dotcanvas/canvas/Point.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dc::braille {

inline constexpr char32_t    base       = 0x2800; // Braille range: U+2800 to U+28FF encoded as UTF-8: E2 A0 80 to E2 A3 BF
inline constexpr std::size_t cellWidth  = 2UZ;    // pixels per cell, horizontally
inline constexpr std::size_t cellHeight = 4UZ;    // pixels per cell, vertically

/// braille dot number (1..8) of the sub-pixel at [row][column]; dot n is bit (n - 1) of the cell mask
inline constexpr std::array<std::array<std::uint8_t, 2UZ>, 4UZ> dotNum{{{1, 4}, {2, 5}, {3, 6}, {7, 8}}};

[[nodiscard]] inline constexpr std::uint8_t bitFor(std::size_t row, std::size_t col) noexcept { return static_cast<std::uint8_t>(1U << (dotNum[row % cellHeight][col % cellWidth] - 1U)); }

[[nodiscard]] inline constexpr std::uint8_t bitForPixel(std::size_t x, std::size_t y) noexcept { return bitFor(y % cellHeight, x % cellWidth); }

[[nodiscard]] inline constexpr CellPosition cellOf(std::size_t x, std::size_t y) noexcept { return {x / cellWidth, y / cellHeight}; }
[[nodiscard]] inline constexpr CellPosition cellOf(PixelPosition p) noexcept { return cellOf(p.x, p.y); }

template<class Dest = std::string>
constexpr void appendUtf8(Dest& out, std::uint8_t mask) {
    const char32_t codePoint = base + mask;
    out.push_back(static_cast<char>(0xE0 | ((codePoint >> 12) & 0x0F)));
    out.push_back(static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (codePoint & 0x3F)));
}

[[nodiscard]] inline constexpr std::string utf8FromMask(std::uint8_t mask) {
    std::string out;
    appendUtf8(out, mask);
    return out;
}

[[nodiscard]] inline constexpr std::optional<std::uint8_t> maskFromUtf8(std::string_view s) {
    if (s.size() != 3UZ) {
        return std::nullopt;
    }
    if (static_cast<unsigned char>(s[0]) != 0xE2) {
        return std::nullopt;
    }
    const auto b1 = static_cast<unsigned char>(s[1]);
    const auto b2 = static_cast<unsigned char>(s[2]);
    if (b1 < 0xA0 || b1 > 0xA3) {
        return std::nullopt;
    }
    if ((b2 & 0xC0) != 0x80) { // not a continuation byte
        return std::nullopt;
    }

    const char32_t codePoint = static_cast<char32_t>(base + ((b1 - 0xA0U) * 64U) + (b2 & 0x3FU));
    return static_cast<std::uint8_t>(codePoint - base);
}

} // namespace dc::braille

#endif // DOTCANVAS_BRAILLE_HPP
