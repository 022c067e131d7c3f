#ifndef DOTCANVAS_POINT_HPP
#define DOTCANVAS_POINT_HPP

#include <dotcanvas/Error.hpp>
#include <dotcanvas/meta/formatter.hpp>

#include <algorithm>
#include <cmath>
#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <format>
#include <functional>
#include <limits>
#include <ostream>
#include <source_location>
#include <type_traits>

namespace dc {

template<typename T>
concept arithmetic = std::is_arithmetic_v<T> && !std::same_as<T, bool>;

template<arithmetic T = std::size_t>
struct Point {
    using value_type                    = T;
    constexpr static T invalid_position = std::numeric_limits<T>::max();
    T                  x                = invalid_position;
    T                  y                = invalid_position;

    constexpr auto operator<=>(const Point&) const = default;
};

using PixelPosition = Point<std::size_t>; ///< (x, y) in pixels, origin top-left
using CellPosition  = Point<std::size_t>; ///< (column, row) in terminal cells

/// largest coordinate accepted by the shape rasterisers: 2 * max^2 + max still fits into std::int64_t
inline constexpr std::size_t maxPixelCoordinate = (1UZ << 31U) - 1UZ;

/// inclusive [min, max] interval
template<typename T>
struct Range {
    T min{};
    T max{};

    constexpr auto operator<=>(const Range&) const = default;

    [[nodiscard]] constexpr T span() const noexcept { return max - min + T{1}; }
};

template<arithmetic T>
[[nodiscard]] constexpr T chebyshevNorm(Point<T> p1, Point<T> p2 = {0, 0}) noexcept {
    const T dx = p1.x > p2.x ? p1.x - p2.x : p2.x - p1.x;
    const T dy = p1.y > p2.y ? p1.y - p2.y : p2.y - p1.y;
    return std::max(dx, dy);
}

struct PointHash {
    template<arithmetic T>
    [[nodiscard]] std::size_t operator()(const Point<T>& p) const noexcept {
        const std::size_t hx = std::hash<T>{}(p.x);
        const std::size_t hy = std::hash<T>{}(p.y);
        return hx ^ (hy + 0x9E3779B97F4A7C15ULL + (hx << 6U) + (hx >> 2U));
    }
};

/**
 * @brief converts a signed or floating-point coordinate pair into a pixel position.
 *
 * Floating-point values are rounded half away from zero. Negative results, non-finite input and
 * coordinates beyond maxPixelCoordinate are rejected; this is the boundary at which user-supplied
 * coordinates enter the (unsigned) canvas.
 */
template<arithmetic T>
[[nodiscard]] std::expected<PixelPosition, Error> toPixel(T x, T y, std::source_location location = std::source_location::current()) {
    constexpr auto outOfRange = [](auto v) { return v >= static_cast<decltype(v)>(maxPixelCoordinate + 1UZ); }; // 2^31 is exact in float and double

    if constexpr (std::is_floating_point_v<T>) {
        if (!std::isfinite(x) || !std::isfinite(y)) {
            return std::unexpected(Error(std::format("non-finite pixel coordinate ({}, {})", x, y), location));
        }
        const T rx = std::round(x);
        const T ry = std::round(y);
        if (rx < T(0) || ry < T(0)) {
            return std::unexpected(Error(std::format("negative pixel coordinate ({}, {})", x, y), location));
        }
        if (outOfRange(rx) || outOfRange(ry)) {
            return std::unexpected(Error(std::format("pixel coordinate ({}, {}) exceeds {}", x, y, maxPixelCoordinate), location));
        }
        return PixelPosition{static_cast<std::size_t>(rx), static_cast<std::size_t>(ry)};
    } else {
        if constexpr (std::is_signed_v<T>) {
            if (x < T(0) || y < T(0)) {
                return std::unexpected(Error(std::format("negative pixel coordinate ({}, {})", x, y), location));
            }
        }
        const auto ux = static_cast<std::size_t>(x);
        const auto uy = static_cast<std::size_t>(y);
        if (outOfRange(ux) || outOfRange(uy)) {
            return std::unexpected(Error(std::format("pixel coordinate ({}, {}) exceeds {}", x, y, maxPixelCoordinate), location));
        }
        return PixelPosition{ux, uy};
    }
}

template<arithmetic T>
std::ostream& operator<<(std::ostream& os, const Point<T>& p) {
    return os << '(' << p.x << ',' << p.y << ')';
}

} // namespace dc

template<dc::arithmetic T, typename CharT>
struct std::formatter<dc::Point<T>, CharT> {
    std::formatter<T, CharT> _spec;

    constexpr auto parse(std::basic_format_parse_context<CharT>& ctx) { return _spec.parse(ctx); }

    template<typename FormatContext>
    constexpr auto format(const dc::Point<T>& p, FormatContext& ctx) const {
        auto out = std::format_to(ctx.out(), "(");
        ctx.advance_to(out);
        out = _spec.format(p.x, ctx);
        out = std::format_to(out, ",");
        ctx.advance_to(out); // keep ctx/out in sync
        out = _spec.format(p.y, ctx);
        return std::format_to(out, ")");
    }
};

#endif // DOTCANVAS_POINT_HPP
