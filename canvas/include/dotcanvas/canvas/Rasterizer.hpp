#ifndef DOTCANVAS_RASTERIZER_HPP
#define DOTCANVAS_RASTERIZER_HPP

#include <dotcanvas/Error.hpp>
#include <dotcanvas/canvas/Point.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <format>
#include <source_location>
#include <vector>

namespace dc {

/// anything pixels can be switched on in, e.g. dc::Canvas or a recording sink in tests
template<typename T>
concept PixelSink = requires(T& sink, std::size_t x, std::size_t y) { sink.set(x, y); };

namespace raster {

/// largest half-axis accepted by ellipseCentre: the midpoint error terms stay below 2^61
inline constexpr std::size_t maxEllipseRadius = (1UZ << 19U) - 1UZ;

namespace detail {
inline void checkCoordinate(PixelPosition p, std::source_location location = std::source_location::current()) {
    if (p.x > maxPixelCoordinate || p.y > maxPixelCoordinate) {
        throw dc::exception(std::format("pixel {} exceeds the rasteriser range [0, {}]", p, maxPixelCoordinate), location);
    }
}

[[nodiscard]] constexpr std::int64_t floorDiv(std::int64_t num, std::int64_t den) noexcept { // den > 0
    const std::int64_t q = num / den;
    return (num % den != 0 && num < 0) ? q - 1 : q;
}

/// round(step * delta / steps), ties towards +infinity: floor((2 * step * delta + steps) / (2 * steps))
[[nodiscard]] constexpr std::int64_t interpolate(std::int64_t step, std::int64_t delta, std::int64_t steps) noexcept { return floorDiv(2 * step * delta + steps, 2 * steps); }

template<PixelSink Sink>
constexpr void plot(Sink& sink, std::int64_t x, std::int64_t y) {
    if (x < 0 || y < 0) {
        return;
    }
    sink.set(static_cast<std::size_t>(x), static_cast<std::size_t>(y));
}
} // namespace detail

/**
 * @brief visits the pixels of the straight segment [from, to] in drawing order.
 *
 * The segment has max(|dx|, |dy|) + 1 pixels; pixel s is (x1 + round(s*dx/steps), y1 + round(s*dy/steps))
 * with exact integer arithmetic and ties rounded towards +infinity. Since floor(v + 1/2) commutes with
 * integer shifts, the reversed segment visits the same pixel set.
 *
 * Throws dc::exception if an endpoint coordinate exceeds maxPixelCoordinate.
 */
template<typename Fn>
void forEachLinePoint(PixelPosition from, PixelPosition to, Fn&& fn) {
    detail::checkCoordinate(from);
    detail::checkCoordinate(to);

    const auto x1    = static_cast<std::int64_t>(from.x);
    const auto y1    = static_cast<std::int64_t>(from.y);
    const auto dx    = static_cast<std::int64_t>(to.x) - x1;
    const auto dy    = static_cast<std::int64_t>(to.y) - y1;
    const auto steps = std::max(dx < 0 ? -dx : dx, dy < 0 ? -dy : dy);

    if (steps == 0) {
        fn(from);
        return;
    }

    for (std::int64_t s = 0; s <= steps; ++s) {
        fn(PixelPosition{static_cast<std::size_t>(x1 + detail::interpolate(s, dx, steps)), static_cast<std::size_t>(y1 + detail::interpolate(s, dy, steps))});
    }
}

[[nodiscard]] inline std::vector<PixelPosition> linePoints(PixelPosition from, PixelPosition to) {
    std::vector<PixelPosition> points;
    points.reserve(chebyshevNorm(from, to) + 1UZ);
    forEachLinePoint(from, to, [&points](PixelPosition p) { points.push_back(p); });
    return points;
}

template<PixelSink Sink>
void line(Sink& sink, PixelPosition from, PixelPosition to) {
    forEachLinePoint(from, to, [&sink](PixelPosition p) { sink.set(p.x, p.y); });
}

template<PixelSink Sink>
void rectangle(Sink& sink, PixelPosition p1, PixelPosition p2) {
    line(sink, {p1.x, p1.y}, {p2.x, p1.y}); // top
    line(sink, {p1.x, p1.y}, {p1.x, p2.y}); // left
    line(sink, {p1.x, p2.y}, {p2.x, p2.y}); // bottom
    line(sink, {p2.x, p1.y}, {p2.x, p2.y}); // right
}

/**
 * @brief midpoint ellipse outline around 'centre' with horizontal half-axis 'a' and vertical half-axis 'b'.
 *
 * Points mirrored into negative coordinates are skipped, so ellipses clipped by the top or left canvas
 * edge are drawn partially. Throws dc::exception for a centre beyond maxPixelCoordinate or a half-axis
 * beyond maxEllipseRadius.
 */
template<PixelSink Sink>
void ellipseCentre(Sink& sink, PixelPosition centre, std::size_t a, std::size_t b) {
    detail::checkCoordinate(centre);
    if (a > maxEllipseRadius || b > maxEllipseRadius) {
        throw dc::exception(std::format("ellipse half-axes ({}, {}) exceed {}", a, b, maxEllipseRadius));
    }

    const auto         xm  = static_cast<std::int64_t>(centre.x);
    const auto         ym  = static_cast<std::int64_t>(centre.y);
    const auto         a2  = static_cast<std::int64_t>(a) * static_cast<std::int64_t>(a);
    const auto         b2  = static_cast<std::int64_t>(b) * static_cast<std::int64_t>(b);
    std::int64_t       x   = -static_cast<std::int64_t>(a); // quadrant II, walking from the left tip towards the top
    std::int64_t       y   = 0;
    std::int64_t       err = x * (2 * b2 + x) + b2;

    do {
        detail::plot(sink, xm - x, ym + y);
        detail::plot(sink, xm + x, ym + y);
        detail::plot(sink, xm + x, ym - y);
        detail::plot(sink, xm - x, ym - y);

        const std::int64_t e2 = 2 * err;
        if (e2 >= (x * 2 + 1) * b2) {
            ++x;
            err += (x * 2 + 1) * b2;
        }
        if (e2 <= (y * 2 + 1) * a2) {
            ++y;
            err += (y * 2 + 1) * a2;
        }
    } while (x <= 0);

    while (y++ < static_cast<std::int64_t>(b)) { // flat ellipses: finish the vertical tips
        detail::plot(sink, xm, ym + y);
        detail::plot(sink, xm, ym - y);
    }
}

template<PixelSink Sink>
void ellipseBox(Sink& sink, PixelPosition p1, PixelPosition p2) {
    detail::checkCoordinate(p1);
    detail::checkCoordinate(p2);
    const std::int64_t deltaX = (static_cast<std::int64_t>(p1.x) - static_cast<std::int64_t>(p2.x)) / 2;
    const std::int64_t deltaY = (static_cast<std::int64_t>(p1.y) - static_cast<std::int64_t>(p2.y)) / 2;
    const PixelPosition centre{static_cast<std::size_t>(static_cast<std::int64_t>(p2.x) + deltaX), static_cast<std::size_t>(static_cast<std::int64_t>(p2.y) + deltaY)};
    ellipseCentre(sink, centre, static_cast<std::size_t>(deltaX < 0 ? -deltaX : deltaX), static_cast<std::size_t>(deltaY < 0 ? -deltaY : deltaY));
}

} // namespace raster
} // namespace dc

#endif // DOTCANVAS_RASTERIZER_HPP
