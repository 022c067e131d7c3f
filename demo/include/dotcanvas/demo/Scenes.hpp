#ifndef DOTCANVAS_DEMO_SCENES_HPP
#define DOTCANVAS_DEMO_SCENES_HPP

#include <dotcanvas/canvas/Canvas.hpp>
#include <dotcanvas/canvas/Turtle.hpp>
#include <dotcanvas/demo/Options.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <numbers>
#include <utility>

namespace dc::demo {

namespace detail {
[[nodiscard]] inline std::size_t scaled(std::size_t extent, double fraction) noexcept { return static_cast<std::size_t>(std::round(static_cast<double>(extent - 1UZ) * fraction)); }
} // namespace detail

/// right triangle with the right angle bottom-left
inline void drawTriangle(Canvas& canvas, std::size_t width, std::size_t height) {
    const std::size_t size = std::min(width, height);
    const std::size_t lo   = detail::scaled(size, 0.02);
    const std::size_t hi   = detail::scaled(size, 0.8);
    canvas.line(lo, lo, hi, hi);
    canvas.line(lo, hi, hi, hi);
    canvas.line(lo, lo, lo, hi);
}

/// frame around the drawable area with both diagonals
inline void drawRectangle(Canvas& canvas, std::size_t width, std::size_t height) {
    canvas.rectangle(0UZ, 0UZ, width - 1UZ, height - 1UZ);
    canvas.line(0UZ, 0UZ, width - 1UZ, height - 1UZ);
    canvas.line(0UZ, height - 1UZ, width - 1UZ, 0UZ);
}

/// ellipse inscribed into the drawable area plus a centred circle-ish inner ellipse
inline void drawEllipse(Canvas& canvas, std::size_t width, std::size_t height) {
    canvas.ellipseBox(0UZ, 0UZ, width - 1UZ, height - 1UZ);
    const std::size_t radius = std::min(width, height) / 4UZ;
    canvas.ellipseCentre(width / 2UZ, height / 2UZ, radius, radius);
}

/// two periods of a sine wave, drawn as a polyline
inline void drawSine(Canvas& canvas, std::size_t width, std::size_t height) {
    const double amplitude = static_cast<double>(height - 1UZ) / 2.0;
    const auto   yAt       = [&](std::size_t x) {
        const double phase = 4.0 * std::numbers::pi * static_cast<double>(x) / static_cast<double>(std::max(width - 1UZ, 1UZ));
        return static_cast<std::size_t>(std::round(amplitude - amplitude * std::sin(phase)));
    };

    for (std::size_t x = 0UZ; x + 1UZ < width; ++x) {
        canvas.line(x, yAt(x), x + 1UZ, yAt(x + 1UZ));
    }
    if (width == 1UZ) {
        canvas.set(0UZ, yAt(0UZ));
    }
}

/// inward spiral: 100 shrinking strides, turning 10 degrees after each
inline void drawTurtle(Canvas& canvas, std::size_t width, std::size_t height) {
    const double scale = static_cast<double>(std::min(width, height)) / 100.0;
    Turtle       turtle(static_cast<double>(width) / 2.0, 0.0, std::move(canvas));
    for (int n = 0; n < 100; ++n) {
        turtle.forward(scale * (10.0 - static_cast<double>(n) / 10.0));
        turtle.right(10.0);
    }
    canvas = std::move(turtle.canvas());
}

/// twelve rays from the centre, 30 degrees apart
inline void drawStar(Canvas& canvas, std::size_t width, std::size_t height) {
    const double        cx     = static_cast<double>(width - 1UZ) / 2.0;
    const double        cy     = static_cast<double>(height - 1UZ) / 2.0;
    const double        radius = static_cast<double>(std::min(width, height) - 1UZ) / 2.0;
    const PixelPosition centre{static_cast<std::size_t>(std::round(cx)), static_cast<std::size_t>(std::round(cy))};
    for (int angle = 0; angle < 360; angle += 30) {
        const double rad = angle * std::numbers::pi / 180.0;
        if (auto tip = toPixel(cx + radius * std::cos(rad), cy + radius * std::sin(rad))) {
            canvas.line(centre, *tip);
        }
    }
}

/// renders 'scene' into 'canvas' for a drawable area of width x height pixels (both > 0)
inline void drawScene(Scene scene, Canvas& canvas, std::size_t width, std::size_t height) {
    switch (scene) {
    case Scene::Triangle: drawTriangle(canvas, width, height); return;
    case Scene::Rectangle: drawRectangle(canvas, width, height); return;
    case Scene::Ellipse: drawEllipse(canvas, width, height); return;
    case Scene::Sine: drawSine(canvas, width, height); return;
    case Scene::Turtle: drawTurtle(canvas, width, height); return;
    case Scene::Star: drawStar(canvas, width, height); return;
    }
}

} // namespace dc::demo

#endif // DOTCANVAS_DEMO_SCENES_HPP
