#ifndef DOTCANVAS_TURTLE_HPP
#define DOTCANVAS_TURTLE_HPP

#include <dotcanvas/canvas/Canvas.hpp>

#include <cmath>
#include <cstddef>
#include <numbers>
#include <optional>
#include <string>
#include <utility>

namespace dc {

/**
 * @brief turtle graphics on a braille canvas.
 *
 * The turtle starts with its brush down, facing +x. Since y grows downwards on screen, positive
 * rotation turns clockwise. Moving with the brush down draws a line between the rounded old and
 * new positions; coordinates left of or above the origin are clamped to 0. Segments with an end
 * beyond maxPixelCoordinate (or not finite) are not drawn, the turtle still moves there.
 */
template<class Allocator = std::allocator<char>>
class BasicTurtle {
    Point<double>          _position{0.0, 0.0};
    double                 _rotation = 0.0; // degrees
    bool                   _brush    = true;
    BasicCanvas<Allocator> _canvas{};

    [[nodiscard]] static std::optional<std::size_t> clampToPixel(double v) noexcept {
        if (!std::isfinite(v)) {
            return std::nullopt;
        }
        const double rounded = std::round(v);
        if (rounded <= 0.0) {
            return 0UZ;
        }
        if (rounded > static_cast<double>(maxPixelCoordinate)) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(rounded);
    }

public:
    explicit BasicTurtle(double x = 0.0, double y = 0.0) : _position{x, y} {}
    BasicTurtle(double x, double y, BasicCanvas<Allocator> canvas) : _position{x, y}, _canvas(std::move(canvas)) {}

    [[nodiscard]] Point<double> position() const noexcept { return _position; }
    [[nodiscard]] double        rotation() const noexcept { return _rotation; }
    [[nodiscard]] bool          isBrushDown() const noexcept { return _brush; }

    void up() noexcept { _brush = false; }
    void down() noexcept { _brush = true; }
    void toggle() noexcept { _brush = !_brush; }

    void right(double angle) noexcept { _rotation += angle; }
    void left(double angle) noexcept { _rotation -= angle; }

    void forward(double distance) {
        const double rad = _rotation * std::numbers::pi / 180.0;
        teleport(_position.x + std::cos(rad) * distance, _position.y + std::sin(rad) * distance);
    }

    void back(double distance) { forward(-distance); }

    void teleport(double x, double y) {
        if (_brush) {
            const auto x1 = clampToPixel(_position.x);
            const auto y1 = clampToPixel(_position.y);
            const auto x2 = clampToPixel(x);
            const auto y2 = clampToPixel(y);
            if (x1 && y1 && x2 && y2) {
                _canvas.line(*x1, *y1, *x2, *y2);
            }
        }
        _position = {x, y};
    }

    [[nodiscard]] const BasicCanvas<Allocator>& canvas() const noexcept { return _canvas; }
    [[nodiscard]] BasicCanvas<Allocator>&       canvas() noexcept { return _canvas; }

    [[nodiscard]] std::string frame() const { return _canvas.frame(); }
};

using Turtle = BasicTurtle<>;

} // namespace dc

#endif // DOTCANVAS_TURTLE_HPP
