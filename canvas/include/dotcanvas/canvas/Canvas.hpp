#ifndef DOTCANVAS_CANVAS_HPP
#define DOTCANVAS_CANVAS_HPP

#include <dotcanvas/canvas/Braille.hpp>
#include <dotcanvas/canvas/Point.hpp>
#include <dotcanvas/canvas/Rasterizer.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dc {

/**
 * @brief unbounded, sparse pixel canvas rendered with Unicode braille characters.
 *
 * Every terminal cell covers 2x4 pixels and stores them as an 8-bit dot mask (see braille::dotNum).
 * Only cells with at least one pixel set are stored; the rendered frame spans the bounding box of
 * those cells, so the canvas grows with whatever is drawn and needs no size up-front.
 *
 * Not thread-safe: concurrent writers need external synchronisation.
 */
template<class Allocator = std::allocator<char>>
class BasicCanvas {
    template<typename T>
    using RebindAlloc = typename std::allocator_traits<Allocator>::template rebind_alloc<T>;
    using CellMap     = std::unordered_map<CellPosition, std::uint8_t, PointHash, std::equal_to<CellPosition>, RebindAlloc<std::pair<const CellPosition, std::uint8_t>>>;

    CellMap _cells; // invariant: no zero masks

public:
    BasicCanvas() = default;
    explicit BasicCanvas(const Allocator& alloc) : _cells(0UZ, PointHash{}, std::equal_to<CellPosition>{}, RebindAlloc<std::pair<const CellPosition, std::uint8_t>>(alloc)) {}

    bool operator==(const BasicCanvas&) const = default;

    void set(std::size_t x, std::size_t y) {
        auto& m = _cells[braille::cellOf(x, y)];
        m       = static_cast<std::uint8_t>(m | braille::bitForPixel(x, y));
    }

    void unset(std::size_t x, std::size_t y) {
        auto it = _cells.find(braille::cellOf(x, y));
        if (it == _cells.end()) {
            return;
        }
        it->second = static_cast<std::uint8_t>(it->second & ~braille::bitForPixel(x, y));
        if (it->second == 0U) {
            _cells.erase(it);
        }
    }

    void toggle(std::size_t x, std::size_t y) {
        auto [it, inserted] = _cells.try_emplace(braille::cellOf(x, y), std::uint8_t{0U});
        it->second          = static_cast<std::uint8_t>(it->second ^ braille::bitForPixel(x, y));
        if (it->second == 0U) {
            _cells.erase(it);
        }
    }

    [[nodiscard]] bool get(std::size_t x, std::size_t y) const noexcept { return (mask(braille::cellOf(x, y)) & braille::bitForPixel(x, y)) != 0U; }

    void               set(PixelPosition p) { set(p.x, p.y); }
    void               unset(PixelPosition p) { unset(p.x, p.y); }
    void               toggle(PixelPosition p) { toggle(p.x, p.y); }
    [[nodiscard]] bool get(PixelPosition p) const noexcept { return get(p.x, p.y); }

    /// dot mask of the cell at (column, row), 0 for cells that were never drawn
    [[nodiscard]] std::uint8_t mask(CellPosition cell) const noexcept {
        const auto it = _cells.find(cell);
        return it == _cells.end() ? std::uint8_t{0U} : it->second;
    }

    [[nodiscard]] std::size_t cellCount() const noexcept { return _cells.size(); }
    [[nodiscard]] bool        empty() const noexcept { return _cells.empty(); }

    void clear() noexcept { _cells.clear(); }

    /// inclusive range of occupied cell rows (pixel y / 4); {0, 0} for an empty canvas
    [[nodiscard]] Range<std::size_t> rowRange() const noexcept {
        return cellRange([](const CellPosition& c) { return c.y; });
    }

    /// inclusive range of occupied cell columns (pixel x / 2); {0, 0} for an empty canvas
    [[nodiscard]] Range<std::size_t> colRange() const noexcept {
        return cellRange([](const CellPosition& c) { return c.x; });
    }

    /**
     * @brief the occupied bounding box, one string per cell row.
     *
     * Cells inside the box without any pixel render as the blank braille pattern U+2800, so all rows
     * have the same number of characters. An empty canvas has no rows.
     */
    [[nodiscard]] std::vector<std::string> rows() const {
        std::vector<std::string> result;
        if (empty()) {
            return result;
        }
        const auto rowSpan = rowRange();
        const auto colSpan = colRange();
        result.reserve(rowSpan.span());
        for (std::size_t row = rowSpan.min; row <= rowSpan.max; ++row) {
            std::string line;
            appendRow(line, row, colSpan);
            result.push_back(std::move(line));
        }
        return result;
    }

    /// rows() joined by '\n' without trailing newline; "" for an empty canvas
    template<class Dest = std::string>
    [[nodiscard]] Dest frame(Dest data = {}) const {
        data.clear();
        if (empty()) {
            return data;
        }
        const auto rowSpan = rowRange();
        const auto colSpan = colRange();
        data.reserve(rowSpan.span() * (colSpan.span() * 3UZ + 1UZ));
        for (std::size_t row = rowSpan.min; row <= rowSpan.max; ++row) {
            if (row != rowSpan.min) {
                data.push_back('\n');
            }
            appendRow(data, row, colSpan);
        }
        return data;
    }

    // shapes accept coordinates up to maxPixelCoordinate and throw dc::exception beyond it; single pixels are unbounded
    void line(std::size_t x1, std::size_t y1, std::size_t x2, std::size_t y2) { raster::line(*this, {x1, y1}, {x2, y2}); }
    void line(PixelPosition from, PixelPosition to) { raster::line(*this, from, to); }
    void rectangle(std::size_t x1, std::size_t y1, std::size_t x2, std::size_t y2) { raster::rectangle(*this, {x1, y1}, {x2, y2}); }
    void ellipseCentre(std::size_t xm, std::size_t ym, std::size_t a, std::size_t b) { raster::ellipseCentre(*this, {xm, ym}, a, b); }
    void ellipseBox(std::size_t x1, std::size_t y1, std::size_t x2, std::size_t y2) { raster::ellipseBox(*this, {x1, y1}, {x2, y2}); }

private:
    template<typename Projection>
    [[nodiscard]] Range<std::size_t> cellRange(Projection&& proj) const noexcept {
        if (_cells.empty()) {
            return {0UZ, 0UZ};
        }
        const auto [minIt, maxIt] = std::ranges::minmax_element(_cells, std::less<>{}, [&proj](const auto& kv) { return proj(kv.first); });
        return {proj(minIt->first), proj(maxIt->first)};
    }

    template<class Dest>
    void appendRow(Dest& out, std::size_t row, Range<std::size_t> colSpan) const {
        for (std::size_t col = colSpan.min; col <= colSpan.max; ++col) {
            braille::appendUtf8(out, mask({col, row}));
        }
    }
};

using Canvas = BasicCanvas<>;

template<class T>
struct isCanvas : std::false_type {};
template<class A>
struct isCanvas<BasicCanvas<A>> : std::true_type {};

template<class T>
concept CanvasLike = isCanvas<std::remove_cvref_t<T>>::value;

static_assert(PixelSink<Canvas>);

} // namespace dc

template<dc::CanvasLike TCanvas, typename CharT>
struct std::formatter<TCanvas, CharT> {
    constexpr auto parse(std::basic_format_parse_context<CharT>& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const TCanvas& canvas, FormatContext& ctx) const {
        const std::string frame = canvas.frame();
        return std::copy(frame.begin(), frame.end(), ctx.out());
    }
};

#endif // DOTCANVAS_CANVAS_HPP
