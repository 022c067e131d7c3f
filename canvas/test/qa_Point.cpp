#include <boost/ut.hpp>

#include <dotcanvas/canvas/Point.hpp>

#include <cmath>
#include <cstdint>
#include <format>
#include <limits>
#include <source_location>
#include <sstream>
#include <string>
#include <type_traits>
#include <unordered_set>

using namespace boost::ut;
using namespace dc;
using namespace std::string_literals;

const suite<"Point"> pointSuite = [] {
    "defaults"_test = [] {
        constexpr PixelPosition undefined{};
        static_assert(undefined.x == PixelPosition::invalid_position && undefined.y == PixelPosition::invalid_position);
        expect(eq(undefined.x, std::numeric_limits<std::size_t>::max()));
        static_assert(std::is_same_v<Point<int>::value_type, int>);
    };

    "chebyshevNorm"_test = [] {
        static_assert(chebyshevNorm(PixelPosition{2, 7}, PixelPosition{5, 1}) == 6UZ);
        static_assert(chebyshevNorm(PixelPosition{5, 1}, PixelPosition{2, 7}) == 6UZ);
        static_assert(chebyshevNorm(Point<int>{-3, 2}) == 3);
        static_assert(chebyshevNorm(PixelPosition{4, 4}, PixelPosition{4, 4}) == 0UZ);
    };

    "ordering and hashing"_test = [] {
        expect(PixelPosition{1, 5} < PixelPosition{2, 0}) << "x is compared first";
        expect(PixelPosition{1, 5} > PixelPosition{1, 4});

        std::unordered_set<CellPosition, PointHash> cells;
        for (std::size_t x = 0UZ; x < 16UZ; ++x) {
            for (std::size_t y = 0UZ; y < 16UZ; ++y) {
                cells.insert({x, y});
            }
        }
        cells.insert({3, 4});
        expect(eq(cells.size(), 256UZ));
        expect(PointHash{}(CellPosition{3, 4}) != PointHash{}(CellPosition{4, 3}));
    };

    "formatting"_test = [] {
        expect(eq(std::format("{}", PixelPosition{3, 4}), "(3,4)"s));
        expect(eq(std::format("{:.1f}", Point<double>{1.26, -2.0}), "(1.3,-2.0)"s));
        expect(eq(std::format("{:>3}", Point<int>{7, 12}), "(  7, 12)"s));

        std::ostringstream os;
        os << Point<int>{-1, 2};
        expect(eq(os.str(), "(-1,2)"s));
    };

    "Range"_test = [] {
        constexpr Range<std::size_t> r{2, 5};
        static_assert(r.span() == 4UZ);
        static_assert(Range<std::size_t>{0, 0}.span() == 1UZ);
        expect(eq(std::format("{}", r), "[min: 2, max: 5]"s));
        expect(Range<std::size_t>{1, 3} < Range<std::size_t>{2, 0});
    };
};

const suite<"toPixel"> toPixelSuite = [] {
    "unsigned input passes through"_test = [] {
        const auto p = toPixel(3UZ, 9UZ);
        expect(p.has_value() and eq(*p, PixelPosition{3, 9}));
    };

    "signed input"_test = [] {
        expect(eq(toPixel(0, 12).value(), PixelPosition{0, 12}));

        const auto negative = toPixel(-1, 4);
        expect(!negative.has_value());
        expect(negative.error().message.contains("negative")) << negative.error().message;

        expect(!toPixel(std::int64_t{5}, std::int64_t{-5}).has_value());
    };

    "floating-point input"_test = [] {
        expect(eq(toPixel(2.5, 0.4).value(), PixelPosition{3, 0})) << "half away from zero";
        expect(eq(toPixel(-0.4, 7.6).value(), PixelPosition{0, 8})) << "rounds to zero before the sign check";
        expect(eq(toPixel(10.0f, 1.49f).value(), PixelPosition{10, 1}));

        expect(!toPixel(-0.6, 1.0).has_value());
        expect(!toPixel(std::nan(""), 1.0).has_value());
        expect(!toPixel(1.0, std::numeric_limits<double>::infinity()).has_value());
        expect(!toPixel(1e30, 1.0).has_value());

        const auto huge = toPixel(1e30, 1.0);
        expect(huge.error().message.contains("exceeds")) << huge.error().message;

        const auto nonFinite = toPixel(std::nan(""), 0.0);
        expect(nonFinite.error().message.contains("non-finite")) << nonFinite.error().message;
    };

    "coordinate upper bound"_test = [] {
        expect(eq(toPixel(maxPixelCoordinate, 0UZ).value(), PixelPosition{maxPixelCoordinate, 0}));
        expect(!toPixel(maxPixelCoordinate + 1UZ, 0UZ).has_value());
        expect(!toPixel(0UZ, std::numeric_limits<std::size_t>::max()).has_value());
        expect(!toPixel(std::int64_t{1} << 40U, std::int64_t{0}).has_value());

        expect(eq(toPixel(2147483647.4, 0.0).value(), PixelPosition{maxPixelCoordinate, 0}));
        expect(!toPixel(2147483647.5, 0.0).has_value()) << "rounds to 2^31";
        expect(!toPixel(0.0, 1e20).has_value());
        expect(!toPixel(0.0f, 3e9f).has_value());
    };

    "errors carry the call site"_test = [] {
        const auto result = toPixel(-3, -3);
        expect(!result.has_value());
        expect(eq(std::string(result.error().sourceLocation.file_name()), std::string(std::source_location::current().file_name())));
    };
};

int main() { /* not needed for UT */ }
