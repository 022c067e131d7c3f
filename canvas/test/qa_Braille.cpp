#include <boost/ut.hpp>

#include <dotcanvas/canvas/Braille.hpp>

#include <cstdint>
#include <string>

using namespace boost::ut;
using namespace dc;

const suite<"braille::dot layout"> layoutSuite = [] {
    "dot numbering"_test = [] {
        // [row][column] -> braille dot 1..8
        expect(eq(braille::bitFor(0, 0), 0x01U)) << "dot 1";
        expect(eq(braille::bitFor(1, 0), 0x02U)) << "dot 2";
        expect(eq(braille::bitFor(2, 0), 0x04U)) << "dot 3";
        expect(eq(braille::bitFor(0, 1), 0x08U)) << "dot 4";
        expect(eq(braille::bitFor(1, 1), 0x10U)) << "dot 5";
        expect(eq(braille::bitFor(2, 1), 0x20U)) << "dot 6";
        expect(eq(braille::bitFor(3, 0), 0x40U)) << "dot 7";
        expect(eq(braille::bitFor(3, 1), 0x80U)) << "dot 8";

        static_assert(braille::bitFor(3, 0) == 0x40U);
        static_assert(braille::bitFor(0, 1) == 0x08U);
    };

    "pixel to bit"_test = [] {
        expect(eq(braille::bitForPixel(0, 0), 0x01U));
        expect(eq(braille::bitForPixel(1, 0), 0x08U));
        expect(eq(braille::bitForPixel(0, 3), 0x40U));
        expect(eq(braille::bitForPixel(1, 3), 0x80U));
        expect(eq(braille::bitForPixel(0, 2), 0x04U));
        expect(eq(braille::bitForPixel(1, 2), 0x20U));

        // repeats every 2 pixels horizontally and 4 vertically
        expect(eq(braille::bitForPixel(2, 4), 0x01U));
        expect(eq(braille::bitForPixel(13, 6), 0x20U));
        expect(eq(braille::bitForPixel(1'000'001, 4'000'003), 0x80U));
    };

    "pixel to cell"_test = [] {
        expect(eq(braille::cellOf(0, 0), CellPosition{0, 0}));
        expect(eq(braille::cellOf(1, 3), CellPosition{0, 0}));
        expect(eq(braille::cellOf(2, 2), CellPosition{1, 0}));
        expect(eq(braille::cellOf(10, 10), CellPosition{5, 2}));
        expect(eq(braille::cellOf(PixelPosition{7, 8}), CellPosition{3, 2}));

        static_assert(braille::cellWidth * braille::cellHeight == 8UZ);
    };
};

const suite<"braille::UTF-8"> utf8Suite = [] {
    using namespace std::string_literals;

    "glyph encoding"_test = [] {
        expect(eq(braille::utf8FromMask(0x00), "⠀"s)) << "blank pattern";
        expect(eq(braille::utf8FromMask(0x01), "⠁"s));
        expect(eq(braille::utf8FromMask(0x40), "⡀"s));
        expect(eq(braille::utf8FromMask(0xFF), "⣿"s)) << "all dots";
        expect(eq(braille::utf8FromMask(0x00), "\xE2\xA0\x80"s));
        expect(eq(braille::utf8FromMask(0xFF), "\xE2\xA3\xBF"s));
    };

    "append keeps existing content"_test = [] {
        std::string out = "row:";
        braille::appendUtf8(out, 0x84);
        braille::appendUtf8(out, 0x19);
        expect(eq(out, "row:⢄⠙"s));
    };

    "decoding every pattern"_test = [] {
        for (unsigned m = 0U; m < 256U; ++m) {
            const auto mask    = static_cast<std::uint8_t>(m);
            const auto decoded = braille::maskFromUtf8(braille::utf8FromMask(mask));
            expect(decoded.has_value() and eq(decoded.value_or(0U), mask)) << "mask" << m;
        }
    };

    "decoding rejects non-braille input"_test = [] {
        expect(!braille::maskFromUtf8(""));
        expect(!braille::maskFromUtf8("ab"));           // too short
        expect(!braille::maskFromUtf8("abcd"));         // too long
        expect(!braille::maskFromUtf8("\xE0\xA0\x80")); // wrong lead byte
        expect(!braille::maskFromUtf8("\xE2\xA4\x80")); // U+2900, past the braille block
        expect(!braille::maskFromUtf8("\xE2\x9F\xBF")); // U+27FF, before the braille block
        expect(!braille::maskFromUtf8("\xE2\xA0\x20")); // broken continuation byte
        expect(!braille::maskFromUtf8("█"));       // full block
    };
};

int main() { /* not needed for UT */ }
