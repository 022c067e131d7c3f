#ifndef DOTCANVAS_FORMATTER_HPP
#define DOTCANVAS_FORMATTER_HPP

#include <chrono>
#include <concepts>
#include <format>
#include <ostream>
#include <ranges>
#include <source_location>
#include <string>
#include <string_view>

namespace dc {
namespace time {
[[nodiscard]] inline std::string getIsoTime(std::chrono::system_clock::time_point timePoint = std::chrono::system_clock::now()) noexcept {
    const auto secs = std::chrono::time_point_cast<std::chrono::seconds>(timePoint);
    const auto ms   = std::chrono::duration_cast<std::chrono::milliseconds>(timePoint - secs).count();
    return std::format("{:%Y-%m-%dT%H:%M:%S}.{:03}", secs, ms); // ms-precision ISO time-format
}
} // namespace time

template<std::ranges::input_range R>
requires std::formattable<std::ranges::range_value_t<R>, char>
std::string join(const R& range, std::string_view sep = ", ") {
    std::string out;
    auto        it  = std::ranges::begin(range);
    const auto  end = std::ranges::end(range);
    if (it != end) {
        out += std::format("{}", *it);
        while (++it != end) {
            out += std::format("{}{}", sep, *it);
        }
    }
    return out;
}
} // namespace dc

template<>
struct std::formatter<std::source_location, char> {
    char presentation = 's';

    constexpr auto parse(std::format_parse_context& ctx) {
        auto it = ctx.begin(), end = ctx.end();
        if (it != end && (*it == 's' || *it == 'f' || *it == 't')) {
            presentation = *it++;
        }
        if (it != end && *it != '}') {
            throw std::format_error("invalid format specifier for source_location");
        }
        return it;
    }

    template<typename FormatContext>
    auto format(const std::source_location& loc, FormatContext& ctx) const {
        switch (presentation) {
        case 's': return std::format_to(ctx.out(), "{}", loc.file_name());
        case 't': return std::format_to(ctx.out(), "{}:{}", loc.file_name(), loc.line());
        case 'f':
        default: return std::format_to(ctx.out(), "{}:{} in {}", loc.file_name(), loc.line(), loc.function_name());
        }
    }
};

// Range formatter

namespace dc {
template<typename T>
struct Range;
}

template<typename T>
struct std::formatter<dc::Range<T>> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const dc::Range<T>& range, FormatContext& ctx) const {
        return std::format_to(ctx.out(), "[min: {}, max: {}]", range.min, range.max);
    }
};

namespace dc {
template<typename T>
std::ostream& operator<<(std::ostream& os, const dc::Range<T>& v) {
    return os << std::format("{}", v);
}
} // namespace dc

#endif // DOTCANVAS_FORMATTER_HPP
