#ifndef DOTCANVAS_ERROR_HPP
#define DOTCANVAS_ERROR_HPP

#include <dotcanvas/meta/formatter.hpp>

#include <exception>
#include <expected>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

#include <fmt/format.h>

namespace dc {

/// thrown when a drawing request leaves the representable coordinate range
struct exception : public std::exception {
    std::string          message;
    std::source_location sourceLocation;

    exception(std::string_view msg = "unknown exception", std::source_location location = std::source_location::current()) noexcept : message(msg), sourceLocation(location) {}

    [[nodiscard]] const char* what() const noexcept override {
        if (formattedMessage.empty()) {
            formattedMessage = fmt::format("{} at {}:{}", message, sourceLocation.file_name(), sourceLocation.line());
        }
        return formattedMessage.c_str();
    }

private:
    mutable std::string formattedMessage;
};

/// error value of the std::expected boundaries (coordinate conversion, option parsing)
struct Error {
    std::string          message;
    std::source_location sourceLocation;

    Error(std::string_view msg = "unknown error", std::source_location location = std::source_location::current()) noexcept : message(msg), sourceLocation(location) {}

    explicit Error(const dc::exception& ex) noexcept : Error(ex.message, ex.sourceLocation) {}
};

static_assert(std::is_default_constructible_v<Error>);
static_assert(!std::is_trivially_copyable_v<Error>); // because of the usage of std::string

} // namespace dc

template<>
struct std::formatter<dc::Error> {
    constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const dc::Error& err, FormatContext& ctx) const {
        return std::format_to(ctx.out(), "{} ({:t})", err.message, err.sourceLocation);
    }
};

#endif // DOTCANVAS_ERROR_HPP
