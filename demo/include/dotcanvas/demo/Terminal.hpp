#ifndef DOTCANVAS_DEMO_TERMINAL_HPP
#define DOTCANVAS_DEMO_TERMINAL_HPP

#include <dotcanvas/canvas/Braille.hpp>

#include <charconv>
#include <cstddef>
#include <cstdlib>
#include <optional>
#include <string_view>

#ifndef _WIN32
#include <sys/ioctl.h>
#include <unistd.h>
#endif

namespace dc::demo {

struct TerminalSize {
    std::size_t columns = 80UZ;
    std::size_t rows    = 24UZ;

    constexpr auto operator<=>(const TerminalSize&) const = default;

    /// drawable area in pixels; the last row is kept free for the shell prompt
    [[nodiscard]] constexpr std::size_t pixelWidth() const noexcept { return columns * braille::cellWidth; }
    [[nodiscard]] constexpr std::size_t pixelHeight() const noexcept { return (rows > 1UZ ? rows - 1UZ : 1UZ) * braille::cellHeight; }
};

namespace detail {
[[nodiscard]] inline std::optional<std::size_t> parsePositive(std::string_view text) noexcept {
    std::size_t value = 0UZ;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0UZ) {
        return std::nullopt;
    }
    return value;
}

[[nodiscard]] inline std::optional<std::size_t> positiveFromEnv(const char* name) noexcept {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return parsePositive(value);
}
} // namespace detail

/// size of the terminal attached to 'fd', if any
[[nodiscard]] inline std::optional<TerminalSize> queryTerminalSize([[maybe_unused]] int fd) noexcept {
#ifndef _WIN32
    auto ws = winsize{};
    if (::ioctl(fd, TIOCGWINSZ, &ws) != -1 && ws.ws_col > 0 && ws.ws_row > 0) {
        return TerminalSize{ws.ws_col, ws.ws_row};
    }
#endif
    return std::nullopt;
}

/// stdout terminal size, falling back to $COLUMNS/$LINES and finally to 80x24
[[nodiscard]] inline TerminalSize terminalSize() noexcept {
#ifndef _WIN32
    if (auto size = queryTerminalSize(STDOUT_FILENO)) {
        return *size;
    }
#endif
    TerminalSize size{};
    size.columns = detail::positiveFromEnv("COLUMNS").value_or(size.columns);
    size.rows    = detail::positiveFromEnv("LINES").value_or(size.rows);
    return size;
}

} // namespace dc::demo

#endif // DOTCANVAS_DEMO_TERMINAL_HPP
