#ifndef DOTCANVAS_DEMO_OPTIONS_HPP
#define DOTCANVAS_DEMO_OPTIONS_HPP

#include <dotcanvas/Error.hpp>
#include <dotcanvas/canvas/Point.hpp>
#include <dotcanvas/demo/Terminal.hpp>
#include <dotcanvas/meta/formatter.hpp>

#include <cstddef>
#include <expected>
#include <format>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#ifdef __GNUC__
#pragma GCC diagnostic push // ignore warning of external libraries that from this lib-context we do not have any control over
#ifndef __clang__
#pragma GCC diagnostic ignored "-Wuseless-cast"
#endif
#pragma GCC diagnostic ignored "-Wsign-conversion"
#endif
#include <magic_enum.hpp>
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif

namespace dc::demo {

enum class Scene { Triangle, Rectangle, Ellipse, Sine, Turtle, Star };

struct Options {
    Scene                      scene = Scene::Triangle;
    std::optional<std::size_t> width;  // pixels, defaults to the terminal width
    std::optional<std::size_t> height; // pixels, defaults to the terminal height
    bool                       verbose = false;

    /// explicit sizes win over the detected terminal size
    [[nodiscard]] std::size_t pixelWidth(const TerminalSize& terminal) const noexcept { return width.value_or(terminal.pixelWidth()); }
    [[nodiscard]] std::size_t pixelHeight(const TerminalSize& terminal) const noexcept { return height.value_or(terminal.pixelHeight()); }
};

[[nodiscard]] inline std::string sceneNames() {
    std::vector<std::string> names;
    for (const auto name : magic_enum::enum_names<Scene>()) {
        std::string lower(name);
        for (auto& c : lower) {
            c = static_cast<char>(c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c);
        }
        names.push_back(std::move(lower));
    }
    return dc::join(names, "|");
}

[[nodiscard]] inline std::string usage(std::string_view command) { return std::format("Usage: {} <{}> [--width <pixels>] [--height <pixels>] [--verbose | -v]", command, sceneNames()); }

/**
 * @brief parses the command-line arguments following the program name.
 *
 * The first positional argument selects the scene (case-insensitive); '--width'/'--height' take a
 * positive pixel count either as the next argument or in '--width=<n>' form.
 */
[[nodiscard]] inline std::expected<Options, Error> parseOptions(std::span<const std::string_view> args) {
    Options options;
    bool    sceneSeen = false;

    const auto parseSize = [](std::string_view flag, std::string_view value) -> std::expected<std::size_t, Error> {
        if (auto parsed = detail::parsePositive(value)) {
            if (*parsed > maxPixelCoordinate + 1UZ) {
                return std::unexpected(Error(std::format("invalid value '{}' for {}: at most {} pixels", value, flag, maxPixelCoordinate + 1UZ)));
            }
            return *parsed;
        }
        return std::unexpected(Error(std::format("invalid value '{}' for {}: expected a positive pixel count", value, flag)));
    };

    for (std::size_t index = 0UZ; index < args.size(); ++index) {
        const std::string_view arg = args[index];

        if (arg == "--verbose" || arg == "-v") {
            options.verbose = true;
            continue;
        }

        if (arg.starts_with("--width") || arg.starts_with("--height")) {
            const bool             isWidth = arg.starts_with("--width");
            const std::string_view flag    = isWidth ? "--width" : "--height";
            std::string_view       value;
            if (arg.size() > flag.size() && arg[flag.size()] == '=') {
                value = arg.substr(flag.size() + 1UZ);
            } else if (arg.size() == flag.size() && index + 1UZ < args.size()) {
                value = args[++index];
            } else if (arg.size() == flag.size()) {
                return std::unexpected(Error(std::format("missing value for {}", flag)));
            } else {
                return std::unexpected(Error(std::format("unknown option '{}'", arg)));
            }

            auto size = parseSize(flag, value);
            if (!size) {
                return std::unexpected(size.error());
            }
            (isWidth ? options.width : options.height) = *size;
            continue;
        }

        if (arg.starts_with("-")) {
            return std::unexpected(Error(std::format("unknown option '{}'", arg)));
        }

        if (sceneSeen) {
            return std::unexpected(Error(std::format("unexpected argument '{}': scene already given", arg)));
        }
        auto scene = magic_enum::enum_cast<Scene>(arg, magic_enum::case_insensitive);
        if (!scene) {
            return std::unexpected(Error(std::format("unknown scene '{}', expected one of {}", arg, sceneNames())));
        }
        options.scene = *scene;
        sceneSeen     = true;
    }

    if (!sceneSeen) {
        return std::unexpected(Error("missing scene argument"));
    }
    return options;
}

[[nodiscard]] inline std::expected<Options, Error> parseOptions(int argc, char** argv) {
    std::vector<std::string_view> args;
    args.reserve(argc > 1 ? static_cast<std::size_t>(argc - 1) : 0UZ);
    for (int index = 1; index < argc; ++index) {
        args.emplace_back(argv[index]);
    }
    return parseOptions(std::span<const std::string_view>(args));
}

} // namespace dc::demo

#endif // DOTCANVAS_DEMO_OPTIONS_HPP
