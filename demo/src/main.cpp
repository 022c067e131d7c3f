#include <dotcanvas/Error.hpp>
#include <dotcanvas/canvas/Canvas.hpp>
#include <dotcanvas/demo/Options.hpp>
#include <dotcanvas/demo/Scenes.hpp>
#include <dotcanvas/demo/Terminal.hpp>
#include <dotcanvas/meta/formatter.hpp>

#include <clocale>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <print>

int main(int argc, char** argv) try {
    std::setlocale(LC_ALL, "");
    const std::filesystem::path commandPath = argc > 0 ? argv[0] : "dotcanvas-demo";

    auto options = dc::demo::parseOptions(argc, argv);
    if (!options) {
        std::println(stderr, "error: {}", options.error().message);
        std::println(stderr, "{}", dc::demo::usage(commandPath.filename().string()));
        return 1;
    }

    const auto        terminal = dc::demo::terminalSize();
    const std::size_t width    = options->pixelWidth(terminal);
    const std::size_t height   = options->pixelHeight(terminal);
    if (options->verbose) {
        std::println(stderr, "{} [dotcanvas-demo] scene={} terminal={}x{} cells canvas={}x{} px", dc::time::getIsoTime(), magic_enum::enum_name(options->scene), terminal.columns, terminal.rows, width, height);
    }

    dc::Canvas canvas;
    dc::demo::drawScene(options->scene, canvas, width, height);

    if (options->verbose) {
        std::println(stderr, "{} [dotcanvas-demo] cells={} rows={} cols={}", dc::time::getIsoTime(), canvas.cellCount(), canvas.rowRange(), canvas.colRange());
    }

    std::println("{}", canvas.frame());
    return 0;
} catch (const dc::exception& ex) {
    std::println(stderr, "error: {}", dc::Error(ex));
    return 1;
} catch (const std::exception& ex) {
    std::println(stderr, "error: {}", ex.what());
    return 1;
}
