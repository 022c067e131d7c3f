#include <boost/ut.hpp>

#include <dotcanvas/Error.hpp>

#include <expected>
#include <format>
#include <source_location>
#include <string>
#include <string_view>

using namespace boost::ut;
using namespace std::string_literals;

namespace {
[[nodiscard]] std::expected<int, dc::Error> parseDigit(char c) {
    if (c < '0' || c > '9') {
        return std::unexpected(dc::Error(std::format("'{}' is not a digit", c)));
    }
    return c - '0';
}
} // namespace

const suite<"dc::Error"> errorSuite = [] {
    "defaults capture the call site"_test = [] {
        const auto      line = std::source_location::current().line() + 1U;
        const dc::Error error;
        expect(eq(error.message, "unknown error"s));
        expect(eq(error.sourceLocation.line(), line));
        expect(std::string_view(error.sourceLocation.file_name()).ends_with("qa_Error.cpp")) << error.sourceLocation.file_name();
    };

    "from dc::exception"_test = [] {
        const auto          where = std::source_location::current();
        const dc::exception ex("bad pixel", where);
        const dc::Error     error(ex);
        expect(eq(error.message, "bad pixel"s));
        expect(eq(error.sourceLocation.line(), where.line()));
    };

    "std::formatter<dc::Error>"_test = [] {
        const auto      here = std::source_location::current();
        const dc::Error error("missing scene argument", here);
        expect(eq(std::format("{}", error), std::format("missing scene argument ({}:{})", here.file_name(), here.line())));
    };

    "std::expected boundary"_test = [] {
        expect(eq(parseDigit('7').value_or(-1), 7));
        const auto failed = parseDigit('x');
        expect(!failed.has_value());
        expect(eq(failed.error().message, "'x' is not a digit"s));
    };
};

const suite<"dc::exception"> exceptionSuite = [] {
    "what() carries message and location"_test = [] {
        const auto          here = std::source_location::current();
        const dc::exception ex("broken", here);
        expect(eq(std::string(ex.what()), std::format("broken at {}:{}", here.file_name(), here.line())));
    };

    "throw and catch"_test = [] {
        expect(throws<dc::exception>([] { throw dc::exception("thrown"); }));
        try {
            throw dc::exception("caught");
        } catch (const std::exception& ex) {
            expect(std::string(ex.what()).starts_with("caught at ")) << ex.what();
        }
    };
};

int main() { /* not needed for UT */ }
