#ifndef DOTCANVAS_UNITTESTHELPER_HPP
#define DOTCANVAS_UNITTESTHELPER_HPP

#include <boost/ut.hpp>
#include <algorithm>
#include <concepts>
#include <cstddef>
#include <fmt/format.h>
#include <ranges>
#include <source_location>
#include <sstream>
#include <string>

#include "formatter.hpp"

namespace dc::test {
using namespace boost::ut;

template<typename T>
concept HasSize = requires(const T c) {
    { c.size() } -> std::convertible_to<std::size_t>;
};

template<typename T>
concept Collection = std::ranges::range<T> && HasSize<T>;

struct eq_collection_result {
    bool                 success{};
    std::string          message{};
    std::source_location location = std::source_location::current();

    operator bool() const { return success; }
    friend std::ostream& operator<<(std::ostream& os, const eq_collection_result& r) { return os << r.message; }
};

/**
 * @brief element-wise, order-sensitive comparison of two sized ranges.
 *
 * On mismatch the result carries the first differing index and a small context window of both
 * ranges, which keeps failing pixel-sequence tests readable.
 */
template<Collection RangeLHS, Collection RangeRHS>
requires std::is_same_v<std::ranges::range_value_t<RangeLHS>, std::ranges::range_value_t<RangeRHS>>
auto eq_collections(const RangeLHS& LHS, const RangeRHS& RHS, std::size_t contextWindow = 3, std::source_location location = std::source_location::current()) -> eq_collection_result {
    const auto sizeLHS = LHS.size();
    const auto sizeRHS = RHS.size();
    if (sizeLHS != sizeRHS) {
        return {false, fmt::format("Collections size mismatch: LHS.size()={}, RHS.size()={}", sizeLHS, sizeRHS), location};
    }

    auto firstMismatch = std::ranges::mismatch(LHS, RHS);
    if (firstMismatch.in1 == LHS.end()) {
        return {true, fmt::format("Collections match ({} elements)", sizeLHS), location};
    }

    const std::ptrdiff_t idx         = std::distance(LHS.begin(), firstMismatch.in1);
    const std::ptrdiff_t ctxStartIdx = idx < static_cast<std::ptrdiff_t>(contextWindow) ? 0 : (idx - static_cast<std::ptrdiff_t>(contextWindow));
    const std::ptrdiff_t ctxStopIdx  = std::min<std::ptrdiff_t>(static_cast<std::ptrdiff_t>(sizeLHS), idx + static_cast<std::ptrdiff_t>(contextWindow) + 1);

    std::ostringstream ctxLHS, ctxRHS, lhsValue, rhsValue;
    for (auto i = ctxStartIdx; i < ctxStopIdx; ++i) {
        ctxLHS << *std::next(LHS.begin(), i) << ' ';
        ctxRHS << *std::next(RHS.begin(), i) << ' ';
    }
    lhsValue << *firstMismatch.in1;
    rhsValue << *firstMismatch.in2;

    return {false,
        fmt::format("Collections differ at index={idx}; LHS[{idx}]={lhs} vs RHS[{idx}]={rhs}\nContext window [{ctx_start}, {ctx_end}]:\n  left:  {lhs_context}\n  right: {rhs_context}", //
            fmt::arg("idx", idx), fmt::arg("lhs", lhsValue.str()), fmt::arg("rhs", rhsValue.str()),                                                                                      //
            fmt::arg("ctx_start", ctxStartIdx), fmt::arg("ctx_end", ctxStopIdx - 1), fmt::arg("lhs_context", ctxLHS.str()), fmt::arg("rhs_context", ctxRHS.str())),
        location};
}

/**
 * @brief order-insensitive comparison: both ranges hold the same elements the same number of times.
 */
template<Collection RangeLHS, Collection RangeRHS>
requires std::is_same_v<std::ranges::range_value_t<RangeLHS>, std::ranges::range_value_t<RangeRHS>>
auto eq_unordered(RangeLHS LHS, RangeRHS RHS, std::source_location location = std::source_location::current()) -> eq_collection_result {
    std::ranges::sort(LHS);
    std::ranges::sort(RHS);
    auto result     = eq_collections(LHS, RHS, 3UZ, location);
    result.location = location;
    return result;
}

} // namespace dc::test

#endif // DOTCANVAS_UNITTESTHELPER_HPP
