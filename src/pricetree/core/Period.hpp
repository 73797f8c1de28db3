#pragma once
#include <array>
#include <cstddef>
#include <string_view>

namespace PT {

/**
 * The five fixed reporting periods of an index row, oldest first.
 *
 * Values are stored positionally in IndexValues; every piece of code that
 * needs to walk the periods iterates kPeriods instead of naming fields, so
 * aggregation and rebalancing share a single formula implementation.
 */
enum class Period : std::size_t {
    YearAgo = 0,    // n-12
    ThreeMonthsAgo, // n-3
    TwoMonthsAgo,   // n-2
    PreviousMonth,  // n-1
    Current         // n
};

inline constexpr std::size_t kPeriodCount = 5;

inline constexpr std::array<Period, kPeriodCount> kPeriods{
        Period::YearAgo, Period::ThreeMonthsAgo, Period::TwoMonthsAgo, Period::PreviousMonth, Period::Current};

using IndexValues = std::array<double, kPeriodCount>;

[[nodiscard]] constexpr auto periodSlot(Period period) noexcept -> std::size_t {
    return static_cast<std::size_t>(period);
}

[[nodiscard]] constexpr auto periodTag(Period period) noexcept -> std::string_view {
    switch (period) {
    case Period::YearAgo:
        return "n-12";
    case Period::ThreeMonthsAgo:
        return "n-3";
    case Period::TwoMonthsAgo:
        return "n-2";
    case Period::PreviousMonth:
        return "n-1";
    case Period::Current:
        return "n";
    }
    return "n";
}

struct Variation {
    double monthly   = 0.0;
    double trimester = 0.0;
    double yearly    = 0.0;

    auto operator==(Variation const&) const -> bool = default;
};

} // namespace PT
