#ifndef CHRONOLINE_CORE_UTIL_H
#define CHRONOLINE_CORE_UTIL_H

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#else
#include <chrono>
// Polyfill for native builds
inline double emscripten_get_now() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
}
#endif

namespace chronoline {

// Row packing compares edges at 0.1px precision so neighbouring entities do not
// flip rows between frames.
inline double roundToNearestTenth(double value) noexcept {
    return std::round(value * 10.0) / 10.0;
}

inline std::int32_t saturateToI32(std::int64_t value) noexcept {
    constexpr std::int64_t lo = std::numeric_limits<std::int32_t>::min();
    constexpr std::int64_t hi = std::numeric_limits<std::int32_t>::max();
    if (value < lo) return static_cast<std::int32_t>(lo);
    if (value > hi) return static_cast<std::int32_t>(hi);
    return static_cast<std::int32_t>(value);
}

// Largest multiple of ten not greater than `year` (e.g. -151 -> -160).
inline std::int32_t floorToDecade(std::int32_t year) noexcept {
    const std::int64_t v = year;
    const std::int64_t floored = v < 0 ? ((v - 9) / 10) * 10 : (v / 10) * 10;
    return saturateToI32(floored);
}

// Smallest multiple of ten not less than `year` (e.g. 151 -> 160).
inline std::int32_t ceilingToDecade(std::int32_t year) noexcept {
    const std::int64_t v = year;
    const std::int64_t ceiled = v < 0 ? (v / 10) * 10 : ((v + 9) / 10) * 10;
    return saturateToI32(ceiled);
}

inline std::int32_t saturatingSub(std::int32_t a, std::int32_t b) noexcept {
    return saturateToI32(static_cast<std::int64_t>(a) - static_cast<std::int64_t>(b));
}

// Offset of a month/day inside its year; unset fields count as the first.
inline double monthAndDayAsFractionOfYear(std::optional<std::uint8_t> month, std::optional<std::uint8_t> day) noexcept {
    const int monthNumber = static_cast<int>(month.value_or(1)) - 1;
    const int dayNumber = static_cast<int>(day.value_or(1)) - 1;
    return (static_cast<double>(monthNumber) / 12.0) + (static_cast<double>(dayNumber) / 365.0);
}

} // namespace chronoline

#endif // CHRONOLINE_CORE_UTIL_H
