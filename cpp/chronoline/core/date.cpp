#include "chronoline/core/date.h"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <tuple>

namespace chronoline {

namespace {
constexpr const char* kMonthNames[12] = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun",
    "Jul", "Aug", "Sep", "Oct", "Nov", "Dec",
};
}

std::optional<Date> Date::fromParts(
    std::int64_t year,
    std::optional<std::int64_t> month,
    std::optional<std::int64_t> day) {
    if (year < kMinYear || year > kMaxYear) {
        return std::nullopt;
    }
    if (month && (*month < 1 || *month > 12)) {
        return std::nullopt;
    }
    if (day && (*day < 1 || *day > 31)) {
        return std::nullopt;
    }
    if (day && !month) {
        return std::nullopt;
    }

    Date date;
    date.year_ = static_cast<std::int32_t>(year);
    if (month) date.month_ = static_cast<std::uint8_t>(*month);
    if (day) date.day_ = static_cast<std::uint8_t>(*day);
    return date;
}

Date Date::fromYear(std::int32_t year) noexcept {
    Date date;
    date.year_ = std::clamp(year, kMinYear, kMaxYear);
    return date;
}

Date Date::today() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm utc{};
#if defined(_WIN32)
    gmtime_s(&utc, &now);
#else
    gmtime_r(&now, &utc);
#endif
    Date date;
    date.year_ = std::clamp(utc.tm_year + 1900, kMinYear, kMaxYear);
    date.month_ = static_cast<std::uint8_t>(utc.tm_mon + 1);
    date.day_ = static_cast<std::uint8_t>(utc.tm_mday);
    return date;
}

std::string Date::asLongDateFormat() const {
    std::string out;
    if (day_) {
        out += std::to_string(*day_);
        out += ' ';
    }
    if (month_) {
        out += kMonthNames[*month_ - 1];
        out += ' ';
    }
    out += std::to_string(year_);
    return out;
}

std::string Date::asShortDateFormat() const {
    const std::string day = day_ ? std::to_string(*day_) : std::string("-");
    const std::string month = month_ ? std::to_string(*month_) : std::string("-");
    return day + " / " + month + " / " + std::to_string(year_);
}

int Date::compare(const Date& other) const noexcept {
    const auto key = [](const Date& d) {
        return std::make_tuple(d.year_, d.month_.value_or(1), d.day_.value_or(1));
    };
    const auto a = key(*this);
    const auto b = key(other);
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

} // namespace chronoline
