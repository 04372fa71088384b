#ifndef CHRONOLINE_CORE_DATE_H
#define CHRONOLINE_CORE_DATE_H

#include <cstdint>
#include <optional>
#include <string>

namespace chronoline {

/**
 * Calendar date with a mandatory year and an optional month and day.
 *
 * A day may only be set together with a month. Ordering treats an unset month
 * or day as the first, so a year-only date sorts as 1 January of that year.
 */
class Date {
public:
    static constexpr std::int32_t kMinYear = -50000;
    static constexpr std::int32_t kMaxYear = 10000;

    Date() = default;

    /**
     * Build a validated date.
     * @return Empty if the year is out of range, the month is not 1..12, the
     *         day is not 1..31, or a day is given without a month.
     */
    static std::optional<Date> fromParts(
        std::int64_t year,
        std::optional<std::int64_t> month = std::nullopt,
        std::optional<std::int64_t> day = std::nullopt);

    // Year-only date, clamped into the supported range.
    static Date fromYear(std::int32_t year) noexcept;

    // Today's date from the system clock (UTC).
    static Date today();

    std::int32_t year() const noexcept { return year_; }
    std::optional<std::uint8_t> month() const noexcept { return month_; }
    std::optional<std::uint8_t> day() const noexcept { return day_; }

    // e.g. "1 Jan 2025", "Jan 2025" or "2025"
    std::string asLongDateFormat() const;
    // e.g. "1 / 1 / 2025", "- / - / 2025"
    std::string asShortDateFormat() const;

    int compare(const Date& other) const noexcept;

    bool operator==(const Date& other) const noexcept {
        return year_ == other.year_ && month_ == other.month_ && day_ == other.day_;
    }
    bool operator!=(const Date& other) const noexcept { return !(*this == other); }
    bool operator<(const Date& other) const noexcept { return compare(other) < 0; }
    bool operator>(const Date& other) const noexcept { return compare(other) > 0; }
    bool operator<=(const Date& other) const noexcept { return compare(other) <= 0; }
    bool operator>=(const Date& other) const noexcept { return compare(other) >= 0; }

private:
    std::int32_t year_{0};
    std::optional<std::uint8_t> month_{};
    std::optional<std::uint8_t> day_{};
};

} // namespace chronoline

#endif // CHRONOLINE_CORE_DATE_H
