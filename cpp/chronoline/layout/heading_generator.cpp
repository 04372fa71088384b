#include "chronoline/layout/heading_generator.h"

#include "chronoline/core/util.h"
#include "chronoline/layout/layout_constants.h"

#include <cstdio>
#include <utility>

namespace chronoline {

namespace {

Heading makeHeading(
    std::string text,
    double textX,
    double textY,
    const PositionAndSize& box,
    double fontSize,
    const HeadingStyle& style) {
    Heading heading;
    heading.text.topLeft = Point{textX, textY};
    heading.text.text = std::move(text);
    heading.text.colour = style.textColour;
    heading.text.fontSize = fontSize;
    heading.textBox.positionAndSize = box;
    heading.textBox.fillColour = style.rect.fillColour;
    heading.textBox.borderStyle = style.rect.border;
    return heading;
}

} // namespace

std::string yearHeadingText(std::int32_t year, double datetimeScale) {
    char buf[16];
    // Negative years are never abbreviated
    if (datetimeScale < kDatetimeScaleShowFullYears && year >= 0) {
        std::snprintf(buf, sizeof(buf), "'%02d", static_cast<int>(year % 100));
    } else {
        std::snprintf(buf, sizeof(buf), "%d", static_cast<int>(year));
    }
    return std::string(buf);
}

std::vector<Heading> buildHeadings(
    const TimelineDateRange& dateRange,
    const MeasuredLayoutParams& measured,
    const ScalableLayoutParams& zoomed,
    double datetimeScale,
    const HeadingStyle& style,
    const MeasureTextFn& measure) {
    std::vector<Heading> headings;
    if (dateRange.decadeCount() <= 0 || !measure) {
        return headings;
    }

    const bool showYears = datetimeScale > kDatetimeScaleShowYears;
    const double height = boxHeight(measured, zoomed);
    const double decadeWidth = measured.decadeWidth();
    const double yearWidth = measured.yearWidth;
    const double decadeStrWidth = measure(zoomed.fontSizePx, std::string(kDecadeWidthProbe)).width;

    headings.reserve(static_cast<std::size_t>(dateRange.decadeCount()) * (showYears ? 11u : 1u));

    for (std::int32_t decadeNumber = 0; decadeNumber < dateRange.decadeCount(); ++decadeNumber) {
        const std::int32_t decade =
            saturateToI32(static_cast<std::int64_t>(dateRange.decadeRangeStart()) + std::int64_t{10} * decadeNumber);
        const double x = decadeWidth * static_cast<double>(decadeNumber);

        headings.push_back(makeHeading(
            std::to_string(decade) + "s",
            x + (decadeWidth - decadeStrWidth) / 2.0,
            zoomed.paddingY,
            PositionAndSize{Position{x, 0.0}, decadeWidth, height},
            zoomed.fontSizePx,
            style));

        if (!showYears) continue;

        for (std::int32_t yearNumber = 0; yearNumber < 10; ++yearNumber) {
            const std::int32_t year = saturateToI32(static_cast<std::int64_t>(decade) + yearNumber);
            const double yearX = x + (yearWidth * static_cast<double>(yearNumber));
            std::string text = yearHeadingText(year, datetimeScale);
            const double textWidth = measure(zoomed.fontSizePx, text).width;

            headings.push_back(makeHeading(
                std::move(text),
                yearX + (yearWidth - textWidth) / 2.0,
                height + zoomed.paddingY,
                PositionAndSize{Position{yearX, height}, yearWidth, height},
                zoomed.fontSizePx,
                style));
        }
    }

    return headings;
}

} // namespace chronoline
