#include "chronoline/layout/position_calculator.h"

#include "chronoline/core/util.h"

namespace chronoline {

namespace {

double fractionalYear(const Date& date) noexcept {
    return static_cast<double>(date.year()) + monthAndDayAsFractionOfYear(date.month(), date.day());
}

} // namespace

void calculateWidths(
    std::vector<WorkingEntity>& entities,
    const MeasuredLayoutParams& measured,
    const ScalableLayoutParams& zoomed) {
    const double height = boxHeight(measured, zoomed);
    for (WorkingEntity& entity : entities) {
        const double lifespanYears = fractionalYear(entity.end) - fractionalYear(entity.start);
        entity.dateBox.positionAndSize.width = lifespanYears * measured.yearWidth;
        entity.dateBox.positionAndSize.height = height;

        entity.textBox.positionAndSize.width = entity.text.width + (2.0 * zoomed.paddingX);
        entity.textBox.positionAndSize.height = height;
    }
}

void calculateXPositions(
    std::vector<WorkingEntity>& entities,
    std::int32_t decadeRangeStart,
    const MeasuredLayoutParams& measured,
    const ScalableLayoutParams& zoomed) {
    for (WorkingEntity& entity : entities) {
        const double offsetInYears =
            static_cast<double>(static_cast<std::int64_t>(entity.start.year()) - decadeRangeStart);
        const double x =
            (offsetInYears + monthAndDayAsFractionOfYear(entity.start.month(), entity.start.day())) * measured.yearWidth;

        entity.text.topLeft.x = x + zoomed.paddingX;
        entity.textBox.positionAndSize.position.x = x;
        entity.dateBox.positionAndSize.position.x = x;
    }
}

void calculateYPositions(
    std::vector<WorkingEntity>& entities,
    const MeasuredLayoutParams& measured,
    const ScalableLayoutParams& zoomed) {
    const double pitch = rowPitch(measured, zoomed);
    for (WorkingEntity& entity : entities) {
        const double y = pitch * static_cast<double>(entity.row + 1);

        entity.text.topLeft.y = y + zoomed.paddingY;
        entity.textBox.positionAndSize.position.y = y;
        entity.dateBox.positionAndSize.position.y = y;
    }
}

} // namespace chronoline
