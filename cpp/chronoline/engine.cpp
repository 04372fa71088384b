// engine.cpp holds construction and configuration; the rest of TimelineEngine
// lives in impl/ and engine_digest.cpp.

#include "chronoline/engine.h"

#include "chronoline/core/logging.h"

namespace chronoline {

TimelineEngine::TimelineEngine(MeasureTextFn measureText)
    : measureText_(std::move(measureText)),
      colours_(TimelineColours::defaults()),
      tagColours_(TagColours::defaults()) {
    cachedMeasure_ = [this](double fontSizePx, const std::string& text) {
        return measureCached(fontSizePx, text);
    };
    if (!measureText_) {
        CHRONOLINE_LOG_WARN("TimelineEngine: no text measurement function, all text measures 0x0");
    }
    updateZoomedLayoutParams();
    recalculate();
}

void TimelineEngine::setDateLimits(std::optional<Date> start, std::optional<Date> end) {
    dateRange_.setCutoffs(start, end);
    recalculate();
}

std::pair<std::optional<Date>, std::optional<Date>> TimelineEngine::dateLimits() const {
    return {dateRange_.startDateCutoff(), dateRange_.endDateCutoff()};
}

std::pair<std::int32_t, std::int32_t> TimelineEngine::startAndEndDecades() const noexcept {
    return {dateRange_.decadeRangeStart(), dateRange_.decadeRangeEnd()};
}

void TimelineEngine::setFontSizePx(double fontSizePx) {
    fixedLayoutParams_.fontSizePx = fontSizePx;
    updateZoomedLayoutParams();
    recalculate();
}

void TimelineEngine::setLayoutParams(const ScalableLayoutParams& params) {
    fixedLayoutParams_ = params;
    updateZoomedLayoutParams();
    recalculate();
}

void TimelineEngine::setColours(const TimelineColours& colours) {
    CHRONOLINE_LOG_DEBUG("engine set colours");
    colours_ = colours;
    for (WorkingEntity& entity : workingEntities_) {
        applyEntityColours(entity);
    }
    recalculate();
}

void TimelineEngine::setTagColours(const TagColours& tagColours) {
    CHRONOLINE_LOG_DEBUG("engine set tag colours (%zu entries)", tagColours.size());
    tagColours_ = tagColours;
    for (WorkingEntity& entity : workingEntities_) {
        applyEntityColours(entity);
    }
    recalculate();
}

void TimelineEngine::setTodayOverride(std::optional<Date> today) {
    todayOverride_ = today;
    recalculate();
}

} // namespace chronoline
