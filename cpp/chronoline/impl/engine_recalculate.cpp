// TimelineEngine layout pipeline and text measurement cache.

#include "chronoline/engine.h"

#include "chronoline/core/hash.h"
#include "chronoline/core/logging.h"
#include "chronoline/core/util.h"
#include "chronoline/layout/heading_generator.h"
#include "chronoline/layout/layout_constants.h"
#include "chronoline/layout/position_calculator.h"
#include "chronoline/layout/row_packer.h"

#include <algorithm>

namespace chronoline {

std::size_t TimelineEngine::MeasureKeyHash::operator()(const MeasureKey& key) const noexcept {
    std::uint64_t h = kDigestOffset;
    h = hashF64(h, key.fontSize);
    h = hashString(h, key.text);
    return static_cast<std::size_t>(h);
}

TextSize TimelineEngine::measureCached(double fontSizePx, const std::string& text) const {
    if (!measureText_) {
        return TextSize{};
    }

    MeasureKey key{fontSizePx, text};
    auto it = measureCache_.find(key);
    if (it != measureCache_.end()) {
        ++measureCacheHits_;
        return it->second;
    }

    ++measureCacheMisses_;
    const TextSize size = measureText_(fontSizePx, text);
    if (measureCache_.size() >= kMaxMeasureCacheEntries) {
        measureCache_.clear();
    }
    measureCache_.emplace(std::move(key), size);
    return size;
}

Date TimelineEngine::today() const {
    return todayOverride_ ? *todayOverride_ : Date::today();
}

void TimelineEngine::recalculate() {
    const double t0 = emscripten_get_now();

    updateEntitiesFiltered();

    const Date todayDate = today();
    for (WorkingEntity& entity : workingEntities_) {
        entity.updateLayoutDates(todayDate);
    }
    dateRange_.update(workingEntities_, todayDate.year());

    updateMeasuredLayoutParams();
    remeasureEntities();

    calculateWidths(workingEntities_, measuredLayoutParams_, zoomedLayoutParams_);
    calculateXPositions(workingEntities_, dateRange_.decadeRangeStart(), measuredLayoutParams_, zoomedLayoutParams_);
    rowCount_ = packRows(workingEntities_, zoomedLayoutParams_.minInlineSpacing);
    calculateYPositions(workingEntities_, measuredLayoutParams_, zoomedLayoutParams_);

    headings_ = buildHeadings(
        dateRange_,
        measuredLayoutParams_,
        zoomedLayoutParams_,
        datetimeScale_,
        colours_.heading,
        cachedMeasure_);

    clampGlobalOffset();

    ++generation_;
    ++recalculateCount_;
    lastRecalculateMs_ = static_cast<float>(emscripten_get_now() - t0);

    CHRONOLINE_LOG_DEBUG(
        "recalculate: entities=%zu rows=%u decades=%d..%d (%d) offset=(%.1f, %.1f) %.3fms",
        workingEntities_.size(),
        rowCount_,
        dateRange_.decadeRangeStart(),
        dateRange_.decadeRangeEnd(),
        dateRange_.decadeCount(),
        offset_.x,
        offset_.y,
        static_cast<double>(lastRecalculateMs_));
}

void TimelineEngine::updateEntitiesFiltered() {
    const auto& startCutoff = dateRange_.startDateCutoff();
    const auto& endCutoff = dateRange_.endDateCutoff();
    for (WorkingEntity& entity : workingEntities_) {
        entity.updateFilteredByTagExpr(entityFilter_.get());
        entity.updateFilteredByDateRange(startCutoff, endCutoff);
    }
}

void TimelineEngine::updateMeasuredLayoutParams() {
    measuredLayoutParams_ = measureLayoutParams(cachedMeasure_, zoomedLayoutParams_, datetimeScale_);
}

void TimelineEngine::remeasureEntities() {
    const double fontSize = zoomedLayoutParams_.fontSizePx;
    for (WorkingEntity& entity : workingEntities_) {
        if (entity.measuredFontSize == fontSize) continue;
        entity.text.width = measureCached(fontSize, entity.text.text).width;
        entity.text.fontSize = fontSize;
        entity.measuredFontSize = fontSize;
    }
}

void TimelineEngine::applyEntityColours(WorkingEntity& entity) const {
    Colour textBoxFill = colours_.entity.textBox.fillColour;
    Colour dateBoxFill = colours_.entity.dateBox.fillColour;
    if (const auto tagColour = tagColours_.entityColour(entity.entity)) {
        textBoxFill = *tagColour;
        dateBoxFill = Colour::lightened(*tagColour);
    }

    // Neighbouring entities get slightly different shades; seeded by id so
    // the same entity always gets the same shade.
    const std::uint64_t seed = hashU64(kDigestOffset, entity.entity.id);
    const auto jitter = static_cast<std::uint8_t>(kEntityColourJitter);
    entity.textBox.fillColour = Colour::nearby(textBoxFill, jitter, seed);
    entity.dateBox.fillColour = Colour::nearby(dateBoxFill, jitter, seed ^ 0x9E3779B97F4A7C15ull);

    entity.textBox.borderStyle = colours_.entity.textBox.border;
    entity.dateBox.borderStyle = colours_.entity.dateBox.border;
    entity.text.colour = colours_.entity.textColour;
}

void TimelineEngine::sortEntities() {
    std::stable_sort(workingEntities_.begin(), workingEntities_.end(), layoutOrderLess);
}

} // namespace chronoline
