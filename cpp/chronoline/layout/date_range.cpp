#include "chronoline/layout/date_range.h"

#include "chronoline/core/util.h"

#include <algorithm>
#include <limits>

namespace chronoline {

void TimelineDateRange::update(const std::vector<WorkingEntity>& entities, std::int32_t currentYear) {
    std::int32_t earliest = std::numeric_limits<std::int32_t>::max();
    std::int32_t latest = std::numeric_limits<std::int32_t>::min();
    bool anyVisible = false;

    for (const WorkingEntity& entity : entities) {
        if (entity.isFilteredOut()) continue;
        anyVisible = true;
        earliest = std::min(earliest, entity.entity.start.year());
        if (entity.entity.end) {
            latest = std::max(latest, entity.entity.end->year());
        }
    }

    if (latest == std::numeric_limits<std::int32_t>::min()) {
        latest = currentYear;
    }

    hasVisibleEntities_ = anyVisible;
    if (!anyVisible) {
        earliestYear_ = 0;
        latestYear_ = 0;
        decadeRangeStart_ = 0;
        decadeRangeEnd_ = 0;
        decadeCount_ = 0;
        return;
    }

    earliestYear_ = earliest;
    latestYear_ = latest;

    const std::int32_t startYear = startDateCutoff_ ? startDateCutoff_->year() : earliestYear_;
    const std::int32_t endYear = endDateCutoff_ ? endDateCutoff_->year() : latestYear_;

    decadeRangeStart_ = floorToDecade(startYear);
    decadeRangeEnd_ = ceilingToDecade(endYear);
    decadeCount_ = std::max<std::int32_t>(0, saturatingSub(decadeRangeEnd_, decadeRangeStart_) / 10);
}

} // namespace chronoline
