#pragma once

#include "chronoline/core/date.h"
#include "chronoline/entity/working_entity.h"

#include <cstdint>
#include <optional>
#include <vector>

namespace chronoline {

/**
 * TimelineDateRange: the span of years covered by the visible entities,
 * widened to whole decades. Cutoffs, when set, replace the computed bounds.
 */
class TimelineDateRange {
public:
    void setCutoffs(std::optional<Date> startCutoff, std::optional<Date> endCutoff) noexcept {
        startDateCutoff_ = startCutoff;
        endDateCutoff_ = endCutoff;
    }
    const std::optional<Date>& startDateCutoff() const noexcept { return startDateCutoff_; }
    const std::optional<Date>& endDateCutoff() const noexcept { return endDateCutoff_; }

    /**
     * Recompute the year and decade bounds from entities that are not
     * filtered out.
     * @param currentYear Latest year used when no visible entity has an end date
     */
    void update(const std::vector<WorkingEntity>& entities, std::int32_t currentYear);

    std::int32_t earliestYear() const noexcept { return earliestYear_; }
    std::int32_t latestYear() const noexcept { return latestYear_; }
    std::int32_t decadeRangeStart() const noexcept { return decadeRangeStart_; }
    std::int32_t decadeRangeEnd() const noexcept { return decadeRangeEnd_; }
    // Zero when nothing is visible.
    std::int32_t decadeCount() const noexcept { return decadeCount_; }
    bool hasVisibleEntities() const noexcept { return hasVisibleEntities_; }

private:
    std::optional<Date> startDateCutoff_{};
    std::optional<Date> endDateCutoff_{};

    std::int32_t earliestYear_{0};
    std::int32_t latestYear_{0};
    std::int32_t decadeRangeStart_{0};
    std::int32_t decadeRangeEnd_{0};
    std::int32_t decadeCount_{0};
    bool hasVisibleEntities_{false};
};

} // namespace chronoline
