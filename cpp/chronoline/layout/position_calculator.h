#pragma once

#include "chronoline/entity/working_entity.h"
#include "chronoline/layout/layout_params.h"

#include <cstdint>
#include <vector>

// Entity geometry in unpanned layout space. Run in order: widths, x
// positions, row packing, y positions.

namespace chronoline {

/**
 * Date box width from the entity's lifespan in fractional years; text box
 * width from the measured label plus horizontal padding. Also sets both box
 * heights.
 */
void calculateWidths(
    std::vector<WorkingEntity>& entities,
    const MeasuredLayoutParams& measured,
    const ScalableLayoutParams& zoomed);

// x = years since `decadeRangeStart` (with month/day fraction) * yearWidth.
void calculateXPositions(
    std::vector<WorkingEntity>& entities,
    std::int32_t decadeRangeStart,
    const MeasuredLayoutParams& measured,
    const ScalableLayoutParams& zoomed);

// y = rowPitch * (row + 1); row 0 sits one pitch below the top for the decade headings.
void calculateYPositions(
    std::vector<WorkingEntity>& entities,
    const MeasuredLayoutParams& measured,
    const ScalableLayoutParams& zoomed);

} // namespace chronoline
