#pragma once

#include "chronoline/entity/working_entity.h"

#include <cstdint>
#include <vector>

namespace chronoline {

/**
 * Greedy interval partitioning. Entities must already be in layout order
 * (see layoutOrderLess) with x positions and widths computed.
 *
 * Each visible entity goes into the first row whose right edge plus
 * `minInlineSpacing` lies strictly left of the entity's left edge, compared at
 * 0.1px precision; otherwise a new row is opened. Filtered entities are
 * skipped and keep whatever row they had.
 *
 * @return Number of rows used
 */
std::uint32_t packRows(std::vector<WorkingEntity>& entities, double minInlineSpacing);

} // namespace chronoline
