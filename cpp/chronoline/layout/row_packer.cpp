#include "chronoline/layout/row_packer.h"

#include "chronoline/core/util.h"

namespace chronoline {

std::uint32_t packRows(std::vector<WorkingEntity>& entities, double minInlineSpacing) {
    // Right edge of the last entity placed in each row
    std::vector<double> rowMaxX;

    for (WorkingEntity& entity : entities) {
        if (entity.isFilteredOut()) continue;

        const double entityMin = roundToNearestTenth(entity.minX());
        bool placed = false;
        for (std::size_t i = 0; i < rowMaxX.size(); ++i) {
            const double rowEdge = roundToNearestTenth(rowMaxX[i] + minInlineSpacing);
            if (rowEdge < entityMin) {
                rowMaxX[i] = entity.maxX();
                entity.row = static_cast<std::uint32_t>(i);
                placed = true;
                break;
            }
        }
        if (!placed) {
            entity.row = static_cast<std::uint32_t>(rowMaxX.size());
            rowMaxX.push_back(entity.maxX());
        }
    }

    return static_cast<std::uint32_t>(rowMaxX.size());
}

} // namespace chronoline
