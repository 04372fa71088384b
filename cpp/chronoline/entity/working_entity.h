#pragma once

#include "chronoline/core/colour.h"
#include "chronoline/core/date.h"
#include "chronoline/core/types.h"
#include "chronoline/entity/entity.h"
#include "chronoline/render/primitives.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace chronoline {

// Measured entity label. `width` is the pixel width at `fontSize`.
struct EntityLabel {
    Point topLeft{};
    std::string text{};
    double width{0.0};
    double fontSize{0.0};
    Colour colour{};
};

/**
 * WorkingEntity: an input entity plus the render state derived from it.
 *
 * Geometry is stored in unpanned layout space; panning and the header
 * offset are applied by copies made at query time (see withOffset).
 */
struct WorkingEntity {
    Entity entity{};

    // Layout dates; `end` is today for open-ended entities.
    Date start{};
    Date end{};

    EntityLabel text{};
    FilledBox textBox{};
    FilledBox dateBox{};

    std::uint32_t row{0};
    bool filteredByDateRange{false};
    bool filteredByTagExpr{false};
    bool isHoveredOver{false};
    bool isSelected{false};

    std::size_t insertionIndex{0};
    // Font size the label width was measured at; 0 when never measured.
    double measuredFontSize{0.0};

    static WorkingEntity fromEntity(const Entity& entity, std::size_t insertionIndex);

    bool isFilteredOut() const noexcept { return filteredByDateRange || filteredByTagExpr; }

    double minX() const noexcept { return textBox.positionAndSize.position.x; }
    double maxX() const noexcept;
    double maxY() const noexcept;

    // Refresh `start`/`end`, resolving an open end to `today`.
    void updateLayoutDates(const Date& today) noexcept;

    /**
     * An entity is cut off when it starts before the start cutoff, or, with
     * an end cutoff, when its end is after the cutoff (open-ended entities:
     * when it starts after the cutoff).
     */
    void updateFilteredByDateRange(const std::optional<Date>& startCutoff, const std::optional<Date>& endCutoff) noexcept;

    // No expression means nothing is filtered.
    void updateFilteredByTagExpr(const TagExpression* expr);

    WorkingEntity withOffset(double dx, double dy) const;

    /**
     * Slide the label right, inside its box, while the box's left edge is
     * scrolled past the canvas edge and there is free space left.
     */
    void adjustStickyText(double paddingX) noexcept;

    EntityOut toOutput() const;
};

// Layout order: start date, then entity id, then arrival order.
bool layoutOrderLess(const WorkingEntity& a, const WorkingEntity& b) noexcept;

} // namespace chronoline
