#include "chronoline/entity/working_entity.h"

#include <algorithm>

namespace chronoline {

WorkingEntity WorkingEntity::fromEntity(const Entity& entity, std::size_t insertionIndex) {
    WorkingEntity working;
    working.entity = entity;
    working.start = entity.start;
    working.end = entity.end.value_or(entity.start);
    working.text.text = entity.name;
    working.insertionIndex = insertionIndex;
    return working;
}

double WorkingEntity::maxX() const noexcept {
    return std::max(textBox.positionAndSize.maxX(), dateBox.positionAndSize.maxX());
}

double WorkingEntity::maxY() const noexcept {
    return std::max(textBox.positionAndSize.maxY(), dateBox.positionAndSize.maxY());
}

void WorkingEntity::updateLayoutDates(const Date& today) noexcept {
    start = entity.start;
    end = entity.end ? *entity.end : today;
}

void WorkingEntity::updateFilteredByDateRange(
    const std::optional<Date>& startCutoff,
    const std::optional<Date>& endCutoff) noexcept {
    if (startCutoff && entity.start < *startCutoff) {
        filteredByDateRange = true;
        return;
    }
    if (endCutoff) {
        if (entity.end) {
            if (*entity.end > *endCutoff) {
                filteredByDateRange = true;
                return;
            }
        } else if (entity.start > *endCutoff) {
            filteredByDateRange = true;
            return;
        }
    }
    filteredByDateRange = false;
}

void WorkingEntity::updateFilteredByTagExpr(const TagExpression* expr) {
    filteredByTagExpr = expr != nullptr && !expr->matches(entity);
}

WorkingEntity WorkingEntity::withOffset(double dx, double dy) const {
    WorkingEntity out = *this;
    out.text.topLeft.x += dx;
    out.text.topLeft.y += dy;
    out.textBox.positionAndSize.addOffset(dx, dy);
    out.dateBox.positionAndSize.addOffset(dx, dy);
    return out;
}

void WorkingEntity::adjustStickyText(double paddingX) noexcept {
    const double boxWidth = std::max(textBox.positionAndSize.width, dateBox.positionAndSize.width);
    const double boxFreeSpace = boxWidth - text.width - (2.0 * paddingX);
    if (text.topLeft.x < paddingX) {
        if (text.topLeft.x < -(boxFreeSpace - paddingX)) {
            text.topLeft.x += boxFreeSpace;
        } else {
            text.topLeft.x = paddingX;
        }
    }
}

EntityOut WorkingEntity::toOutput() const {
    EntityOut out;
    out.entity = entity;
    out.text = TextOut{text.topLeft, text.text, text.colour, text.fontSize};
    out.textBox = textBox;
    out.dateBox = dateBox;
    out.isSelected = isSelected;
    return out;
}

bool layoutOrderLess(const WorkingEntity& a, const WorkingEntity& b) noexcept {
    const int byStart = a.entity.start.compare(b.entity.start);
    if (byStart != 0) return byStart < 0;
    if (a.entity.id != b.entity.id) return a.entity.id < b.entity.id;
    return a.insertionIndex < b.insertionIndex;
}

} // namespace chronoline
