// TimelineEngine entity set, filters and selection.

#include "chronoline/engine.h"

#include "chronoline/core/logging.h"

#include <algorithm>
#include <unordered_set>

namespace chronoline {

void TimelineEngine::setEntities(const std::vector<Entity>& entities) {
    CHRONOLINE_LOG_DEBUG("engine set entities (%zu)", entities.size());
    workingEntities_.clear();
    addEntities(entities);
}

void TimelineEngine::addEntities(const std::vector<Entity>& entities) {
    std::unordered_set<EntityId> known;
    known.reserve(workingEntities_.size() + entities.size());
    for (const WorkingEntity& entity : workingEntities_) {
        known.insert(entity.entity.id);
    }

    std::size_t added = 0;
    for (const Entity& entity : entities) {
        if (!known.insert(entity.id).second) {
            CHRONOLINE_LOG_DEBUG("engine add entities: skipping duplicate id %llu", static_cast<unsigned long long>(entity.id));
            continue;
        }
        WorkingEntity working = WorkingEntity::fromEntity(entity, nextInsertionIndex_++);
        applyEntityColours(working);
        workingEntities_.push_back(std::move(working));
        ++added;
    }
    CHRONOLINE_LOG_DEBUG("engine add entities: %zu added, %zu total", added, workingEntities_.size());

    sortEntities();
    syncSelectionFlags();
    recalculate();
}

void TimelineEngine::removeEntities(const std::vector<EntityId>& ids) {
    const std::unordered_set<EntityId> toRemove(ids.begin(), ids.end());
    workingEntities_.erase(
        std::remove_if(
            workingEntities_.begin(),
            workingEntities_.end(),
            [&](const WorkingEntity& entity) { return toRemove.count(entity.entity.id) != 0; }),
        workingEntities_.end());
    recalculate();
}

void TimelineEngine::clearEntities() {
    workingEntities_.clear();
    recalculate();
}

std::size_t TimelineEngine::visibleEntityCount() const noexcept {
    return static_cast<std::size_t>(std::count_if(
        workingEntities_.begin(),
        workingEntities_.end(),
        [](const WorkingEntity& entity) { return !entity.isFilteredOut(); }));
}

void TimelineEngine::setTagBoolExprEntityFilter(std::unique_ptr<TagExpression> expr) {
    entityFilter_ = std::move(expr);
    recalculate();
}

void TimelineEngine::removeTagBoolExprEntityFilter() {
    entityFilter_.reset();
    recalculate();
}

// =============================================================================
// Selection
// =============================================================================

void TimelineEngine::syncSelectionFlags() {
    const std::unordered_set<EntityId> selected(selectedIds_.begin(), selectedIds_.end());
    for (WorkingEntity& entity : workingEntities_) {
        entity.isSelected = selected.count(entity.entity.id) != 0;
    }
}

void TimelineEngine::selectEntities(const std::vector<EntityId>& ids) {
    for (EntityId id : ids) {
        if (std::find(selectedIds_.begin(), selectedIds_.end(), id) == selectedIds_.end()) {
            selectedIds_.push_back(id);
        }
    }
    syncSelectionFlags();
    ++generation_;
}

void TimelineEngine::setIdsOfSelectedEntities(const std::vector<EntityId>& ids) {
    selectedIds_.clear();
    selectEntities(ids);
}

void TimelineEngine::addIdOfSelectedEntity(EntityId id) {
    selectEntities({id});
}

void TimelineEngine::removeIdFromSelectedEntities(EntityId id) {
    selectedIds_.erase(std::remove(selectedIds_.begin(), selectedIds_.end(), id), selectedIds_.end());
    syncSelectionFlags();
    ++generation_;
}

void TimelineEngine::clearIdsOfSelectedEntities() {
    selectedIds_.clear();
    syncSelectionFlags();
    ++generation_;
}

} // namespace chronoline
