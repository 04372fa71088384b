// TimelineEngine interaction event queue.

#include "chronoline/engine.h"

namespace chronoline {

void TimelineEngine::clickOnEntity(EntityId id) {
    interactionEvents_.push_back(InteractionEvent{InteractionEventType::SingleClick, id});
}

void TimelineEngine::doubleClickOnEntity(EntityId id) {
    interactionEvents_.push_back(InteractionEvent{InteractionEventType::DoubleClick, id});
}

void TimelineEngine::tripleClickOnEntity(EntityId id) {
    interactionEvents_.push_back(InteractionEvent{InteractionEventType::TripleClick, id});
}

void TimelineEngine::hoverOverEntity(std::optional<EntityId> id) {
    if (id) {
        interactionEvents_.push_back(InteractionEvent{InteractionEventType::Hover, *id});
    }
    for (WorkingEntity& entity : workingEntities_) {
        entity.isHoveredOver = id.has_value() && entity.entity.id == *id;
    }
}

std::vector<InteractionEvent> TimelineEngine::drainInteractionEvents() {
    std::vector<InteractionEvent> drained;
    drained.swap(interactionEvents_);
    return drained;
}

} // namespace chronoline
