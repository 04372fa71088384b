#pragma once

#include "chronoline/core/types.h"

#include <cstdint>

namespace chronoline {

enum class InteractionEventType : std::uint8_t {
    SingleClick = 1,
    DoubleClick = 2,
    TripleClick = 3,
    Hover = 4,
};

// Queued by the engine, drained by the host; the engine never dispatches them.
struct InteractionEvent {
    InteractionEventType type{InteractionEventType::SingleClick};
    EntityId entityId{0};

    bool operator==(const InteractionEvent& other) const noexcept {
        return type == other.type && entityId == other.entityId;
    }
    bool operator!=(const InteractionEvent& other) const noexcept { return !(*this == other); }
};

} // namespace chronoline
