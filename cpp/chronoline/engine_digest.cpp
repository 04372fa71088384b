// engine_digest.cpp - layout digest and stats for TimelineEngine.
// The digest covers computed layout only (no counters or timings), so equal
// inputs give equal digests and queries never change it.

#include "chronoline/engine.h"

#include "chronoline/core/hash.h"

namespace chronoline {

namespace {

std::uint64_t hashColour(std::uint64_t h, const Colour& c) {
    return hashU32(h, (static_cast<std::uint32_t>(c.r) << 16) | (static_cast<std::uint32_t>(c.g) << 8) | c.b);
}

std::uint64_t hashBox(std::uint64_t h, const FilledBox& box) {
    h = hashF64(h, box.positionAndSize.position.x);
    h = hashF64(h, box.positionAndSize.position.y);
    h = hashF64(h, box.positionAndSize.width);
    h = hashF64(h, box.positionAndSize.height);
    h = hashColour(h, box.fillColour);
    h = hashU32(h, box.borderStyle ? 1u : 0u);
    if (box.borderStyle) {
        h = hashColour(h, box.borderStyle->colour);
        h = hashF64(h, box.borderStyle->thickness);
    }
    return h;
}

} // namespace

TimelineEngine::EngineStats TimelineEngine::getStats() const noexcept {
    return EngineStats{
        generation_,
        static_cast<std::uint32_t>(workingEntities_.size()),
        static_cast<std::uint32_t>(visibleEntityCount()),
        rowCount_,
        static_cast<std::uint32_t>(dateRange_.decadeCount()),
        recalculateCount_,
        measureCacheHits_,
        measureCacheMisses_,
        lastRecalculateMs_
    };
}

TimelineEngine::LayoutDigest TimelineEngine::getLayoutDigest() const noexcept {
    std::uint64_t h = kDigestOffset;

    h = hashU32(h, 0x4C4E5243u); // "CRNL" marker

    h = hashF64(h, zoom_);
    h = hashF64(h, datetimeScale_);
    h = hashF64(h, offset_.x);
    h = hashF64(h, offset_.y);
    h = hashF64(h, canvasSize_.x);
    h = hashF64(h, canvasSize_.y);

    h = hashU32(h, static_cast<std::uint32_t>(dateRange_.decadeRangeStart()));
    h = hashU32(h, static_cast<std::uint32_t>(dateRange_.decadeRangeEnd()));
    h = hashU32(h, static_cast<std::uint32_t>(dateRange_.decadeCount()));
    h = hashF64(h, measuredLayoutParams_.yearWidth);
    h = hashF64(h, measuredLayoutParams_.rowHeightNoPadding);
    h = hashU32(h, rowCount_);

    h = hashU32(h, static_cast<std::uint32_t>(workingEntities_.size()));
    for (const WorkingEntity& entity : workingEntities_) {
        h = hashU64(h, entity.entity.id);
        h = hashU32(h, entity.row);
        const std::uint32_t flags = (entity.filteredByDateRange ? 1u : 0u)
            | (entity.filteredByTagExpr ? 2u : 0u)
            | (entity.isHoveredOver ? 4u : 0u)
            | (entity.isSelected ? 8u : 0u);
        h = hashU32(h, flags);
        h = hashString(h, entity.text.text);
        h = hashF64(h, entity.text.topLeft.x);
        h = hashF64(h, entity.text.topLeft.y);
        h = hashF64(h, entity.text.width);
        h = hashF64(h, entity.text.fontSize);
        h = hashColour(h, entity.text.colour);
        h = hashBox(h, entity.textBox);
        h = hashBox(h, entity.dateBox);
    }

    h = hashU32(h, static_cast<std::uint32_t>(headings_.size()));
    for (const Heading& heading : headings_) {
        h = hashString(h, heading.text.text);
        h = hashF64(h, heading.text.topLeft.x);
        h = hashF64(h, heading.text.topLeft.y);
        h = hashBox(h, heading.textBox);
    }

    return LayoutDigest{
        static_cast<std::uint32_t>(h & 0xFFFFFFFFull),
        static_cast<std::uint32_t>((h >> 32) & 0xFFFFFFFFull)
    };
}

} // namespace chronoline
