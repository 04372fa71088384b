#pragma once

#include "chronoline/core/colour.h"
#include "chronoline/entity/entity.h"
#include "chronoline/render/primitives.h"

#include <optional>
#include <utility>
#include <vector>

namespace chronoline {

struct BoxStyle {
    Colour fillColour{};
    std::optional<LineStyle> border{};

    bool operator==(const BoxStyle& other) const noexcept { return fillColour == other.fillColour && border == other.border; }
    bool operator!=(const BoxStyle& other) const noexcept { return !(*this == other); }
};

struct HeadingStyle {
    BoxStyle rect{};
    Colour textColour{};

    bool operator==(const HeadingStyle& other) const noexcept { return rect == other.rect && textColour == other.textColour; }
    bool operator!=(const HeadingStyle& other) const noexcept { return !(*this == other); }
};

struct EntityStyle {
    BoxStyle textBox{};
    BoxStyle dateBox{};
    Colour textColour{};

    bool operator==(const EntityStyle& other) const noexcept {
        return textBox == other.textBox && dateBox == other.dateBox && textColour == other.textColour;
    }
    bool operator!=(const EntityStyle& other) const noexcept { return !(*this == other); }
};

// Decade stripes alternate between `a` and `b` by century.
struct BackgroundColours {
    Colour a{};
    Colour b{};

    bool operator==(const BackgroundColours& other) const noexcept { return a == other.a && b == other.b; }
    bool operator!=(const BackgroundColours& other) const noexcept { return !(*this == other); }
};

struct TimelineColours {
    BackgroundColours background{};
    LineStyle dividingLine{};
    EntityStyle entity{};
    HeadingStyle heading{};

    static TimelineColours defaults() noexcept;

    bool operator==(const TimelineColours& other) const noexcept {
        return background == other.background && dividingLine == other.dividingLine && entity == other.entity
            && heading == other.heading;
    }
    bool operator!=(const TimelineColours& other) const noexcept { return !(*this == other); }
};

/**
 * TagColours: ordered tag -> colour table. The first listed tag an entity
 * carries decides its box colours.
 */
class TagColours {
public:
    static TagColours defaults();

    void add(Tag tag, Colour colour) { entries_.emplace_back(std::move(tag), colour); }
    void clear() noexcept { entries_.clear(); }
    bool empty() const noexcept { return entries_.empty(); }
    std::size_t size() const noexcept { return entries_.size(); }

    std::optional<Colour> tagColour(const Tag& tag) const;
    std::optional<Colour> entityColour(const Entity& entity) const;

private:
    std::vector<std::pair<Tag, Colour>> entries_;
};

} // namespace chronoline
