#include "chronoline/render/colours.h"

namespace chronoline {

TimelineColours TimelineColours::defaults() noexcept {
    TimelineColours colours;
    colours.background.a = Colour::fromRgb(0xff, 0xff, 0xff);
    colours.background.b = Colour::fromRgb(0xe8, 0xf8, 0xff);
    colours.dividingLine = LineStyle{Colour::fromRgb(0, 0, 0), 0.5};
    colours.entity.textBox = BoxStyle{Colour::fromRgb(0xe6, 0xe5, 0xea), std::nullopt};
    colours.entity.dateBox = BoxStyle{Colour::fromRgb(0x86, 0xd6, 0x95), std::nullopt};
    colours.entity.textColour = Colour::fromRgb(0, 0, 0);
    colours.heading.rect = BoxStyle{Colour::fromRgb(0x00, 0x00, 0xaa), std::nullopt};
    colours.heading.textColour = Colour::fromRgb(0xff, 0xff, 0xff);
    return colours;
}

TagColours TagColours::defaults() {
    TagColours colours;
    colours.add(Tag{std::nullopt, "person"}, Colour::fromAnyString("person"));
    colours.add(Tag{std::nullopt, "battle"}, Colour::fromRgb(0xff, 0x00, 0x00));
    colours.add(Tag{std::nullopt, "book"}, Colour::fromRgb(0xaa, 0x30, 0x34));
    colours.add(Tag{std::nullopt, "novel"}, Colour::fromAnyString("novel"));
    return colours;
}

std::optional<Colour> TagColours::tagColour(const Tag& tag) const {
    for (const auto& [known, colour] : entries_) {
        if (known == tag) return colour;
    }
    return std::nullopt;
}

std::optional<Colour> TagColours::entityColour(const Entity& entity) const {
    if (!entity.tags) return std::nullopt;
    for (const auto& [known, colour] : entries_) {
        if (entity.hasTag(known)) return colour;
    }
    return std::nullopt;
}

} // namespace chronoline
