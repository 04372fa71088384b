#pragma once

#include "chronoline/core/colour.h"
#include "chronoline/core/types.h"
#include "chronoline/entity/entity.h"

#include <optional>
#include <string>

// Plain output records handed to frontends. No behaviour beyond translation.

namespace chronoline {

struct LineStyle {
    Colour colour{};
    double thickness{0.0};

    bool operator==(const LineStyle& other) const noexcept {
        return colour == other.colour && thickness == other.thickness;
    }
    bool operator!=(const LineStyle& other) const noexcept { return !(*this == other); }
};

struct FilledBox {
    PositionAndSize positionAndSize{};
    Colour fillColour{};
    std::optional<LineStyle> borderStyle{};

    bool operator==(const FilledBox& other) const noexcept {
        return positionAndSize == other.positionAndSize && fillColour == other.fillColour && borderStyle == other.borderStyle;
    }
};

struct TextOut {
    Point topLeft{};
    std::string text{};
    Colour colour{};
    double fontSize{0.0};

    bool operator==(const TextOut& other) const {
        return topLeft == other.topLeft && text == other.text && colour == other.colour && fontSize == other.fontSize;
    }
};

struct EntityOut {
    Entity entity{};
    TextOut text{};
    FilledBox textBox{};
    FilledBox dateBox{};
    bool isSelected{false};

    bool operator==(const EntityOut& other) const {
        return entity == other.entity && text == other.text && textBox == other.textBox && dateBox == other.dateBox
            && isSelected == other.isSelected;
    }
};

struct Heading {
    TextOut text{};
    FilledBox textBox{};

    // Copy shifted horizontally; headings never move vertically.
    Heading withOffset(double dx) const {
        Heading out = *this;
        out.text.topLeft.x += dx;
        out.textBox.positionAndSize.position.x += dx;
        return out;
    }

    bool operator==(const Heading& other) const { return text == other.text && textBox == other.textBox; }
};

struct VerticalLine {
    double x{0.0};
    LineStyle style{};

    bool operator==(const VerticalLine& other) const noexcept { return x == other.x && style == other.style; }
};

struct Background {
    double x{0.0};
    double width{0.0};
    Colour colour{};

    bool operator==(const Background& other) const noexcept {
        return x == other.x && width == other.width && colour == other.colour;
    }
};

} // namespace chronoline
