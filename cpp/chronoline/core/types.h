#ifndef CHRONOLINE_CORE_TYPES_H
#define CHRONOLINE_CORE_TYPES_H

#include <algorithm>
#include <cstdint>
#include <functional>
#include <string>

// Lightweight geometry types shared by the layout engine and its outputs.
// All coordinates are in pixels, y grows downwards.

namespace chronoline {

using EntityId = std::uint64_t;

struct Point {
    double x{0.0};
    double y{0.0};

    Point min(const Point& other) const noexcept {
        return Point{std::min(x, other.x), std::min(y, other.y)};
    }
    Point max(const Point& other) const noexcept {
        return Point{std::max(x, other.x), std::max(y, other.y)};
    }

    bool operator==(const Point& other) const noexcept { return x == other.x && y == other.y; }
    bool operator!=(const Point& other) const noexcept { return !(*this == other); }
};

using TimelineOffset = Point;
using Position = Point;
using Size = Point;

// A box growing down and to the right from `position`.
struct PositionAndSize {
    Position position{};
    double width{0.0};
    double height{0.0};

    void addOffset(double dx, double dy) noexcept {
        position.x += dx;
        position.y += dy;
    }
    double maxX() const noexcept { return position.x + width; }
    double maxY() const noexcept { return position.y + height; }

    bool operator==(const PositionAndSize& other) const noexcept {
        return position == other.position && width == other.width && height == other.height;
    }
    bool operator!=(const PositionAndSize& other) const noexcept { return !(*this == other); }
};

// Result of measuring a string of text.
struct TextSize {
    double width{0.0};
    double height{0.0};
};

// measure(fontSizePx, text) -> (width, height). Must be deterministic for identical inputs.
using MeasureTextFn = std::function<TextSize(double fontSizePx, const std::string& text)>;

} // namespace chronoline

#endif // CHRONOLINE_CORE_TYPES_H
