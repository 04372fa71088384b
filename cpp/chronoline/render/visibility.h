#pragma once

#include "chronoline/core/types.h"

namespace chronoline {

/**
 * AABB test against the canvas [0, canvas.x] x [0, canvas.y]. The box's own
 * height is used as a vertical margin so rows just off screen are kept.
 */
inline bool isVisible(const Point& min, const Point& max, const Size& canvas) noexcept {
    const double height = max.y - min.y;
    if (min.x > canvas.x) return false;
    if (max.x < 0.0) return false;
    if (min.y - height > canvas.y) return false;
    if (max.y + height < 0.0) return false;
    return true;
}

inline bool isVisible(const PositionAndSize& box, const Size& canvas) noexcept {
    return isVisible(box.position, Point{box.maxX(), box.maxY()}, canvas);
}

} // namespace chronoline
