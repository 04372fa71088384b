// TimelineEngine zoom, datetime scale, pan and canvas handling.

#include "chronoline/engine.h"

#include "chronoline/core/logging.h"
#include "chronoline/layout/layout_constants.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace chronoline {

void TimelineEngine::updateZoomedLayoutParams() {
    zoomedLayoutParams_ = deriveZoomed(fixedLayoutParams_, zoom_);
}

double TimelineEngine::headerHeight() const noexcept {
    return boxHeight(measuredLayoutParams_, zoomedLayoutParams_);
}

double TimelineEngine::headerAutoOffset() const noexcept {
    return datetimeScale_ > kDatetimeScaleShowYears ? headerHeight() : 0.0;
}

void TimelineEngine::zoomIn(double factor, double localX, double localY) {
    if (!std::isfinite(factor) || !(factor > 0.0)) return;
    const double newZoom = std::clamp(zoom_ * factor, kMinZoom, kMaxZoom);
    // Exact comparison: at a limit the clamp returns the limit itself
    if (newZoom == zoom_) return;

    // Anchor moves by the factor actually applied, not the one requested
    const double applied = newZoom / zoom_;
    zoom_ = newZoom;
    offset_.x = localX - ((localX - offset_.x) * applied);
    offset_.y = localY - ((localY - offset_.y) * applied);

    updateZoomedLayoutParams();
    recalculate();
}

void TimelineEngine::zoomOut(double factor, double localX, double localY) {
    if (!std::isfinite(factor) || !(factor > 0.0)) return;
    const double newZoom = std::clamp(zoom_ / factor, kMinZoom, kMaxZoom);
    if (newZoom == zoom_) return;

    const double applied = zoom_ / newZoom;
    zoom_ = newZoom;
    offset_.x = localX - ((localX - offset_.x) / applied);
    offset_.y = localY - ((localY - offset_.y) / applied);

    updateZoomedLayoutParams();
    recalculate();
}

void TimelineEngine::setZoom(double zoom) {
    if (!std::isfinite(zoom)) {
        CHRONOLINE_LOG_WARN("setZoom: ignoring non-finite zoom");
        return;
    }
    zoom_ = std::clamp(zoom, kMinZoom, kMaxZoom);
    updateZoomedLayoutParams();
    recalculate();
}

void TimelineEngine::setDatetimeScale(double scale) {
    if (!std::isfinite(scale)) {
        CHRONOLINE_LOG_WARN("setDatetimeScale: ignoring non-finite scale");
        return;
    }
    datetimeScale_ = std::clamp(scale, kMinDatetimeScale, kMaxDatetimeScale);
    updateZoomedLayoutParams();
    recalculate();
}

void TimelineEngine::addToGlobalOffset(double dx, double dy) {
    offset_.x += dx;
    offset_.y += dy;
    clampGlobalOffset();
    ++generation_;
    CHRONOLINE_LOG_TRACE("pan by (%.2f, %.2f) -> offset (%.2f, %.2f)", dx, dy, offset_.x, offset_.y);
}

void TimelineEngine::setCanvasMax(double x, double y) {
    canvasSize_ = Size{x, y};
    clampGlobalOffset();
    ++generation_;
}

void TimelineEngine::clampGlobalOffset() {
    // The top left corner cannot be dragged down or right
    offset_.x = std::min(offset_.x, 0.0);
    offset_.y = std::min(offset_.y, 0.0);

    double maxX = -std::numeric_limits<double>::infinity();
    double maxY = -std::numeric_limits<double>::infinity();
    bool any = false;
    for (const WorkingEntity& entity : workingEntities_) {
        if (entity.isFilteredOut()) continue;
        any = true;
        maxX = std::max(maxX, entity.maxX());
        maxY = std::max(maxY, entity.maxY());
    }
    if (!any) {
        offset_ = TimelineOffset{};
        return;
    }

    if (maxX > canvasSize_.x) {
        offset_.x = std::max(offset_.x, canvasSize_.x - maxX);
    } else {
        offset_.x = std::max(offset_.x, 0.0);
    }

    const double contentBottom = maxY + headerAutoOffset() + zoomedLayoutParams_.rowMargin;
    if (contentBottom > canvasSize_.y) {
        offset_.y = std::max(offset_.y, canvasSize_.y - contentBottom);
    } else {
        offset_.y = std::max(offset_.y, 0.0);
    }
}

} // namespace chronoline
