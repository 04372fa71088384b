// TimelineEngine drawing queries. Layout positions are translated by the pan
// offset here and culled against the canvas; stored layout is never touched.

#include "chronoline/engine.h"

#include "chronoline/core/util.h"
#include "chronoline/layout/layout_constants.h"
#include "chronoline/render/visibility.h"

#include <algorithm>
#include <cmath>

namespace chronoline {

std::vector<EntityOut> TimelineEngine::entitiesForDrawing() const {
    std::vector<EntityOut> out;
    out.reserve(workingEntities_.size());

    const double dy = offset_.y + headerAutoOffset();

    for (const WorkingEntity& entity : workingEntities_) {
        if (entity.isFilteredOut()) continue;

        WorkingEntity drawn = entity.withOffset(offset_.x, dy);
        if (drawn.isHoveredOver) {
            drawn.textBox.fillColour = Colour::lightened(drawn.textBox.fillColour);
            drawn.dateBox.fillColour = Colour::lightened(drawn.dateBox.fillColour);
            drawn.text.colour = Colour::lightened(drawn.text.colour);
        }
        if (stickyText_) {
            drawn.adjustStickyText(zoomedLayoutParams_.paddingX);
        }

        const PositionAndSize& textBox = drawn.textBox.positionAndSize;
        const PositionAndSize& dateBox = drawn.dateBox.positionAndSize;
        const Point min = textBox.position.min(dateBox.position);
        const Point max = Point{textBox.maxX(), textBox.maxY()}.max(Point{dateBox.maxX(), dateBox.maxY()});
        if (!isVisible(min, max, canvasSize_)) continue;

        out.push_back(drawn.toOutput());
    }
    return out;
}

std::vector<Heading> TimelineEngine::headingsForDrawing() const {
    std::vector<Heading> out;
    out.reserve(headings_.size());
    for (const Heading& heading : headings_) {
        Heading shifted = heading.withOffset(offset_.x);
        if (!isVisible(shifted.textBox.positionAndSize, canvasSize_)) continue;
        out.push_back(std::move(shifted));
    }
    return out;
}

std::vector<VerticalLine> TimelineEngine::linesForDrawing() const {
    std::vector<VerticalLine> lines;
    const std::int32_t decadeCount = dateRange_.decadeCount();
    if (decadeCount <= 0) {
        return lines;
    }

    const double decadeWidth = measuredLayoutParams_.decadeWidth();
    const double yearWidth = measuredLayoutParams_.yearWidth;
    const double thickness = zoomedLayoutParams_.dividingLineThickness;
    const bool showYearLines = datetimeScale_ > kDatetimeScaleShowYearLinesPartial;

    // Year lines are two shades lighter, plus one per fade step below the full threshold
    Colour yearColour = Colour::lightened(Colour::lightened(colours_.dividingLine.colour));
    if (showYearLines && datetimeScale_ < kDatetimeScaleShowYearLinesFull) {
        const auto fadeSteps =
            static_cast<int>(std::round((kDatetimeScaleShowYearLinesFull - datetimeScale_) / kYearLineFadeStep));
        for (int i = 0; i < fadeSteps; ++i) {
            yearColour = Colour::lightened(yearColour);
        }
    }

    auto pushIfVisible = [&](double x, Colour colour) {
        const Point min{x - thickness / 2.0, 0.0};
        const Point max{x + thickness / 2.0, canvasSize_.y};
        if (isVisible(min, max, canvasSize_)) {
            lines.push_back(VerticalLine{x, LineStyle{colour, thickness}});
        }
    };

    for (std::int32_t decadeNumber = 0; decadeNumber <= decadeCount; ++decadeNumber) {
        const double decadeMinX = (static_cast<double>(decadeNumber) * decadeWidth) + offset_.x;
        pushIfVisible(decadeMinX, colours_.dividingLine.colour);

        if (showYearLines && decadeNumber != decadeCount) {
            for (int yearNumber = 1; yearNumber < 10; ++yearNumber) {
                pushIfVisible(decadeMinX + (yearWidth * static_cast<double>(yearNumber)), yearColour);
            }
        }
    }
    return lines;
}

std::vector<Background> TimelineEngine::backgroundsForDrawing() const {
    std::vector<Background> backgrounds;
    const double width = measuredLayoutParams_.decadeWidth();
    for (std::int32_t decadeNumber = 0; decadeNumber < dateRange_.decadeCount(); ++decadeNumber) {
        const std::int32_t decade =
            saturateToI32(static_cast<std::int64_t>(dateRange_.decadeRangeStart()) + std::int64_t{10} * decadeNumber);
        const double x = (static_cast<double>(decadeNumber) * width) + offset_.x;
        if (!isVisible(Point{x, 0.0}, Point{x + width, canvasSize_.y}, canvasSize_)) continue;

        // Stripes alternate by century
        const Colour colour = (decade / 100) % 2 == 0 ? colours_.background.a : colours_.background.b;
        backgrounds.push_back(Background{x, width, colour});
    }
    return backgrounds;
}

} // namespace chronoline
