#pragma once

#include "chronoline/core/types.h"

namespace chronoline {

/**
 * User-adjustable pixel measurements. The engine keeps a fixed copy (as set by
 * the user) and a zoomed copy derived from it.
 */
struct ScalableLayoutParams {
    double rowMargin{5.0};
    double minInlineSpacing{5.0};
    double paddingX{10.0};
    double paddingY{7.0};
    double fontSizePx{12.0};
    double dividingLineThickness{0.5};
    double entityHighlightThickness{10.0};

    bool operator==(const ScalableLayoutParams& other) const noexcept {
        return rowMargin == other.rowMargin && minInlineSpacing == other.minInlineSpacing && paddingX == other.paddingX
            && paddingY == other.paddingY && fontSizePx == other.fontSizePx
            && dividingLineThickness == other.dividingLineThickness
            && entityHighlightThickness == other.entityHighlightThickness;
    }
    bool operator!=(const ScalableLayoutParams& other) const noexcept { return !(*this == other); }
};

// Every measurement multiplied by the zoom factor.
ScalableLayoutParams deriveZoomed(const ScalableLayoutParams& fixed, double zoom) noexcept;

// Parameters derived from measured text.
struct MeasuredLayoutParams {
    double yearWidth{0.0};
    double rowHeightNoPadding{0.0};

    double decadeWidth() const noexcept { return yearWidth * 10.0; }
};

/**
 * Measure the row text height and the year width at the zoomed font size.
 * The decade heading width is stretched by the datetime scale before padding
 * is added.
 */
MeasuredLayoutParams measureLayoutParams(
    const MeasureTextFn& measure,
    const ScalableLayoutParams& zoomed,
    double datetimeScale);

// Text row height plus vertical padding (entity and heading box height).
inline double boxHeight(const MeasuredLayoutParams& measured, const ScalableLayoutParams& zoomed) noexcept {
    return measured.rowHeightNoPadding + (2.0 * zoomed.paddingY);
}

// Distance between two rows of entities.
inline double rowPitch(const MeasuredLayoutParams& measured, const ScalableLayoutParams& zoomed) noexcept {
    return measured.rowHeightNoPadding + zoomed.rowMargin + (2.0 * zoomed.paddingY);
}

} // namespace chronoline
