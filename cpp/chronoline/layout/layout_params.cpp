#include "chronoline/layout/layout_params.h"

#include "chronoline/layout/layout_constants.h"

#include <string>

namespace chronoline {

ScalableLayoutParams deriveZoomed(const ScalableLayoutParams& fixed, double zoom) noexcept {
    ScalableLayoutParams zoomed;
    zoomed.rowMargin = fixed.rowMargin * zoom;
    zoomed.minInlineSpacing = fixed.minInlineSpacing * zoom;
    zoomed.paddingX = fixed.paddingX * zoom;
    zoomed.paddingY = fixed.paddingY * zoom;
    zoomed.fontSizePx = fixed.fontSizePx * zoom;
    zoomed.dividingLineThickness = fixed.dividingLineThickness * zoom;
    zoomed.entityHighlightThickness = fixed.entityHighlightThickness * zoom;
    return zoomed;
}

MeasuredLayoutParams measureLayoutParams(
    const MeasureTextFn& measure,
    const ScalableLayoutParams& zoomed,
    double datetimeScale) {
    MeasuredLayoutParams measured;
    if (!measure) {
        return measured;
    }

    measured.rowHeightNoPadding = measure(zoomed.fontSizePx, std::string(kRowHeightProbe)).height;

    const double decadeStrWidth = measure(zoomed.fontSizePx, std::string(kDecadeWidthProbe)).width * datetimeScale;
    measured.yearWidth = (decadeStrWidth + (zoomed.paddingX * 2.0)) / 10.0;
    return measured;
}

} // namespace chronoline
