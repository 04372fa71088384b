#pragma once

#include "chronoline/core/types.h"
#include "chronoline/layout/date_range.h"
#include "chronoline/layout/layout_params.h"
#include "chronoline/render/colours.h"
#include "chronoline/render/primitives.h"

#include <cstdint>
#include <string>
#include <vector>

namespace chronoline {

/**
 * Header bands in unpanned layout space: one "1990s" heading per decade and,
 * above kDatetimeScaleShowYears, a second band of year headings ("'95", or
 * "1995" from kDatetimeScaleShowFullYears). Labels are centred in their box.
 */
std::vector<Heading> buildHeadings(
    const TimelineDateRange& dateRange,
    const MeasuredLayoutParams& measured,
    const ScalableLayoutParams& zoomed,
    double datetimeScale,
    const HeadingStyle& style,
    const MeasureTextFn& measure);

// "'95" below kDatetimeScaleShowFullYears, "1995" from it. Negative years are
// always written in full ("-5").
std::string yearHeadingText(std::int32_t year, double datetimeScale);

} // namespace chronoline
