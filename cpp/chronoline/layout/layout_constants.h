#pragma once

namespace chronoline {

// Uniform zoom limits.
inline constexpr double kMinZoom = 0.2;
inline constexpr double kMaxZoom = 5.0;

// Horizontal (time axis) stretch limits.
inline constexpr double kMinDatetimeScale = 1.0;
inline constexpr double kMaxDatetimeScale = 12.0;

// Year-dividing lines appear above this scale, faded until kDatetimeScaleShowYearLinesFull.
inline constexpr double kDatetimeScaleShowYearLinesPartial = 1.5;
inline constexpr double kDatetimeScaleShowYearLinesFull = 3.0;
// Each 0.5 below the full threshold lightens year lines once more.
inline constexpr double kYearLineFadeStep = 0.5;

// Year headings ('95) appear above this scale.
inline constexpr double kDatetimeScaleShowYears = 3.0;
// Year headings switch to four digits (1995) from this scale.
inline constexpr double kDatetimeScaleShowFullYears = 6.0;

// Strings measured to derive the row height and the decade heading width.
inline constexpr const char* kRowHeightProbe = "lpfHT";
inline constexpr const char* kDecadeWidthProbe = "1234s";

// Maximum jitter applied to entity box colours.
inline constexpr unsigned kEntityColourJitter = 5;

} // namespace chronoline
