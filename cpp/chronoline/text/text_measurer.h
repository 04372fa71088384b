#ifndef CHRONOLINE_TEXT_TEXT_MEASURER_H
#define CHRONOLINE_TEXT_TEXT_MEASURER_H

#include "chronoline/core/types.h"
#include "chronoline/text/font_face.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

typedef struct hb_buffer_t hb_buffer_t;

namespace chronoline::text {

/**
 * TextMeasurer: single-line label measurement backed by HarfBuzz shaping.
 *
 * Width is the sum of shaped advances, height is ascender - descender +
 * line gap of the font at the requested size. Without a loaded font the
 * measurer falls back to estimated metrics (half the font size per
 * codepoint), so it can always be handed to the engine.
 */
class TextMeasurer {
public:
    TextMeasurer();
    ~TextMeasurer();

    TextMeasurer(const TextMeasurer&) = delete;
    TextMeasurer& operator=(const TextMeasurer&) = delete;

    // Replaces the current font. On failure the current font stays.
    bool loadFontFromFile(const std::string& filePath);
    bool loadFontFromMemory(const std::uint8_t* fontData, std::size_t dataSize);

    bool hasFont() const { return face_.isLoaded(); }

    TextSize measure(double fontSizePx, const std::string& text);

    // Adapter for TimelineEngine. The measurer must outlive the returned function.
    MeasureTextFn measureFn();

    static std::size_t countCodepoints(std::string_view utf8);

private:
    FontFace face_;
    hb_buffer_t* hbBuffer_ = nullptr;

    double shapedWidth(double fontSizePx, const std::string& text);
};

} // namespace chronoline::text

#endif // CHRONOLINE_TEXT_TEXT_MEASURER_H
