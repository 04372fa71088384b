#include "chronoline/text/text_measurer.h"

#include <hb.h>

namespace chronoline::text {

namespace {
constexpr double kEstimatedAdvanceEm = 0.5;
}

TextMeasurer::TextMeasurer() {
    hbBuffer_ = hb_buffer_create();
}

TextMeasurer::~TextMeasurer() {
    if (hbBuffer_) {
        hb_buffer_destroy(hbBuffer_);
        hbBuffer_ = nullptr;
    }
}

bool TextMeasurer::loadFontFromFile(const std::string& filePath) {
    return face_.loadFromFile(filePath);
}

bool TextMeasurer::loadFontFromMemory(const std::uint8_t* fontData, std::size_t dataSize) {
    return face_.loadFromMemory(fontData, dataSize);
}

TextSize TextMeasurer::measure(double fontSizePx, const std::string& text) {
    if (fontSizePx <= 0.0) {
        return TextSize{};
    }

    TextSize size;
    size.height = face_.metricsAt(fontSizePx).lineHeight();

    if (face_.isLoaded() && hbBuffer_) {
        size.width = shapedWidth(fontSizePx, text);
    } else {
        size.width = static_cast<double>(countCodepoints(text)) * fontSizePx * kEstimatedAdvanceEm;
    }
    return size;
}

MeasureTextFn TextMeasurer::measureFn() {
    return [this](double fontSizePx, const std::string& text) { return measure(fontSizePx, text); };
}

std::size_t TextMeasurer::countCodepoints(std::string_view utf8) {
    std::size_t count = 0;
    for (unsigned char c : utf8) {
        // Continuation bytes are 10xxxxxx
        if ((c & 0xC0u) != 0x80u) {
            ++count;
        }
    }
    return count;
}

double TextMeasurer::shapedWidth(double fontSizePx, const std::string& text) {
    if (text.empty() || !face_.setPixelSize(fontSizePx)) {
        return 0.0;
    }

    hb_buffer_reset(hbBuffer_);
    hb_buffer_add_utf8(hbBuffer_, text.data(), static_cast<int>(text.size()), 0, -1);
    hb_buffer_guess_segment_properties(hbBuffer_);
    hb_shape(face_.hbFont(), hbBuffer_, nullptr, 0);

    unsigned int glyphCount = 0;
    hb_glyph_position_t* glyphPos = hb_buffer_get_glyph_positions(hbBuffer_, &glyphCount);
    if (!glyphPos) {
        return 0.0;
    }

    // HarfBuzz positions are 26.6 fixed point
    const double scale = 1.0 / 64.0;
    double width = 0.0;
    for (unsigned int i = 0; i < glyphCount; ++i) {
        width += glyphPos[i].x_advance * scale;
    }
    return width;
}

} // namespace chronoline::text
