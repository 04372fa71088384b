#ifndef CHRONOLINE_TEXT_FONT_FACE_H
#define CHRONOLINE_TEXT_FONT_FACE_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;
typedef struct hb_font_t hb_font_t;

namespace chronoline::text {

// Vertical metrics in pixels at a given font size.
struct LineMetrics {
    double ascender{0.0};   // above the baseline, positive
    double descender{0.0};  // below the baseline, negative
    double lineGap{0.0};

    double lineHeight() const noexcept { return ascender - descender + lineGap; }
};

/**
 * FontFace: the one font labels are measured with.
 *
 * Owns the FreeType library, the face, the HarfBuzz font built on it and the
 * font bytes the face reads from. Loading a new font replaces the current one
 * only when the new one loads; a failed load leaves the face as it was.
 */
class FontFace {
public:
    FontFace();
    ~FontFace();

    FontFace(const FontFace&) = delete;
    FontFace& operator=(const FontFace&) = delete;

    bool loadFromMemory(const std::uint8_t* data, std::size_t size);
    bool loadFromFile(const std::string& path);

    bool isLoaded() const { return hbFont_ != nullptr; }
    hb_font_t* hbFont() const { return hbFont_; }

    // Estimated (0.8 / -0.2 / 0.1 em) when nothing is loaded.
    LineMetrics metricsAt(double fontSizePx) const;

    // Sizes the face and the HarfBuzz font so one point is one pixel.
    bool setPixelSize(double fontSizePx);

private:
    FT_Library library_ = nullptr;
    FT_Face face_ = nullptr;
    hb_font_t* hbFont_ = nullptr;
    std::vector<std::uint8_t> data_;

    // In font units
    double unitsPerEm_ = 1000.0;
    LineMetrics unitMetrics_{};

    void release();
};

} // namespace chronoline::text

#endif // CHRONOLINE_TEXT_FONT_FACE_H
