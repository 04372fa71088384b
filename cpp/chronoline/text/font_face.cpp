#include "chronoline/text/font_face.h"

#include "chronoline/core/logging.h"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_TRUETYPE_TABLES_H

#include <hb.h>
#include <hb-ft.h>

#include <fstream>
#include <utility>

namespace chronoline::text {

namespace {

// Prefers the OS/2 typographic metrics, falling back to hhea through FreeType.
LineMetrics readUnitMetrics(FT_Face face) {
    LineMetrics metrics;
    metrics.ascender = face->ascender;
    metrics.descender = face->descender;
    metrics.lineGap = face->height - face->ascender + face->descender;

    const auto* os2 = static_cast<const TT_OS2*>(FT_Get_Sfnt_Table(face, FT_SFNT_OS2));
    if (os2 && (os2->sTypoAscender != 0 || os2->sTypoDescender != 0)) {
        metrics.ascender = os2->sTypoAscender;
        metrics.descender = os2->sTypoDescender;
        metrics.lineGap = os2->sTypoLineGap;
    }
    return metrics;
}

} // namespace

FontFace::FontFace() {
    const FT_Error error = FT_Init_FreeType(&library_);
    if (error) {
        CHRONOLINE_LOG_WARN("FontFace: FT_Init_FreeType failed (error %d)", static_cast<int>(error));
        library_ = nullptr;
    }
}

FontFace::~FontFace() {
    release();
    if (library_) {
        FT_Done_FreeType(library_);
    }
}

void FontFace::release() {
    if (hbFont_) {
        hb_font_destroy(hbFont_);
        hbFont_ = nullptr;
    }
    if (face_) {
        FT_Done_Face(face_);
        face_ = nullptr;
    }
    data_.clear();
}

bool FontFace::loadFromMemory(const std::uint8_t* data, std::size_t size) {
    if (!library_ || !data || size == 0) {
        CHRONOLINE_LOG_WARN("FontFace: cannot load font (%zu bytes)", size);
        return false;
    }

    // The face reads from this buffer until it is released; moving the
    // vector keeps the buffer where it is.
    std::vector<std::uint8_t> bytes(data, data + size);

    FT_Face face = nullptr;
    const FT_Error error = FT_New_Memory_Face(library_, bytes.data(), static_cast<FT_Long>(bytes.size()), 0, &face);
    if (error || !face) {
        CHRONOLINE_LOG_WARN("FontFace: FT_New_Memory_Face failed (error %d)", static_cast<int>(error));
        return false;
    }
    if (face->units_per_EM == 0) {
        CHRONOLINE_LOG_WARN("FontFace: face has no units per em");
        FT_Done_Face(face);
        return false;
    }

    hb_font_t* font = hb_ft_font_create(face, nullptr);
    if (!font) {
        CHRONOLINE_LOG_WARN("FontFace: hb_ft_font_create failed");
        FT_Done_Face(face);
        return false;
    }

    release();
    face_ = face;
    hbFont_ = font;
    data_ = std::move(bytes);
    unitsPerEm_ = face->units_per_EM;
    unitMetrics_ = readUnitMetrics(face);

    CHRONOLINE_LOG_DEBUG("FontFace: loaded '%s' (%u units per em)",
        face->family_name ? face->family_name : "?", static_cast<unsigned>(face->units_per_EM));
    return true;
}

bool FontFace::loadFromFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        CHRONOLINE_LOG_WARN("FontFace: cannot open '%s'", path.c_str());
        return false;
    }

    const std::streamsize size = file.tellg();
    if (size <= 0) {
        CHRONOLINE_LOG_WARN("FontFace: '%s' is empty", path.c_str());
        return false;
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        CHRONOLINE_LOG_WARN("FontFace: failed reading '%s'", path.c_str());
        return false;
    }
    return loadFromMemory(buffer.data(), buffer.size());
}

LineMetrics FontFace::metricsAt(double fontSizePx) const {
    if (!isLoaded()) {
        return LineMetrics{0.8 * fontSizePx, -0.2 * fontSizePx, 0.1 * fontSizePx};
    }
    const double scale = fontSizePx / unitsPerEm_;
    return LineMetrics{unitMetrics_.ascender * scale, unitMetrics_.descender * scale, unitMetrics_.lineGap * scale};
}

bool FontFace::setPixelSize(double fontSizePx) {
    if (!isLoaded()) {
        return false;
    }

    // 26.6 fixed point at 72 DPI
    const auto size26_6 = static_cast<FT_F26Dot6>(fontSizePx * 64.0);
    const FT_Error error = FT_Set_Char_Size(face_, 0, size26_6, 72, 72);
    if (error) {
        CHRONOLINE_LOG_WARN("FontFace: FT_Set_Char_Size(%f) failed (error %d)", fontSizePx, static_cast<int>(error));
        return false;
    }
    hb_font_set_scale(hbFont_, static_cast<int>(size26_6), static_cast<int>(size26_6));
    return true;
}

} // namespace chronoline::text
