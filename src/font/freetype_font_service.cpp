#include <trellis/font/freetype_font_service.h>
#include <trellis/core/config.h>

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_ADVANCES_H

#include <algorithm>

namespace trellis::font {

std::unique_ptr<FreeTypeFontService> FreeTypeFontService::from_memory(const uint8_t* data,
                                                                      size_t size,
                                                                      std::string& error) {
    if (!data || size == 0) {
        error = "font data is empty";
        return nullptr;
    }

    FT_Library library = nullptr;
    FT_Error status = FT_Init_FreeType(&library);
    if (status != 0) {
        error = "FT_Init_FreeType failed: error=" + std::to_string(status);
        return nullptr;
    }

    FT_Face face = nullptr;
    status = FT_New_Memory_Face(library, data, static_cast<FT_Long>(size), 0, &face);
    if (status != 0) {
        error = "FT_New_Memory_Face failed: error=" + std::to_string(status);
        FT_Done_FreeType(library);
        return nullptr;
    }

    return std::unique_ptr<FreeTypeFontService>(new FreeTypeFontService(library, face));
}

FreeTypeFontService::FreeTypeFontService(FT_Library library, FT_Face face)
    : library_(library)
    , face_(face) {
    auto info = std::make_shared<FontFace>();
    info->family = face_->family_name ? face_->family_name : core::config::kEmbeddedFontFamily;
    info->style = face_->style_name ? face_->style_name : core::config::kEmbeddedFontStyle;
    info->glyph_count = static_cast<uint32_t>(face_->num_glyphs);
    font_ = std::move(info);

    has_kerning_ = FT_HAS_KERNING(face_);
    units_per_em_ = face_->units_per_EM;
}

FreeTypeFontService::~FreeTypeFontService() {
    if (face_) FT_Done_Face(face_);
    if (library_) FT_Done_FreeType(library_);
}

float FreeTypeFontService::scale(float text_size) const {
    if (units_per_em_ == 0) return 0;
    return text_size / static_cast<float>(units_per_em_);
}

uint32_t FreeTypeFontService::glyph_index(uint32_t code_point) const {
    return FT_Get_Char_Index(face_, code_point);
}

FontMetrics FreeTypeFontService::metrics(float text_size) const {
    FontMetrics m;
    const float s = scale(text_size);
    if (s <= 0 || face_->ascender <= 0) {
        // Bitmap-only or broken vertical metrics
        m.ascent = text_size * core::config::kFallbackAscentFactor;
        m.descent = text_size * (core::config::kFallbackLineHeightFactor -
                                 core::config::kFallbackAscentFactor);
        return m;
    }

    const float ascender = static_cast<float>(face_->ascender);
    const float descender = static_cast<float>(-face_->descender);
    const float height = static_cast<float>(face_->height);
    m.ascent = ascender * s;
    m.descent = descender * s;
    m.line_gap = std::max(0.0f, height - (ascender + descender)) * s;
    return m;
}

ShapedText FreeTypeFontService::shape(std::string_view text, float text_size) const {
    ShapedText run;
    const float s = scale(text_size);
    float pen = 0;
    FT_UInt previous = 0;

    size_t pos = 0;
    while (pos < text.size()) {
        const uint32_t code_point = next_code_point(text, pos);
        const FT_UInt index = FT_Get_Char_Index(face_, code_point);

        if (has_kerning_ && previous != 0 && index != 0) {
            FT_Vector delta;
            if (FT_Get_Kerning(face_, previous, index, FT_KERNING_UNSCALED, &delta) == 0) {
                pen += static_cast<float>(delta.x) * s;
            }
        }

        FT_Fixed advance = 0;
        if (FT_Get_Advance(face_, index, FT_LOAD_NO_SCALE, &advance) != 0) {
            // No usable metrics for this glyph: it takes no room
            advance = 0;
        }

        ShapedGlyph glyph;
        glyph.index = index;
        glyph.x = pen;
        glyph.advance = static_cast<float>(advance) * s;
        run.glyphs.push_back(glyph);

        pen += glyph.advance;
        previous = index;
    }

    run.width = pen;
    return run;
}

} // namespace trellis::font
