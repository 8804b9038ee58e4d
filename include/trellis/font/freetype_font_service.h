#pragma once
#include <trellis/font/font_service.h>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

// Forward declarations for FreeType types used by the service
typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;

namespace trellis::font {

// FontService backed by a single FreeType face loaded from memory. Advances
// and kerning are read unscaled (font units) and scaled per call, so the face
// never has its size changed after loading.
class FreeTypeFontService : public FontService {
public:
    // `data` must stay alive for the lifetime of the service. Returns null and
    // fills `error` when FreeType cannot open the data.
    static std::unique_ptr<FreeTypeFontService> from_memory(const uint8_t* data, size_t size,
                                                            std::string& error);

    ~FreeTypeFontService() override;

    FreeTypeFontService(const FreeTypeFontService&) = delete;
    FreeTypeFontService& operator=(const FreeTypeFontService&) = delete;

    FontRef font() const override { return font_; }
    FontMetrics metrics(float text_size) const override;
    ShapedText shape(std::string_view text, float text_size) const override;

    bool has_kerning() const { return has_kerning_; }
    uint32_t units_per_em() const { return units_per_em_; }

    // Glyph index for a code point; 0 when the face has no glyph for it.
    uint32_t glyph_index(uint32_t code_point) const;

private:
    FreeTypeFontService(FT_Library library, FT_Face face);

    float scale(float text_size) const;

    FT_Library library_ = nullptr;
    FT_Face face_ = nullptr;
    FontRef font_;
    bool has_kerning_ = false;
    uint32_t units_per_em_ = 0;
};

} // namespace trellis::font
