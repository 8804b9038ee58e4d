#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace trellis::core {
class DiagnosticEmitter;
}

namespace trellis::font {

// Identity of a loaded font face. Text fragments hold a FontRef so the
// renderer knows which face the glyph indices belong to.
struct FontFace {
    std::string family;
    std::string style;
    uint32_t glyph_count = 0;
};

using FontRef = std::shared_ptr<const FontFace>;

// Vertical metrics scaled to a text size. `descent` is positive (distance
// below the baseline).
struct FontMetrics {
    float ascent = 0;
    float descent = 0;
    float line_gap = 0;

    float line_height() const { return ascent + descent + line_gap; }
};

struct ShapedGlyph {
    uint32_t index = 0;
    float x = 0;        // pen position of the glyph within the run
    float advance = 0;
};

struct ShapedText {
    std::vector<ShapedGlyph> glyphs;
    float width = 0;
};

// Shapes text into positioned glyphs and reports line metrics. Layout only
// sees this interface; the default implementation wraps FreeType.
class FontService {
public:
    virtual ~FontService() = default;

    virtual FontRef font() const = 0;
    virtual FontMetrics metrics(float text_size) const = 0;
    virtual ShapedText shape(std::string_view text, float text_size) const = 0;

    // Advance of one collapsed inter-word space.
    virtual float space_advance(float text_size) const;
};

// The process-wide service over the embedded default font. Created on first
// call and never reloaded; a font that fails to load aborts the process.
const FontService& default_font_service(core::DiagnosticEmitter* diagnostics = nullptr);

// Decode the next UTF-8 code point starting at `pos`, advancing `pos`.
// Malformed bytes decode as U+FFFD and consume one byte.
uint32_t next_code_point(std::string_view text, size_t& pos);

} // namespace trellis::font
