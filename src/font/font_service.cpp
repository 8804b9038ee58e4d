#include <trellis/font/font_service.h>
#include <trellis/font/embedded_font.h>
#include <trellis/font/freetype_font_service.h>
#include <trellis/core/config.h>
#include <trellis/core/diagnostics.h>

namespace trellis::font {

namespace {

std::unique_ptr<FreeTypeFontService> load_embedded_font(core::DiagnosticEmitter* diagnostics) {
    std::string error;
    auto service = FreeTypeFontService::from_memory(embedded::kDefaultFontData,
                                                    embedded::kDefaultFontSize, error);
    if (!service) {
        // Without the default font no text can ever be laid out
        auto trace = core::capture_failure(diagnostics, core::config::kFontModule, "load",
                                           "embedded default font failed to load: " + error);
        trace.add_snapshot("bytes", std::to_string(embedded::kDefaultFontSize));
        core::fatal_error(trace);
    }

    const FontRef face = service->font();
    core::emit_if(diagnostics, core::Severity::Info, core::config::kFontModule, "load",
                  "loaded " + face->family + " " + face->style + " (" +
                  std::to_string(face->glyph_count) + " glyphs)");
    return service;
}

} // namespace

float FontService::space_advance(float text_size) const {
    return shape(" ", text_size).width;
}

const FontService& default_font_service(core::DiagnosticEmitter* diagnostics) {
    static const std::unique_ptr<FreeTypeFontService> service = load_embedded_font(diagnostics);
    return *service;
}

uint32_t next_code_point(std::string_view text, size_t& pos) {
    constexpr uint32_t kReplacement = 0xFFFD;
    const auto lead = static_cast<unsigned char>(text[pos]);

    size_t length = 0;
    uint32_t cp = 0;
    if (lead < 0x80) {
        ++pos;
        return lead;
    } else if ((lead & 0xE0) == 0xC0) {
        length = 2;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        cp = lead & 0x07;
    } else {
        ++pos;
        return kReplacement;
    }

    if (pos + length > text.size()) {
        ++pos;
        return kReplacement;
    }
    for (size_t i = 1; i < length; ++i) {
        const auto byte = static_cast<unsigned char>(text[pos + i]);
        if ((byte & 0xC0) != 0x80) {
            ++pos;
            return kReplacement;
        }
        cp = (cp << 6) | (byte & 0x3F);
    }
    pos += length;
    return cp;
}

} // namespace trellis::font
