#pragma once
#include <cstddef>
#include <cstdint>

namespace trellis::font::embedded {

// Bytes of the default font file, compiled in by the build.
extern const uint8_t kDefaultFontData[];
extern const size_t kDefaultFontSize;

} // namespace trellis::font::embedded
