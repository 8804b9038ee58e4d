#ifndef TRELLIS_CORE_CONFIG_H
#define TRELLIS_CORE_CONFIG_H

#include <cstddef>
#include <cstdint>

namespace trellis::core::config {

inline constexpr float kDefaultTextSize = 16.0f;
inline constexpr float kDefaultViewportWidth = 1280.0f;
inline constexpr float kDefaultViewportHeight = 720.0f;

// Used when a font reports no usable vertical metrics.
inline constexpr float kFallbackLineHeightFactor = 1.2f;
inline constexpr float kFallbackAscentFactor = 0.8f;

inline constexpr const char kEmbeddedFontFamily[] = "Lato";
inline constexpr const char kEmbeddedFontStyle[] = "Regular";

// Events a DiagnosticEmitter keeps before dropping the oldest.
inline constexpr std::size_t kDiagnosticHistoryLimit = 4096;
// Most recent events copied into a FailureTrace.
inline constexpr std::size_t kFailureContextEvents = 16;

// Module names used for diagnostics.
inline constexpr const char kStyleModule[] = "style";
inline constexpr const char kLayoutModule[] = "layout";
inline constexpr const char kFontModule[] = "font";
inline constexpr const char kPipelineModule[] = "pipeline";

}  // namespace trellis::core::config

#endif  // TRELLIS_CORE_CONFIG_H
