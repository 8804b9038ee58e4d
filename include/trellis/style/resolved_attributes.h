#pragma once
#include <trellis/core/config.h>
#include <trellis/core/geometry.h>
#include <cstdint>
#include <optional>
#include <variant>

namespace trellis::style {

struct Color {
    uint8_t r = 0, g = 0, b = 0, a = 255;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }

    bool operator!=(const Color& other) const {
        return !(*this == other);
    }

    static Color rgb(uint8_t r, uint8_t g, uint8_t b) { return {r, g, b, 255}; }
    static Color black() { return {0, 0, 0, 255}; }
    static Color white() { return {255, 255, 255, 255}; }
    static Color transparent() { return {0, 0, 0, 0}; }
    static Color clear() { return transparent(); }
};

// Axis along which a block container stacks its children.
enum class Direction { Vertical, Horizontal };

struct BlockValues {
    Direction direction = Direction::Vertical;
    SideOffsets margin;
    SideOffsets padding;
    std::optional<float> width;
    std::optional<float> height;
    std::optional<float> min_width;
    std::optional<float> min_height;
    std::optional<float> max_width;
    std::optional<float> max_height;

    bool operator==(const BlockValues& other) const {
        return direction == other.direction && margin == other.margin &&
               padding == other.padding && width == other.width &&
               height == other.height && min_width == other.min_width &&
               min_height == other.min_height && max_width == other.max_width &&
               max_height == other.max_height;
    }
    bool operator!=(const BlockValues& other) const { return !(*this == other); }
};

struct InlineValues {
    bool operator==(const InlineValues&) const { return true; }
    bool operator!=(const InlineValues&) const { return false; }
};

using Display = std::variant<BlockValues, InlineValues>;

inline bool is_block(const Display& d) { return std::holds_alternative<BlockValues>(d); }
inline bool is_inline(const Display& d) { return std::holds_alternative<InlineValues>(d); }

// The fully resolved visual attributes of one element. Written wholesale by
// the cascade, read by layout.
struct ResolvedAttributes {
    Display display = BlockValues{};
    float text_size = core::config::kDefaultTextSize;
    Color text_color = Color::black();
    Color background_color = Color::transparent();
    float border_radius = 0;
    SideOffsets border_thickness;
    Color border_color = Color::transparent();

    bool operator==(const ResolvedAttributes& other) const {
        return display == other.display && text_size == other.text_size &&
               text_color == other.text_color &&
               background_color == other.background_color &&
               border_radius == other.border_radius &&
               border_thickness == other.border_thickness &&
               border_color == other.border_color;
    }
    bool operator!=(const ResolvedAttributes& other) const { return !(*this == other); }

    // Block values, or null when the element is inline.
    const BlockValues* block() const { return std::get_if<BlockValues>(&display); }
    BlockValues* block() { return std::get_if<BlockValues>(&display); }
};

} // namespace trellis::style
