#pragma once
#include <trellis/core/geometry.h>
#include <trellis/font/font_service.h>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace trellis::dom {
class Element;
}

namespace trellis::layout {

struct Box;

// Shared, immutable handle to a Box. Handles compare by value so that a tree
// built this frame equals last frame's tree when nothing changed, whether or
// not the allocations are shared.
class BoxRef {
public:
    BoxRef() = default;
    explicit BoxRef(std::shared_ptr<const Box> box) : box_(std::move(box)) {}

    const Box& operator*() const { return *box_; }
    const Box* operator->() const { return box_.get(); }
    const Box* get() const { return box_.get(); }
    explicit operator bool() const { return box_ != nullptr; }

    bool same_allocation(const BoxRef& other) const { return box_ == other.box_; }
    long use_count() const { return box_.use_count(); }

    bool operator==(const BoxRef& other) const;
    bool operator!=(const BoxRef& other) const { return !(*this == other); }

private:
    std::shared_ptr<const Box> box_;
};

struct Glyph {
    uint32_t index = 0;
    Point offset;  // relative to the fragment origin; y is the baseline

    bool operator==(const Glyph& other) const {
        return index == other.index && offset == other.offset;
    }
    bool operator!=(const Glyph& other) const { return !(*this == other); }
};

// One line of shaped text.
struct TextFragment {
    font::FontRef font;
    Point origin;  // top-left of the line within the owning box
    float width = 0;
    std::vector<Glyph> glyphs;

    bool operator==(const TextFragment& other) const {
        return font == other.font && origin == other.origin && width == other.width &&
               glyphs == other.glyphs;
    }
    bool operator!=(const TextFragment& other) const { return !(*this == other); }
};

struct TextRun {
    std::vector<TextFragment> fragments;
    float text_size = 0;

    bool operator==(const TextRun& other) const {
        return fragments == other.fragments && text_size == other.text_size;
    }
    bool operator!=(const TextRun& other) const { return !(*this == other); }
};

// Positions are assigned by the parent and are relative to its origin.
struct PositionedChild {
    Point position;
    BoxRef box;

    bool operator==(const PositionedChild& other) const {
        return position == other.position && box == other.box;
    }
    bool operator!=(const PositionedChild& other) const { return !(*this == other); }
};

using BoxContent = std::variant<std::vector<PositionedChild>, TextRun>;

// One node of the layout output. Corresponds n:1 with elements: an element
// yields one box, except that text may split into several line boxes.
struct Box {
    Size size;
    SideOffsets margin;
    BoxContent content;
    // Element this box was produced for; the renderer reads its colors and
    // borders from there.
    const dom::Element* element = nullptr;

    bool is_text() const { return std::holds_alternative<TextRun>(content); }
    const TextRun* text() const { return std::get_if<TextRun>(&content); }
    const std::vector<PositionedChild>* children() const {
        return std::get_if<std::vector<PositionedChild>>(&content);
    }

    // Size including margins.
    float outer_width() const { return margin.left + size.width + margin.right; }
    float outer_height() const { return margin.top + size.height + margin.bottom; }

    bool operator==(const Box& other) const {
        return size == other.size && margin == other.margin && element == other.element &&
               content == other.content;
    }
    bool operator!=(const Box& other) const { return !(*this == other); }
};

BoxRef make_box(Box box);

// Deterministic text dump of a box tree, one box per line.
std::string serialize_box_tree(const BoxRef& root);

// Number of boxes in the tree, counting `root`.
size_t count_boxes(const BoxRef& root);

} // namespace trellis::layout
