#pragma once
#include <trellis/core/geometry.h>
#include <trellis/layout/box.h>
#include <trellis/layout/box_cache.h>
#include <trellis/style/resolved_attributes.h>
#include <string>
#include <vector>

namespace trellis::core {
class DiagnosticEmitter;
}

namespace trellis::dom {
class Element;
}

namespace trellis::font {
class FontService;
}

namespace trellis::layout {

class LayoutEngine {
public:
    // Uses the process-wide default font service, bound on the first layout.
    LayoutEngine() = default;
    // Uses `fonts`, which must outlive the engine.
    explicit LayoutEngine(const font::FontService& fonts) : fonts_(&fonts) {}

    // Build the box tree for `root`, whose subtree must already carry
    // resolved attributes. A missing value aborts the process.
    BoxRef layout(const dom::Element& root, Size available);

    // Reuse last frame's boxes for unchanged subtrees (on by default).
    void set_reuse_enabled(bool enabled);
    bool reuse_enabled() const { return reuse_enabled_; }

    void set_diagnostics(core::DiagnosticEmitter* emitter) { diagnostics_ = emitter; }

    const BoxCache& cache() const { return cache_; }
    // Null until the first layout when no service was given.
    const font::FontService* font_service() const { return fonts_; }

private:
    // One contiguous piece of inline content: text, or a nested element's box.
    struct InlineItem {
        std::string text;
        BoxRef box;
    };

    BoxRef layout_node(const dom::Element& element, Size available);

    BoxRef layout_block(const dom::Element& element, const style::ResolvedAttributes& values,
                        const style::BlockValues& block, Size available);
    BoxRef layout_inline(const dom::Element& element, const style::ResolvedAttributes& values,
                         Size available);

    // Flow text and nested boxes into lines. Owner is the element whose text
    // styling applies.
    BoxRef flow_inline(const dom::Element& owner, const style::ResolvedAttributes& values,
                       const std::vector<InlineItem>& items, float available_width);

    const style::ResolvedAttributes& resolved_or_die(const dom::Element& element) const;

    const font::FontService* fonts_ = nullptr;
    core::DiagnosticEmitter* diagnostics_ = nullptr;
    BoxCache cache_;
    bool reuse_enabled_ = true;
};

// One-shot layout with an explicit font service and no retained boxes.
BoxRef layout(const dom::Element& root, Size available, const font::FontService& fonts);

} // namespace trellis::layout
