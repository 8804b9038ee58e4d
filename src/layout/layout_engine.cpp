#include <trellis/layout/layout_engine.h>

#include <trellis/core/config.h>
#include <trellis/core/diagnostics.h>
#include <trellis/dom/element.h>
#include <trellis/font/font_service.h>

#include <string>

namespace trellis::layout {

BoxRef LayoutEngine::layout(const dom::Element& root, Size available) {
    if (!fonts_) {
        fonts_ = &font::default_font_service(diagnostics_);
    }

    cache_.begin_frame();
    BoxRef tree = layout_node(root, available);
    if (reuse_enabled_) {
        cache_.end_frame();
    }

    core::emit_if(diagnostics_, core::Severity::Info, core::config::kLayoutModule, "layout",
                  std::to_string(count_boxes(tree)) + " boxes, " +
                  std::to_string(cache_.frame_hits()) + " reused, " +
                  std::to_string(cache_.frame_misses()) + " rebuilt");
    return tree;
}

void LayoutEngine::set_reuse_enabled(bool enabled) {
    reuse_enabled_ = enabled;
    if (!enabled) {
        cache_.clear();
    }
}

const style::ResolvedAttributes& LayoutEngine::resolved_or_die(const dom::Element& element) const {
    const auto& values = element.resolved_attributes();
    if (!values) {
        // The cascade must run over the whole tree before layout
        auto trace = core::capture_failure(diagnostics_, core::config::kLayoutModule, "dispatch",
                                           "element has no resolved attributes");
        trace.add_snapshot("tag", element.tag_name());
        trace.add_snapshot("key", std::to_string(element.key()));
        core::fatal_error(trace);
    }
    return *values;
}

BoxRef LayoutEngine::layout_node(const dom::Element& element, Size available) {
    const style::ResolvedAttributes& values = resolved_or_die(element);

    // The mode is the element's own; parents never override it
    if (const style::BlockValues* block = values.block()) {
        return layout_block(element, values, *block, available);
    }
    return layout_inline(element, values, available);
}

BoxRef layout(const dom::Element& root, Size available, const font::FontService& fonts) {
    LayoutEngine engine(fonts);
    engine.set_reuse_enabled(false);
    return engine.layout(root, available);
}

} // namespace trellis::layout
