#pragma once
#include <trellis/core/geometry.h>
#include <trellis/layout/box.h>
#include <trellis/layout/layout_engine.h>
#include <trellis/style/cascade_resolver.h>

#include <cstdint>

namespace trellis::core {
class DiagnosticEmitter;
}

namespace trellis::pipeline {

// Runs the two per-frame stages in their fixed order: cascade, then layout.
class FramePipeline {
public:
    FramePipeline() = default;
    // `fonts` must outlive the pipeline.
    explicit FramePipeline(const font::FontService& fonts) : engine_(fonts) {}

    layout::BoxRef run_frame(dom::Element& root, Size available);
    // Runs at the default viewport size.
    layout::BoxRef run_frame(dom::Element& root);

    const layout::BoxRef& last_tree() const { return last_tree_; }
    uint64_t frame_count() const { return frame_count_; }

    style::CascadeResolver& resolver() { return resolver_; }
    layout::LayoutEngine& engine() { return engine_; }

    // Frame numbers become the correlation id of emitted events.
    void set_diagnostics(core::DiagnosticEmitter* emitter);

private:
    style::CascadeResolver resolver_;
    layout::LayoutEngine engine_;
    layout::BoxRef last_tree_;
    uint64_t frame_count_ = 0;
    core::DiagnosticEmitter* diagnostics_ = nullptr;
};

} // namespace trellis::pipeline
