#include <trellis/pipeline/frame_pipeline.h>

#include <trellis/core/config.h>
#include <trellis/core/diagnostics.h>
#include <trellis/dom/element.h>

#include <string>

namespace trellis::pipeline {

void FramePipeline::set_diagnostics(core::DiagnosticEmitter* emitter) {
    diagnostics_ = emitter;
    resolver_.set_diagnostics(emitter);
    engine_.set_diagnostics(emitter);
}

layout::BoxRef FramePipeline::run_frame(dom::Element& root) {
    return run_frame(root, Size{core::config::kDefaultViewportWidth,
                                core::config::kDefaultViewportHeight});
}

layout::BoxRef FramePipeline::run_frame(dom::Element& root, Size available) {
    ++frame_count_;
    if (diagnostics_) {
        diagnostics_->set_correlation_id(frame_count_);
    }

    resolver_.resolve(root);
    layout::BoxRef tree = engine_.layout(root, available);

    if (last_tree_ && tree.same_allocation(last_tree_)) {
        core::emit_if(diagnostics_, core::Severity::Info, core::config::kPipelineModule, "frame",
                      "frame " + std::to_string(frame_count_) + " unchanged");
    }
    last_tree_ = tree;
    return tree;
}

} // namespace trellis::pipeline
