#pragma once
#include <trellis/style/resolved_attributes.h>
#include <trellis/style/style_rule.h>
#include <cstddef>

namespace trellis::core {
class DiagnosticEmitter;
}

namespace trellis::dom {
class Element;
}

namespace trellis::style {

// Computes ResolvedAttributes for every element of a tree and publishes them
// onto the elements. Every call is a full top-down recompute.
class CascadeResolver {
public:
    void resolve(dom::Element& root);

    // Compute the attributes of a single element given its parent's resolved
    // values (null for the root). Does not publish anything.
    ResolvedAttributes compute(const dom::Element& element,
                               const ResolvedAttributes* parent) const;

    size_t last_resolved_count() const { return last_resolved_count_; }
    size_t last_matched_sub_rules() const { return last_matched_sub_rules_; }

    void set_diagnostics(core::DiagnosticEmitter* emitter) { diagnostics_ = emitter; }

private:
    void resolve_subtree(dom::Element& element, const ResolvedAttributes* parent);
    ResolvedAttributes cascade_one(const dom::Element& element, const ResolvedAttributes* parent,
                                   size_t& matched) const;

    size_t last_resolved_count_ = 0;
    size_t last_matched_sub_rules_ = 0;
    core::DiagnosticEmitter* diagnostics_ = nullptr;
};

} // namespace trellis::style
