#include <trellis/style/cascade_resolver.h>
#include <trellis/core/config.h>
#include <trellis/core/diagnostics.h>
#include <trellis/dom/element.h>
#include <string>

namespace trellis::style {

ResolvedAttributes CascadeResolver::compute(const dom::Element& element,
                                            const ResolvedAttributes* parent) const {
    size_t matched = 0;
    return cascade_one(element, parent, matched);
}

ResolvedAttributes CascadeResolver::cascade_one(const dom::Element& element,
                                                const ResolvedAttributes* parent,
                                                size_t& matched) const {
    // Display, background and border never inherit
    ResolvedAttributes computed;

    if (parent) {
        computed.text_size = parent->text_size;
        computed.text_color = parent->text_color;
    }

    if (const StyleRule* rule = element.style_rule()) {
        matched += rule->apply_to(ElementView(element), computed);
    }
    return computed;
}

void CascadeResolver::resolve(dom::Element& root) {
    last_resolved_count_ = 0;
    last_matched_sub_rules_ = 0;

    resolve_subtree(root, nullptr);

    core::emit_if(diagnostics_, core::Severity::Info, core::config::kStyleModule, "cascade",
                  "resolved " + std::to_string(last_resolved_count_) + " elements, " +
                  std::to_string(last_matched_sub_rules_) + " sub-rule matches");
}

void CascadeResolver::resolve_subtree(dom::Element& element, const ResolvedAttributes* parent) {
    const ResolvedAttributes computed = cascade_one(element, parent, last_matched_sub_rules_);
    element.set_resolved_attributes(computed);
    ++last_resolved_count_;

    // Text children take their styling from this element at layout time
    element.for_each_child([&](dom::Node& child) {
        if (child.is_element()) {
            resolve_subtree(static_cast<dom::Element&>(child), &computed);
        }
    });
}

} // namespace trellis::style
