#include <trellis/style/style_rule.h>

namespace trellis::style {

void AttributeSet::apply(ResolvedAttributes& values) const {
    // display first: a set may switch to block and size it in one go
    if (display) values.display = *display;

    if (BlockValues* block = values.block()) {
        if (direction) block->direction = *direction;
        if (margin) block->margin = *margin;
        if (padding) block->padding = *padding;
        if (width) block->width = *width;
        if (height) block->height = *height;
        if (min_width) block->min_width = *min_width;
        if (min_height) block->min_height = *min_height;
        if (max_width) block->max_width = *max_width;
        if (max_height) block->max_height = *max_height;
    }

    if (text_size) values.text_size = *text_size;
    if (text_color) values.text_color = *text_color;
    if (background_color) values.background_color = *background_color;
    if (border_radius) values.border_radius = *border_radius;
    if (border_thickness) values.border_thickness = *border_thickness;
    if (border_color) values.border_color = *border_color;
}

bool AttributeSet::empty() const {
    return !display && !direction && !margin && !padding && !width && !height &&
           !min_width && !min_height && !max_width && !max_height && !text_size &&
           !text_color && !background_color && !border_radius && !border_thickness &&
           !border_color;
}

StyleRule::StyleRule(std::string name, AttributeSet attributes,
                     std::vector<SubRule> sub_rules, const char* file, unsigned line)
    : name_(std::move(name))
    , attributes_(std::move(attributes))
    , sub_rules_(std::move(sub_rules))
    , file_(file)
    , line_(line) {}

size_t StyleRule::apply_to(const ElementView& element, ResolvedAttributes& values) const {
    attributes_.apply(values);
    size_t matched = 0;
    for (const auto& sub : sub_rules_) {
        if (sub.selector.matches(element)) {
            sub.attributes.apply(values);
            ++matched;
        }
    }
    return matched;
}

} // namespace trellis::style
