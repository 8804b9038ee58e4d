#pragma once
#include <trellis/style/resolved_attributes.h>
#include <trellis/style/selector.h>
#include <optional>
#include <string>
#include <vector>

namespace trellis::style {

// A partial set of attributes. Each present property overwrites the
// corresponding field when applied; absent properties leave it untouched.
struct AttributeSet {
    std::optional<Display> display;
    std::optional<Direction> direction;
    std::optional<SideOffsets> margin;
    std::optional<SideOffsets> padding;
    std::optional<float> width;
    std::optional<float> height;
    std::optional<float> min_width;
    std::optional<float> min_height;
    std::optional<float> max_width;
    std::optional<float> max_height;
    std::optional<float> text_size;
    std::optional<Color> text_color;
    std::optional<Color> background_color;
    std::optional<float> border_radius;
    std::optional<SideOffsets> border_thickness;
    std::optional<Color> border_color;

    // Box-model properties only reach block values; on an inline element
    // they are dropped.
    void apply(ResolvedAttributes& values) const;

    bool empty() const;

    AttributeSet& set_display(Display v) { display = std::move(v); return *this; }
    AttributeSet& set_block() { display = BlockValues{}; return *this; }
    AttributeSet& set_inline() { display = InlineValues{}; return *this; }
    AttributeSet& set_direction(Direction v) { direction = v; return *this; }
    AttributeSet& set_margin(SideOffsets v) { margin = v; return *this; }
    AttributeSet& set_padding(SideOffsets v) { padding = v; return *this; }
    AttributeSet& set_width(float v) { width = v; return *this; }
    AttributeSet& set_height(float v) { height = v; return *this; }
    AttributeSet& set_min_width(float v) { min_width = v; return *this; }
    AttributeSet& set_min_height(float v) { min_height = v; return *this; }
    AttributeSet& set_max_width(float v) { max_width = v; return *this; }
    AttributeSet& set_max_height(float v) { max_height = v; return *this; }
    AttributeSet& set_text_size(float v) { text_size = v; return *this; }
    AttributeSet& set_text_color(Color v) { text_color = v; return *this; }
    AttributeSet& set_background_color(Color v) { background_color = v; return *this; }
    AttributeSet& set_border_radius(float v) { border_radius = v; return *this; }
    AttributeSet& set_border_thickness(SideOffsets v) { border_thickness = v; return *this; }
    AttributeSet& set_border_color(Color v) { border_color = v; return *this; }
};

struct SubRule {
    Selector selector;
    AttributeSet attributes;
};

// An immutable style: a base attribute set plus conditional sub-rules that
// apply in declaration order. Rules are compared by identity, never by
// content, so two rules with the same content are still different rules.
class StyleRule {
public:
    StyleRule(std::string name, AttributeSet attributes,
              std::vector<SubRule> sub_rules = {},
              const char* file = "", unsigned line = 0);

    StyleRule(const StyleRule&) = delete;
    StyleRule& operator=(const StyleRule&) = delete;

    const std::string& name() const { return name_; }
    const char* file() const { return file_; }
    unsigned line() const { return line_; }

    const AttributeSet& attributes() const { return attributes_; }
    const std::vector<SubRule>& sub_rules() const { return sub_rules_; }

    // Apply the base set, then every sub-rule whose selector matches.
    // Returns the number of matching sub-rules.
    size_t apply_to(const ElementView& element, ResolvedAttributes& values) const;

    bool operator==(const StyleRule& other) const { return this == &other; }
    bool operator!=(const StyleRule& other) const { return this != &other; }

private:
    std::string name_;
    AttributeSet attributes_;
    std::vector<SubRule> sub_rules_;
    const char* file_;
    unsigned line_;
};

} // namespace trellis::style

// Declares a rule tagged with the location it was written at.
#define TRELLIS_STYLE_RULE(name, attributes, sub_rules) \
    ::trellis::style::StyleRule name(#name, attributes, sub_rules, __FILE__, __LINE__)
