#pragma once
#include <trellis/dom/node.h>
#include <trellis/style/resolved_attributes.h>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace trellis::style {
class StyleRule;
}

namespace trellis::dom {

struct Attribute {
    std::string name;
    std::string value;
};

// Unique class names in first-seen order, kept in sync with the "class"
// attribute.
class ClassList {
public:
    // Replace the contents with the whitespace-separated names in `value`.
    void assign(std::string_view value);

    void add(const std::string& cls);
    void remove(const std::string& cls);
    bool contains(std::string_view cls) const;
    void toggle(const std::string& cls);
    size_t length() const { return classes_.size(); }
    std::string to_string() const;

    const std::vector<std::string>& items() const { return classes_; }
private:
    std::vector<std::string> classes_;
};

class Element : public Node {
public:
    explicit Element(const std::string& tag_name);

    const std::string& tag_name() const { return tag_name_; }

    // Process-unique identity, stable for the element's lifetime.
    uint64_t key() const { return key_; }

    // Attributes
    std::optional<std::string> get_attribute(std::string_view name) const;
    void set_attribute(const std::string& name, const std::string& value);
    void remove_attribute(const std::string& name);
    bool has_attribute(std::string_view name) const;
    const std::vector<Attribute>& attributes() const { return attributes_; }

    ClassList& class_list() { return class_list_; }
    const ClassList& class_list() const { return class_list_; }

    // Style rules are globally defined and outlive the elements using them.
    const style::StyleRule* style_rule() const { return style_rule_; }
    void set_style_rule(const style::StyleRule* rule) { style_rule_ = rule; }

    // Written by the cascade; empty until the first cascade run.
    const std::optional<style::ResolvedAttributes>& resolved_attributes() const {
        return resolved_;
    }
    void set_resolved_attributes(const style::ResolvedAttributes& values) { resolved_ = values; }
    void clear_resolved_attributes() { resolved_.reset(); }

    // Convenience builders
    Element& append_element(const std::string& tag_name);
    void append_text(const std::string& data);

private:
    std::string tag_name_;
    uint64_t key_;
    std::vector<Attribute> attributes_;
    ClassList class_list_;
    const style::StyleRule* style_rule_ = nullptr;
    std::optional<style::ResolvedAttributes> resolved_;

    std::vector<Attribute>::const_iterator find_attribute(std::string_view name) const;
};

} // namespace trellis::dom
