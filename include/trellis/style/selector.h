#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace trellis::dom {
class Element;
}

namespace trellis::style {

// Read-only view of an element and its ancestry, handed to selectors.
// Keeps selectors from depending on (or mutating) the element tree.
class ElementView {
public:
    explicit ElementView(const dom::Element& element) : element_(&element) {}

    const std::string& tag_name() const;
    std::optional<std::string> attribute(std::string_view name) const;
    bool has_attribute(std::string_view name) const;
    bool has_class(std::string_view name) const;
    uint64_t key() const;

    // Nearest ancestor that is an element, if any.
    std::optional<ElementView> parent() const;

    // 0-based index among the parent's element children.
    size_t child_index() const;
    // Number of element children of the parent (1 for the root).
    size_t sibling_count() const;

private:
    const dom::Element* element_;
};

// A boolean predicate over an element. Common kinds are tagged; anything
// else goes through `predicate()`.
class Selector {
public:
    using PredicateFn = std::function<bool(const ElementView&)>;

    static Selector universal();
    static Selector tag(std::string name);
    static Selector has_class(std::string name);
    static Selector attribute(std::string name);
    static Selector attribute(std::string name, std::string value);
    static Selector descendant_of(Selector ancestor);
    static Selector child_of(Selector parent);
    static Selector first_child();
    static Selector last_child();
    static Selector all_of(std::vector<Selector> parts);
    static Selector negate(Selector inner);
    static Selector predicate(PredicateFn fn, std::string label = "predicate");

    bool matches(const ElementView& element) const;

    // Human-readable form, e.g. `div.note > [role=button]`.
    std::string describe() const;

private:
    struct Universal {};
    struct Tag { std::string name; };
    struct Class { std::string name; };
    struct Attribute {
        std::string name;
        std::optional<std::string> value;
    };
    struct Ancestry {
        std::shared_ptr<const Selector> selector;
        bool direct = false;  // parent only, not any ancestor
    };
    struct Position { bool first = true; };
    struct AllOf { std::vector<Selector> parts; };
    struct Not { std::shared_ptr<const Selector> inner; };
    struct Predicate {
        PredicateFn fn;
        std::string label;
    };

    using Kind = std::variant<Universal, Tag, Class, Attribute, Ancestry, Position,
                              AllOf, Not, Predicate>;

    explicit Selector(Kind kind) : kind_(std::move(kind)) {}

    Kind kind_;
};

} // namespace trellis::style
