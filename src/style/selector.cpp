#include <trellis/style/selector.h>
#include <trellis/dom/element.h>

namespace trellis::style {

namespace {

const dom::Element* parent_element(const dom::Element& element) {
    dom::Node* parent = element.parent();
    if (parent && parent->is_element()) {
        return static_cast<const dom::Element*>(parent);
    }
    return nullptr;
}

} // namespace

// ---------------------------------------------------------------------------
// ElementView
// ---------------------------------------------------------------------------

const std::string& ElementView::tag_name() const {
    return element_->tag_name();
}

std::optional<std::string> ElementView::attribute(std::string_view name) const {
    return element_->get_attribute(name);
}

bool ElementView::has_attribute(std::string_view name) const {
    return element_->has_attribute(name);
}

bool ElementView::has_class(std::string_view name) const {
    return element_->class_list().contains(name);
}

uint64_t ElementView::key() const {
    return element_->key();
}

std::optional<ElementView> ElementView::parent() const {
    if (const dom::Element* parent = parent_element(*element_)) {
        return ElementView(*parent);
    }
    return std::nullopt;
}

size_t ElementView::child_index() const {
    return element_->element_index();
}

size_t ElementView::sibling_count() const {
    const dom::Node* parent = element_->parent();
    return parent ? parent->element_child_count() : 1;
}

// ---------------------------------------------------------------------------
// Selector construction
// ---------------------------------------------------------------------------

Selector Selector::universal() {
    return Selector(Universal{});
}

Selector Selector::tag(std::string name) {
    return Selector(Tag{std::move(name)});
}

Selector Selector::has_class(std::string name) {
    return Selector(Class{std::move(name)});
}

Selector Selector::attribute(std::string name) {
    return Selector(Attribute{std::move(name), std::nullopt});
}

Selector Selector::attribute(std::string name, std::string value) {
    return Selector(Attribute{std::move(name), std::move(value)});
}

Selector Selector::descendant_of(Selector ancestor) {
    return Selector(Ancestry{std::make_shared<const Selector>(std::move(ancestor)), false});
}

Selector Selector::child_of(Selector parent) {
    return Selector(Ancestry{std::make_shared<const Selector>(std::move(parent)), true});
}

Selector Selector::first_child() {
    return Selector(Position{true});
}

Selector Selector::last_child() {
    return Selector(Position{false});
}

Selector Selector::all_of(std::vector<Selector> parts) {
    return Selector(AllOf{std::move(parts)});
}

Selector Selector::negate(Selector inner) {
    return Selector(Not{std::make_shared<const Selector>(std::move(inner))});
}

Selector Selector::predicate(PredicateFn fn, std::string label) {
    return Selector(Predicate{std::move(fn), std::move(label)});
}

// ---------------------------------------------------------------------------
// Matching
// ---------------------------------------------------------------------------

bool Selector::matches(const ElementView& element) const {
    if (std::holds_alternative<Universal>(kind_)) {
        return true;
    }
    if (auto* tag = std::get_if<Tag>(&kind_)) {
        return element.tag_name() == tag->name;
    }
    if (auto* cls = std::get_if<Class>(&kind_)) {
        return element.has_class(cls->name);
    }
    if (auto* attr = std::get_if<Attribute>(&kind_)) {
        if (!attr->value) return element.has_attribute(attr->name);
        auto value = element.attribute(attr->name);
        return value && *value == *attr->value;
    }
    if (auto* ancestry = std::get_if<Ancestry>(&kind_)) {
        auto ancestor = element.parent();
        if (ancestry->direct) {
            return ancestor && ancestry->selector->matches(*ancestor);
        }
        while (ancestor) {
            if (ancestry->selector->matches(*ancestor)) return true;
            ancestor = ancestor->parent();
        }
        return false;
    }
    if (auto* position = std::get_if<Position>(&kind_)) {
        if (position->first) return element.child_index() == 0;
        return element.child_index() + 1 == element.sibling_count();
    }
    if (auto* all = std::get_if<AllOf>(&kind_)) {
        for (const auto& part : all->parts) {
            if (!part.matches(element)) return false;
        }
        return true;
    }
    if (auto* negation = std::get_if<Not>(&kind_)) {
        return !negation->inner->matches(element);
    }
    if (auto* pred = std::get_if<Predicate>(&kind_)) {
        return pred->fn && pred->fn(element);
    }
    return false;
}

std::string Selector::describe() const {
    if (std::holds_alternative<Universal>(kind_)) {
        return "*";
    }
    if (auto* tag = std::get_if<Tag>(&kind_)) {
        return tag->name;
    }
    if (auto* cls = std::get_if<Class>(&kind_)) {
        return "." + cls->name;
    }
    if (auto* attr = std::get_if<Attribute>(&kind_)) {
        if (!attr->value) return "[" + attr->name + "]";
        return "[" + attr->name + "=" + *attr->value + "]";
    }
    if (auto* ancestry = std::get_if<Ancestry>(&kind_)) {
        return ancestry->selector->describe() + (ancestry->direct ? " > *" : " *");
    }
    if (auto* position = std::get_if<Position>(&kind_)) {
        return position->first ? ":first-child" : ":last-child";
    }
    if (auto* all = std::get_if<AllOf>(&kind_)) {
        std::string out;
        for (const auto& part : all->parts) {
            std::string piece = part.describe();
            // A compound reads better without the universal placeholder
            if (piece.size() > 2 && piece.compare(piece.size() - 2, 2, " *") == 0) {
                piece.resize(piece.size() - 1);
                out = piece + out;
                continue;
            }
            out += piece;
        }
        return out.empty() ? "*" : out;
    }
    if (auto* negation = std::get_if<Not>(&kind_)) {
        return ":not(" + negation->inner->describe() + ")";
    }
    if (auto* pred = std::get_if<Predicate>(&kind_)) {
        return ":" + pred->label;
    }
    return "?";
}

} // namespace trellis::style
