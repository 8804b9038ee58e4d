#include <trellis/dom/node.h>
#include <algorithm>
#include <cassert>
#include <cstddef>

namespace trellis::dom {

Node::Node(NodeType type) : type_(type) {}

Node::~Node() = default;

Node* Node::first_child() const {
    return children_.empty() ? nullptr : children_.front().get();
}

Node* Node::last_child() const {
    return children_.empty() ? nullptr : children_.back().get();
}

size_t Node::index_of(const Node& child) const {
    if (child.parent_ != this) return children_.size();
    for (size_t i = 0; i < children_.size(); ++i) {
        if (children_[i].get() == &child) return i;
    }
    return children_.size();
}

void Node::relink(size_t index) {
    // Links of the node at `index` and of both neighbours
    const size_t first = index > 0 ? index - 1 : 0;
    const size_t last = std::min(index + 1, children_.size() - 1);
    for (size_t i = first; i <= last; ++i) {
        Node* node = children_[i].get();
        node->prev_sibling_ = i > 0 ? children_[i - 1].get() : nullptr;
        node->next_sibling_ = i + 1 < children_.size() ? children_[i + 1].get() : nullptr;
    }
}

Node& Node::append_child(std::unique_ptr<Node> child) {
    return insert_before(std::move(child), nullptr);
}

Node& Node::insert_before(std::unique_ptr<Node> child, Node* reference) {
    assert(child && !child->parent_);

    const size_t index = reference ? index_of(*reference) : children_.size();
    assert((!reference || index < children_.size()) && "reference node is not a child of this node");

    Node& inserted = *child;
    inserted.parent_ = this;
    children_.insert(children_.begin() + static_cast<std::ptrdiff_t>(index), std::move(child));
    relink(index);
    return inserted;
}

std::unique_ptr<Node> Node::remove_child(Node& child) {
    const size_t index = index_of(child);
    assert(index < children_.size() && "child is not a child of this node");

    std::unique_ptr<Node> removed = std::move(children_[index]);
    children_.erase(children_.begin() + static_cast<std::ptrdiff_t>(index));
    removed->parent_ = nullptr;
    removed->prev_sibling_ = nullptr;
    removed->next_sibling_ = nullptr;

    if (!children_.empty()) {
        // The former neighbours are now at index - 1 and index
        relink(index > 0 ? index - 1 : 0);
    }
    return removed;
}

size_t Node::element_child_count() const {
    size_t count = 0;
    for (const auto& child : children_) {
        if (child->is_element()) ++count;
    }
    return count;
}

size_t Node::element_index() const {
    size_t index = 0;
    for (const Node* n = prev_sibling_; n; n = n->prev_sibling_) {
        if (n->is_element()) ++index;
    }
    return index;
}

std::string Node::text_content() const {
    std::string result;
    for_each_child([&](const Node& child) { result += child.text_content(); });
    return result;
}

} // namespace trellis::dom
