#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace trellis::dom {

enum class NodeType {
    Element, Text
};

class Node {
public:
    explicit Node(NodeType type);
    virtual ~Node();

    // Non-copyable
    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    NodeType node_type() const { return type_; }
    bool is_element() const { return type_ == NodeType::Element; }
    bool is_text() const { return type_ == NodeType::Text; }

    Node* parent() const { return parent_; }
    Node* first_child() const;
    Node* last_child() const;
    Node* next_sibling() const { return next_sibling_; }
    Node* previous_sibling() const { return prev_sibling_; }

    // Tree manipulation. `reference` and `child` must be children of this
    // node; a null reference appends.
    Node& append_child(std::unique_ptr<Node> child);
    Node& insert_before(std::unique_ptr<Node> child, Node* reference);
    std::unique_ptr<Node> remove_child(Node& child);

    size_t child_count() const { return children_.size(); }
    size_t element_child_count() const;

    // Position among the parent's element children; 0 for a detached node.
    size_t element_index() const;

    // Iterate children in document order
    template<typename Fn>
    void for_each_child(Fn&& fn) const {
        for (auto& child : children_) {
            fn(*child);
        }
    }

    // Text content (recursive)
    virtual std::string text_content() const;

protected:
    // Index of `child` in children_, or children_.size() if absent.
    size_t index_of(const Node& child) const;
    // Refresh the sibling links around position `index`.
    void relink(size_t index);

    NodeType type_;
    Node* parent_ = nullptr;
    Node* next_sibling_ = nullptr;
    Node* prev_sibling_ = nullptr;
    std::vector<std::unique_ptr<Node>> children_;
};

} // namespace trellis::dom
