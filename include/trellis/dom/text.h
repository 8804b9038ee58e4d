#pragma once
#include <trellis/dom/node.h>

namespace trellis::dom {

// Raw text content. Never styled on its own; it takes the text styling of
// the element containing it.
class Text : public Node {
public:
    explicit Text(const std::string& data);
    const std::string& data() const { return data_; }
    void set_data(const std::string& data) { data_ = data; }
    void append_data(const std::string& data) { data_ += data; }

    // True when the data is empty or only whitespace.
    bool is_blank() const;

    std::string text_content() const override;
private:
    std::string data_;
};

} // namespace trellis::dom
