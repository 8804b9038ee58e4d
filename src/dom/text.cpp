#include <trellis/dom/text.h>

#include <algorithm>
#include <cctype>

namespace trellis::dom {

Text::Text(const std::string& data) : Node(NodeType::Text), data_(data) {}

bool Text::is_blank() const {
    return std::all_of(data_.begin(), data_.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

std::string Text::text_content() const { return data_; }

} // namespace trellis::dom
