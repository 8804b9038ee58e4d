#include <trellis/dom/element.h>
#include <trellis/dom/text.h>
#include <algorithm>
#include <cctype>

namespace trellis::dom {

namespace {

uint64_t next_element_key() {
    static uint64_t counter = 0;
    return ++counter;
}

bool is_separator(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

} // namespace

// ---------------------------------------------------------------------------
// ClassList
// ---------------------------------------------------------------------------

void ClassList::assign(std::string_view value) {
    classes_.clear();
    size_t i = 0;
    while (i < value.size()) {
        while (i < value.size() && is_separator(value[i])) ++i;
        const size_t start = i;
        while (i < value.size() && !is_separator(value[i])) ++i;
        if (i > start) add(std::string(value.substr(start, i - start)));
    }
}

void ClassList::add(const std::string& cls) {
    if (!cls.empty() && !contains(cls)) classes_.push_back(cls);
}

void ClassList::remove(const std::string& cls) {
    classes_.erase(std::remove(classes_.begin(), classes_.end(), cls), classes_.end());
}

bool ClassList::contains(std::string_view cls) const {
    return std::find(classes_.begin(), classes_.end(), cls) != classes_.end();
}

void ClassList::toggle(const std::string& cls) {
    if (contains(cls)) {
        remove(cls);
    } else {
        add(cls);
    }
}

std::string ClassList::to_string() const {
    std::string result;
    for (const auto& cls : classes_) {
        if (!result.empty()) result += ' ';
        result += cls;
    }
    return result;
}

// ---------------------------------------------------------------------------
// Element
// ---------------------------------------------------------------------------

Element::Element(const std::string& tag_name)
    : Node(NodeType::Element)
    , tag_name_(tag_name)
    , key_(next_element_key()) {}

std::vector<Attribute>::const_iterator Element::find_attribute(std::string_view name) const {
    return std::find_if(attributes_.begin(), attributes_.end(),
                        [name](const Attribute& attr) { return attr.name == name; });
}

std::optional<std::string> Element::get_attribute(std::string_view name) const {
    auto it = find_attribute(name);
    if (it == attributes_.end()) return std::nullopt;
    return it->value;
}

bool Element::has_attribute(std::string_view name) const {
    return find_attribute(name) != attributes_.end();
}

void Element::set_attribute(const std::string& name, const std::string& value) {
    auto it = find_attribute(name);
    if (it == attributes_.end()) {
        attributes_.push_back({name, value});
    } else {
        attributes_[static_cast<size_t>(it - attributes_.begin())].value = value;
    }
    if (name == "class") class_list_.assign(value);
}

void Element::remove_attribute(const std::string& name) {
    auto it = find_attribute(name);
    if (it == attributes_.end()) return;
    attributes_.erase(it);
    if (name == "class") class_list_.assign({});
}

Element& Element::append_element(const std::string& tag_name) {
    return static_cast<Element&>(append_child(std::make_unique<Element>(tag_name)));
}

void Element::append_text(const std::string& data) {
    append_child(std::make_unique<Text>(data));
}

} // namespace trellis::dom
