#include <trellis/layout/box.h>
#include <trellis/dom/element.h>

#include <sstream>

namespace trellis::layout {

namespace {

void serialize_box(const Box& box, const Point& position, int depth, std::ostringstream& out) {
    out << std::string(static_cast<size_t>(depth) * 2, ' ');
    out << (box.is_text() ? "text" : "box");
    if (box.element) {
        out << " <" << box.element->tag_name() << ">";
    }
    out << " pos=(" << position.x << "," << position.y << ")";
    out << " size=" << box.size.width << "x" << box.size.height;
    if (box.margin != SideOffsets{}) {
        out << " margin=" << box.margin.top << "," << box.margin.right << ","
            << box.margin.bottom << "," << box.margin.left;
    }

    if (const TextRun* run = box.text()) {
        out << " lines=" << run->fragments.size();
        size_t glyphs = 0;
        for (const auto& fragment : run->fragments) {
            glyphs += fragment.glyphs.size();
        }
        out << " glyphs=" << glyphs << "\n";
        return;
    }

    out << "\n";
    for (const auto& child : *box.children()) {
        serialize_box(*child.box, child.position, depth + 1, out);
    }
}

} // namespace

bool BoxRef::operator==(const BoxRef& other) const {
    if (box_ == other.box_) return true;
    if (!box_ || !other.box_) return false;
    return *box_ == *other.box_;
}

BoxRef make_box(Box box) {
    return BoxRef(std::make_shared<const Box>(std::move(box)));
}

std::string serialize_box_tree(const BoxRef& root) {
    if (!root) return "";
    std::ostringstream out;
    serialize_box(*root, Point{}, 0, out);
    return out.str();
}

size_t count_boxes(const BoxRef& root) {
    if (!root) return 0;
    size_t count = 1;
    if (const auto* children = root->children()) {
        for (const auto& child : *children) {
            count += count_boxes(child.box);
        }
    }
    return count;
}

} // namespace trellis::layout
