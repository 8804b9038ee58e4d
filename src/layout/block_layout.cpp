#include <trellis/layout/layout_engine.h>

#include <trellis/dom/element.h>
#include <trellis/dom/text.h>

#include <algorithm>
#include <optional>

namespace trellis::layout {

namespace {

// Clamp an auto size computed from content. Explicit sizes are never clamped.
float clamp_auto(float value, const std::optional<float>& min_value,
                 const std::optional<float>& max_value) {
    if (max_value) value = std::min(value, *max_value);
    if (min_value) value = std::max(value, *min_value);
    return std::max(value, 0.0f);
}

} // namespace

BoxRef LayoutEngine::layout_block(const dom::Element& element,
                                  const style::ResolvedAttributes& values,
                                  const style::BlockValues& block, Size available) {
    const bool vertical = block.direction == style::Direction::Vertical;
    const SideOffsets& padding = block.padding;

    // Explicit sizes are the box size; otherwise the parent's budget bounds
    // the content until the children have been measured.
    const float budget_width = block.width ? *block.width : available.width;
    const float budget_height = block.height ? *block.height : available.height;
    const Size content{std::max(0.0f, budget_width - padding.horizontal()),
                       std::max(0.0f, budget_height - padding.vertical())};

    std::vector<PositionedChild> children;
    LayoutInputs inputs;
    inputs.attributes = values;
    inputs.available = available;

    float offset = 0;  // consumed along the direction
    float cross = 0;   // largest extent across the direction

    auto remaining = [&]() {
        if (vertical) return Size{content.width, std::max(0.0f, content.height - offset)};
        return Size{std::max(0.0f, content.width - offset), content.height};
    };

    auto place = [&](const BoxRef& box) {
        Point position;
        if (vertical) {
            position.x = padding.left + box->margin.left;
            position.y = padding.top + offset + box->margin.top;
            offset += box->outer_height();
            cross = std::max(cross, box->outer_width());
        } else {
            position.x = padding.left + offset + box->margin.left;
            position.y = padding.top + box->margin.top;
            offset += box->outer_width();
            cross = std::max(cross, box->outer_height());
        }
        children.push_back({position, box});
    };

    // Contiguous text is laid out as one anonymous run styled by this element
    std::string pending_text;
    bool pending_blank = true;
    auto flush_text = [&]() {
        if (pending_text.empty()) return;
        if (!pending_blank) {
            inputs.items.emplace_back(pending_text);
            place(flow_inline(element, values, {InlineItem{pending_text, BoxRef()}},
                              remaining().width));
        }
        pending_text.clear();
        pending_blank = true;
    };

    element.for_each_child([&](const dom::Node& child) {
        if (child.is_text()) {
            const auto& text = static_cast<const dom::Text&>(child);
            pending_text += text.data();
            pending_blank = pending_blank && text.is_blank();
            return;
        }
        if (!child.is_element()) return;
        flush_text();
        BoxRef box = layout_node(static_cast<const dom::Element&>(child), remaining());
        inputs.items.emplace_back(box);
        place(box);
    });
    flush_text();

    if (reuse_enabled_) {
        if (BoxRef reused = cache_.lookup(element.key(), inputs)) {
            return reused;
        }
    }

    const float content_width = vertical ? cross : offset;
    const float content_height = vertical ? offset : cross;

    Box box;
    box.size.width = block.width
        ? *block.width
        : clamp_auto(content_width + padding.horizontal(), block.min_width, block.max_width);
    box.size.height = block.height
        ? *block.height
        : clamp_auto(content_height + padding.vertical(), block.min_height, block.max_height);
    box.margin = block.margin;
    box.content = std::move(children);
    box.element = &element;

    BoxRef result = make_box(std::move(box));
    if (reuse_enabled_) {
        cache_.store(element.key(), std::move(inputs), result);
    }
    return result;
}

} // namespace trellis::layout
