#include <trellis/layout/layout_engine.h>

#include <trellis/core/config.h>
#include <trellis/core/diagnostics.h>
#include <trellis/dom/element.h>
#include <trellis/dom/text.h>
#include <trellis/font/font_service.h>

#include <algorithm>
#include <cctype>
#include <string_view>

namespace trellis::layout {

namespace {

// The indivisible item of line packing: a shaped word or a nested box.
struct Unit {
    font::ShapedText shaped;
    BoxRef box;
    float width = 0;
    bool space_before = false;

    bool is_box() const { return static_cast<bool>(box); }
};

struct Line {
    std::vector<size_t> units;
    std::vector<float> x;  // start of each unit within the line
    float width = 0;
};

bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Split text at whitespace and shape each word. Runs of whitespace collapse
// into a single space before the next unit. With no room at all each glyph
// becomes its own unit.
void append_words(const font::FontService& fonts, float text_size, std::string_view text,
                  bool per_glyph, bool& pending_space, std::vector<Unit>& units) {
    size_t i = 0;
    while (i < text.size()) {
        if (is_space(text[i])) {
            pending_space = true;
            ++i;
            continue;
        }
        const size_t start = i;
        while (i < text.size() && !is_space(text[i])) ++i;

        font::ShapedText shaped = fonts.shape(text.substr(start, i - start), text_size);
        if (per_glyph) {
            for (const auto& glyph : shaped.glyphs) {
                Unit unit;
                unit.shaped.glyphs.push_back({glyph.index, 0, glyph.advance});
                unit.shaped.width = glyph.advance;
                unit.width = glyph.advance;
                units.push_back(std::move(unit));
            }
        } else {
            Unit unit;
            unit.width = shaped.width;
            unit.shaped = std::move(shaped);
            unit.space_before = pending_space;
            units.push_back(std::move(unit));
        }
        pending_space = false;
    }
}

std::vector<Line> pack_lines(const std::vector<Unit>& units, float space, float available_width) {
    std::vector<Line> lines;
    Line current;
    for (size_t i = 0; i < units.size(); ++i) {
        const Unit& unit = units[i];
        float gap = (!current.units.empty() && unit.space_before) ? space : 0;
        // A unit that does not fit starts a new line; alone it may overflow
        if (!current.units.empty() && current.width + gap + unit.width > available_width) {
            lines.push_back(std::move(current));
            current = Line{};
            gap = 0;
        }
        current.x.push_back(current.width + gap);
        current.units.push_back(i);
        current.width += gap + unit.width;
    }
    if (!current.units.empty()) {
        lines.push_back(std::move(current));
    }
    return lines;
}

void append_glyphs(const Unit& unit, float x, float baseline, TextFragment& fragment) {
    for (const auto& glyph : unit.shaped.glyphs) {
        fragment.glyphs.push_back({glyph.index, Point{x + glyph.x, baseline}});
    }
}

} // namespace

BoxRef LayoutEngine::layout_inline(const dom::Element& element,
                                   const style::ResolvedAttributes& values, Size available) {
    std::vector<InlineItem> items;
    LayoutInputs inputs;
    inputs.attributes = values;
    inputs.available = available;

    std::string pending_text;
    auto flush_text = [&]() {
        if (pending_text.empty()) return;
        inputs.items.emplace_back(pending_text);
        items.push_back({std::move(pending_text), BoxRef()});
        pending_text.clear();
    };

    // Nested elements are laid out first and flow as opaque units
    element.for_each_child([&](const dom::Node& child) {
        if (child.is_text()) {
            pending_text += static_cast<const dom::Text&>(child).data();
            return;
        }
        if (!child.is_element()) return;
        flush_text();
        BoxRef box = layout_node(static_cast<const dom::Element&>(child), available);
        inputs.items.emplace_back(box);
        items.push_back({std::string(), box});
    });
    flush_text();

    if (reuse_enabled_) {
        if (BoxRef reused = cache_.lookup(element.key(), inputs)) {
            return reused;
        }
    }

    BoxRef result = flow_inline(element, values, items, available.width);
    if (reuse_enabled_) {
        cache_.store(element.key(), std::move(inputs), result);
    }
    return result;
}

BoxRef LayoutEngine::flow_inline(const dom::Element& owner, const style::ResolvedAttributes& values,
                                 const std::vector<InlineItem>& items, float available_width) {
    const float text_size = values.text_size;
    const bool per_glyph = available_width <= 0;

    std::vector<Unit> units;
    bool pending_space = false;
    bool has_boxes = false;
    for (const auto& item : items) {
        if (item.box) {
            Unit unit;
            unit.box = item.box;
            unit.width = item.box->outer_width();
            unit.space_before = pending_space && !per_glyph;
            units.push_back(std::move(unit));
            pending_space = false;
            has_boxes = true;
        } else {
            append_words(*fonts_, text_size, item.text, per_glyph, pending_space, units);
        }
    }

    if (per_glyph && !units.empty()) {
        core::emit_if(diagnostics_, core::Severity::Warning, core::config::kLayoutModule, "inline",
                      "no width available for <" + owner.tag_name() + ">, one glyph per line",
                      owner.key());
    }

    const std::vector<Line> lines = pack_lines(units, fonts_->space_advance(text_size),
                                               available_width);
    const font::FontMetrics metrics = fonts_->metrics(text_size);
    const float text_height = metrics.line_height();
    const font::FontRef face = fonts_->font();

    Box box;
    box.element = &owner;
    float y = 0;
    float width = 0;

    if (!has_boxes) {
        // Text only: one leaf run, one fragment per line
        TextRun run;
        run.text_size = text_size;
        for (const Line& line : lines) {
            TextFragment fragment;
            fragment.font = face;
            fragment.origin = Point{0, y};
            fragment.width = line.width;
            for (size_t k = 0; k < line.units.size(); ++k) {
                append_glyphs(units[line.units[k]], line.x[k], metrics.ascent, fragment);
            }
            run.fragments.push_back(std::move(fragment));
            y += text_height;
            width = std::max(width, line.width);
        }
        box.content = std::move(run);
    } else {
        // Mixed content: each line's text segments become leaf boxes placed
        // beside the nested boxes
        std::vector<PositionedChild> children;
        for (const Line& line : lines) {
            float line_height = 0;
            bool has_text = false;
            for (size_t index : line.units) {
                if (units[index].is_box()) {
                    line_height = std::max(line_height, units[index].box->outer_height());
                } else {
                    has_text = true;
                }
            }
            if (has_text) {
                line_height = std::max(line_height, text_height);
            }

            size_t k = 0;
            while (k < line.units.size()) {
                const Unit& unit = units[line.units[k]];
                if (unit.is_box()) {
                    children.push_back({Point{line.x[k] + unit.box->margin.left,
                                              y + unit.box->margin.top},
                                        unit.box});
                    ++k;
                    continue;
                }

                const float start = line.x[k];
                float end = start;
                TextFragment fragment;
                fragment.font = face;
                while (k < line.units.size() && !units[line.units[k]].is_box()) {
                    const Unit& word = units[line.units[k]];
                    append_glyphs(word, line.x[k] - start, metrics.ascent, fragment);
                    end = line.x[k] + word.width;
                    ++k;
                }
                fragment.width = end - start;

                Box leaf;
                leaf.size = Size{fragment.width, text_height};
                leaf.element = &owner;
                TextRun run;
                run.text_size = text_size;
                run.fragments.push_back(std::move(fragment));
                leaf.content = std::move(run);
                children.push_back({Point{start, y}, make_box(std::move(leaf))});
            }

            y += line_height;
            width = std::max(width, line.width);
        }
        box.content = std::move(children);
    }

    box.size = Size{width, y};
    return make_box(std::move(box));
}

} // namespace trellis::layout
