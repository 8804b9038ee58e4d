#include <trellis/core/diagnostics.h>
#include <trellis/dom/element.h>
#include <trellis/layout/layout_engine.h>
#include <trellis/style/cascade_resolver.h>
#include <trellis/style/style_rule.h>

#include "support/fixed_font_service.h"

#include <gtest/gtest.h>
#include <vector>

using namespace trellis;
using namespace trellis::style;
using layout::BoxRef;
using layout::TextFragment;

namespace {

class InlineLayoutTest : public ::testing::Test {
protected:
    InlineLayoutTest() : inline_rule("inline", AttributeSet().set_inline()) {}

    // Lays out an inline root directly at `width`.
    BoxRef run(dom::Element& root, float width) {
        if (!root.style_rule()) root.set_style_rule(&inline_rule);
        CascadeResolver resolver;
        resolver.resolve(root);
        return layout::layout(root, Size{width, 1000}, fonts);
    }

    static const std::vector<TextFragment>& fragments(const BoxRef& box) {
        return box->text()->fragments;
    }

    trellis::testing::FixedFontService fonts;
    StyleRule inline_rule;
};

} // namespace

// ---------------------------------------------------------------------------
// 1. Line breaking
// ---------------------------------------------------------------------------
TEST_F(InlineLayoutTest, SingleLineFits) {
    dom::Element root("span");
    root.append_text("hello world");

    BoxRef box = run(root, 400);
    ASSERT_TRUE(box->is_text());
    ASSERT_EQ(fragments(box).size(), 1u);
    EXPECT_FLOAT_EQ(fragments(box)[0].width, 88.0f);
    EXPECT_EQ(box->size, (Size{88, 20}));
    EXPECT_EQ(fragments(box)[0].glyphs.size(), 10u);
}

TEST_F(InlineLayoutTest, GreedyWrapAtWordBoundaries) {
    dom::Element root("span");
    root.append_text("aaaa bbbb cccc");

    BoxRef box = run(root, 80);
    ASSERT_EQ(fragments(box).size(), 2u);
    EXPECT_FLOAT_EQ(fragments(box)[0].width, 72.0f);
    EXPECT_FLOAT_EQ(fragments(box)[1].width, 32.0f);
    EXPECT_EQ(fragments(box)[0].origin, (Point{0, 0}));
    EXPECT_EQ(fragments(box)[1].origin, (Point{0, 20}));
    EXPECT_EQ(box->size, (Size{72, 40}));
}

TEST_F(InlineLayoutTest, GlyphsSitOnTheBaseline) {
    dom::Element root("span");
    root.append_text("ab cd");

    BoxRef box = run(root, 400);
    const auto& glyphs = fragments(box)[0].glyphs;
    ASSERT_EQ(glyphs.size(), 4u);
    EXPECT_EQ(glyphs[0].index, static_cast<uint32_t>('a'));
    EXPECT_EQ(glyphs[0].offset, (Point{0, 12.8f}));
    EXPECT_EQ(glyphs[1].offset, (Point{8, 12.8f}));
    // One collapsed space between the words
    EXPECT_EQ(glyphs[2].offset, (Point{24, 12.8f}));
    EXPECT_EQ(glyphs[2].index, static_cast<uint32_t>('c'));
}

TEST_F(InlineLayoutTest, WhitespaceRunsCollapse) {
    dom::Element root("span");
    root.append_text("  ab \n\t  cd  ");

    BoxRef box = run(root, 400);
    ASSERT_EQ(fragments(box).size(), 1u);
    EXPECT_FLOAT_EQ(fragments(box)[0].width, 40.0f);
}

TEST_F(InlineLayoutTest, OverlongWordOverflowsOnItsOwnLine) {
    dom::Element root("span");
    root.append_text("a bbbbbbbbbbbb c");

    BoxRef box = run(root, 50);
    ASSERT_EQ(fragments(box).size(), 3u);
    EXPECT_FLOAT_EQ(fragments(box)[0].width, 8.0f);
    EXPECT_FLOAT_EQ(fragments(box)[1].width, 96.0f);
    EXPECT_FLOAT_EQ(fragments(box)[2].width, 8.0f);
    EXPECT_EQ(box->size, (Size{96, 60}));
}

TEST_F(InlineLayoutTest, ZeroWidthPutsOneGlyphPerLine) {
    core::DiagnosticEmitter emitter;
    dom::Element root("span");
    root.append_text("ab cd");
    root.set_style_rule(&inline_rule);

    CascadeResolver resolver;
    resolver.resolve(root);
    layout::LayoutEngine engine(fonts);
    engine.set_diagnostics(&emitter);
    BoxRef box = engine.layout(root, Size{0, 1000});

    ASSERT_EQ(fragments(box).size(), 4u);
    for (const auto& fragment : fragments(box)) {
        EXPECT_EQ(fragment.glyphs.size(), 1u);
        EXPECT_FLOAT_EQ(fragment.width, 8.0f);
    }
    EXPECT_EQ(box->size, (Size{8, 80}));
    EXPECT_EQ(emitter.events_by_severity(core::Severity::Warning).size(), 1u);
}

TEST_F(InlineLayoutTest, EmptyTextGivesEmptyRun) {
    dom::Element root("span");
    root.append_text("");

    BoxRef box = run(root, 100);
    ASSERT_TRUE(box->is_text());
    EXPECT_TRUE(fragments(box).empty());
    EXPECT_EQ(box->size, (Size{0, 0}));
}

TEST_F(InlineLayoutTest, FragmentsCarryTheFont) {
    dom::Element root("span");
    root.append_text("aaaa bbbb cccc");

    BoxRef box = run(root, 80);
    for (const auto& fragment : fragments(box)) {
        ASSERT_NE(fragment.font, nullptr);
        EXPECT_EQ(fragment.font->family, "Fixed");
    }
}

TEST_F(InlineLayoutTest, TextSizeScalesLines) {
    StyleRule small("small", AttributeSet().set_inline().set_text_size(8));
    dom::Element root("span");
    root.set_style_rule(&small);
    root.append_text("aaaa bbbb cccc");

    BoxRef box = run(root, 80);
    // 4px glyphs: everything fits on one line
    ASSERT_EQ(fragments(box).size(), 1u);
    EXPECT_EQ(box->size, (Size{56, 10}));
}

// ---------------------------------------------------------------------------
// 2. Mixed content
// ---------------------------------------------------------------------------
TEST_F(InlineLayoutTest, NestedElementFlowsAsAUnit) {
    dom::Element root("p");
    root.append_text("hi ");
    dom::Element& bold = root.append_element("b");
    bold.set_style_rule(&inline_rule);
    bold.append_text("yo");
    root.append_text(" there");

    BoxRef box = run(root, 400);
    ASSERT_FALSE(box->is_text());
    const auto& children = *box->children();
    ASSERT_EQ(children.size(), 3u);

    EXPECT_EQ(children[0].position, (Point{0, 0}));
    EXPECT_TRUE(children[0].box->is_text());
    EXPECT_EQ(children[0].box->size, (Size{16, 20}));
    EXPECT_EQ(children[0].box->element, &root);

    EXPECT_EQ(children[1].position, (Point{24, 0}));
    EXPECT_EQ(children[1].box->element, &bold);

    EXPECT_EQ(children[2].position, (Point{48, 0}));
    EXPECT_EQ(children[2].box->size, (Size{40, 20}));

    EXPECT_EQ(box->size, (Size{88, 20}));
}

TEST_F(InlineLayoutTest, MixedContentWrapsPerLine) {
    dom::Element root("p");
    root.append_text("aaaa");
    dom::Element& bold = root.append_element("b");
    bold.set_style_rule(&inline_rule);
    bold.append_text("bbbb");
    root.append_text(" cccc");

    // "aaaa" and <b> touch with no space; "cccc" wraps
    BoxRef box = run(root, 70);
    const auto& children = *box->children();
    ASSERT_EQ(children.size(), 3u);
    EXPECT_EQ(children[1].position, (Point{32, 0}));
    EXPECT_EQ(children[2].position, (Point{0, 20}));
    EXPECT_EQ(box->size, (Size{64, 40}));
}

TEST_F(InlineLayoutTest, TallNestedBlockSetsLineHeight) {
    StyleRule tall("tall", AttributeSet().set_width(10).set_height(50));
    dom::Element root("p");
    root.append_text("ab");
    root.append_element("img").set_style_rule(&tall);
    root.append_text("cd");

    BoxRef box = run(root, 400);
    const auto& children = *box->children();
    ASSERT_EQ(children.size(), 3u);
    EXPECT_EQ(children[1].position, (Point{16, 0}));
    EXPECT_EQ(children[2].position, (Point{26, 0}));
    EXPECT_EQ(box->size, (Size{42, 50}));
}

TEST_F(InlineLayoutTest, NestedMarginsOffsetTheBox) {
    StyleRule spaced("spaced", AttributeSet().set_width(10).set_height(10)
                                             .set_margin(SideOffsets{2, 3, 4, 5}));
    dom::Element root("p");
    root.append_element("img").set_style_rule(&spaced);

    BoxRef box = run(root, 400);
    const auto& children = *box->children();
    ASSERT_EQ(children.size(), 1u);
    EXPECT_EQ(children[0].position, (Point{5, 2}));
    EXPECT_EQ(box->size, (Size{18, 16}));
}
