#include <trellis/dom/element.h>
#include <trellis/layout/box.h>

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace trellis;
using namespace trellis::layout;

namespace {

BoxRef leaf(float width, float height) {
    Box box;
    box.size = Size{width, height};
    box.content = std::vector<PositionedChild>{};
    return make_box(std::move(box));
}

BoxRef text_leaf(size_t lines) {
    Box box;
    box.size = Size{10, 20.0f * static_cast<float>(lines)};
    TextRun run;
    run.text_size = 16;
    for (size_t i = 0; i < lines; ++i) {
        TextFragment fragment;
        fragment.origin = Point{0, 20.0f * static_cast<float>(i)};
        fragment.glyphs.push_back({65, Point{0, 12.8f}});
        fragment.glyphs.push_back({66, Point{8, 12.8f}});
        run.fragments.push_back(fragment);
    }
    box.content = std::move(run);
    return make_box(std::move(box));
}

} // namespace

// ---------------------------------------------------------------------------
// 1. Value semantics of handles
// ---------------------------------------------------------------------------
TEST(BoxRef, EqualContentDifferentAllocations) {
    BoxRef a = leaf(10, 20);
    BoxRef b = leaf(10, 20);
    EXPECT_EQ(a, b);
    EXPECT_FALSE(a.same_allocation(b));
}

TEST(BoxRef, CopiesShareAllocation) {
    BoxRef a = leaf(10, 20);
    BoxRef copy = a;
    EXPECT_TRUE(copy.same_allocation(a));
    EXPECT_EQ(a.use_count(), 2);
}

TEST(BoxRef, DifferentSizesAreNotEqual) {
    EXPECT_NE(leaf(10, 20), leaf(10, 21));
}

TEST(BoxRef, EmptyHandles) {
    BoxRef empty;
    EXPECT_FALSE(empty);
    EXPECT_EQ(empty, BoxRef());
    EXPECT_NE(empty, leaf(1, 1));
}

TEST(Box, EqualityIsDeep) {
    Box a;
    a.content = std::vector<PositionedChild>{{Point{0, 0}, leaf(5, 5)}};
    Box b;
    b.content = std::vector<PositionedChild>{{Point{0, 0}, leaf(5, 5)}};
    EXPECT_EQ(a, b);

    Box c;
    c.content = std::vector<PositionedChild>{{Point{1, 0}, leaf(5, 5)}};
    EXPECT_NE(a, c);
}

TEST(Box, OuterSizeIncludesMargins) {
    Box box;
    box.size = Size{100, 50};
    box.margin = SideOffsets{1, 2, 3, 4};
    EXPECT_FLOAT_EQ(box.outer_width(), 106.0f);
    EXPECT_FLOAT_EQ(box.outer_height(), 54.0f);
}

TEST(Box, ContentAccessors) {
    BoxRef text = text_leaf(2);
    EXPECT_TRUE(text->is_text());
    ASSERT_NE(text->text(), nullptr);
    EXPECT_EQ(text->text()->fragments.size(), 2u);
    EXPECT_EQ(text->children(), nullptr);

    BoxRef container = leaf(1, 1);
    EXPECT_FALSE(container->is_text());
    ASSERT_NE(container->children(), nullptr);
}

// ---------------------------------------------------------------------------
// 2. Serialization
// ---------------------------------------------------------------------------
TEST(BoxSerialize, EmptyRef) {
    EXPECT_EQ(serialize_box_tree(BoxRef()), "");
    EXPECT_EQ(count_boxes(BoxRef()), 0u);
}

TEST(BoxSerialize, NestedTree) {
    dom::Element div("div");
    Box root;
    root.size = Size{100, 60};
    root.element = &div;
    Box middle;
    middle.size = Size{50, 20};
    middle.margin = SideOffsets::all(2);
    middle.content = std::vector<PositionedChild>{{Point{0, 0}, text_leaf(2)}};
    root.content = std::vector<PositionedChild>{{Point{2, 2}, make_box(std::move(middle))},
                                                {Point{0, 30}, leaf(10, 10)}};
    BoxRef tree = make_box(std::move(root));

    const std::string expected =
        "box <div> pos=(0,0) size=100x60\n"
        "  box pos=(2,2) size=50x20 margin=2,2,2,2\n"
        "    text pos=(0,0) size=10x40 lines=2 glyphs=4\n"
        "  box pos=(0,30) size=10x10\n";
    EXPECT_EQ(serialize_box_tree(tree), expected);
    EXPECT_EQ(count_boxes(tree), 4u);
}

TEST(BoxSerialize, DeterministicAcrossEqualTrees) {
    BoxRef a = text_leaf(3);
    BoxRef b = text_leaf(3);
    EXPECT_EQ(serialize_box_tree(a), serialize_box_tree(b));
}
