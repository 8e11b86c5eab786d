#include "teacup/layout/LayoutEngine.hpp"

#include <gtest/gtest.h>

using teacup::layout::ComputeLayout;
using teacup::layout::DistributeMainAxis;
using teacup::layout::FitSizing;
using teacup::layout::GrowSizing;
using teacup::layout::LayoutMode;
using teacup::layout::LayoutNode;
using teacup::layout::LayoutTree;
using teacup::layout::NodeId;
using teacup::layout::Sizing;
using teacup::layout::SizingMode;

namespace {

// Row with a fixed width so the main axis space is known up front
LayoutTree MakeRow(int width, int height) {
    LayoutTree tree;
    tree.SetRoot(LayoutNode::CreateContainer("row", Sizing::Fixed(width, height)));
    return tree;
}

NodeId AddGrowBox(LayoutTree& tree, const std::string& id, int minWidth = 0) {
    LayoutNode node = LayoutNode::CreateContainer(id, Sizing::Grow());
    node.minWidth = minWidth;
    return tree.AddChild(tree.Root(), node);
}

}  // namespace

// ---------------------------------------------------------------------------
// Main axis water-filling
// ---------------------------------------------------------------------------

TEST(GrowSizingTest, ThreeGrowChildrenSplitViewport) {
    LayoutTree tree;
    LayoutNode root = LayoutNode::CreateContainer("root", Sizing::Grow());
    root.padding = 16;
    root.childGap = 16;
    tree.SetRoot(root);
    const NodeId a = tree.AddContainer(tree.Root(), "a", Sizing::Grow());
    const NodeId b = tree.AddContainer(tree.Root(), "b", Sizing::Grow());
    const NodeId c = tree.AddContainer(tree.Root(), "c", Sizing::Grow());

    ComputeLayout(tree, glm::ivec2(800, 600));

    EXPECT_EQ(tree[tree.Root()].width, 800);
    EXPECT_EQ(tree[tree.Root()].height, 600);
    // 800 - 2 * 16 padding - 2 * 16 gaps = 736; the leftover pixel goes to the first child
    EXPECT_EQ(tree[a].width, 246);
    EXPECT_EQ(tree[b].width, 245);
    EXPECT_EQ(tree[c].width, 245);
    for (NodeId id : {a, b, c}) {
        EXPECT_EQ(tree[id].height, 568);
    }
}

TEST(GrowSizingTest, MaxedChildLeavesRestToSibling) {
    LayoutTree tree = MakeRow(500, 10);
    LayoutNode capped = LayoutNode::CreateContainer("capped", Sizing::Grow());
    capped.maxWidth = 200;
    const NodeId a = tree.AddChild(tree.Root(), capped);
    const NodeId b = AddGrowBox(tree, "free");

    FitSizing(tree, tree.Root());
    EXPECT_EQ(DistributeMainAxis(tree, tree.Root()), 0);

    EXPECT_EQ(tree[a].width, 200);
    EXPECT_EQ(tree[b].width, 300);
}

TEST(GrowSizingTest, SmallestChildCatchesUpFirst) {
    LayoutTree tree = MakeRow(100, 10);
    const NodeId big = AddGrowBox(tree, "big", 40);
    const NodeId small = AddGrowBox(tree, "small", 10);

    FitSizing(tree, tree.Root());
    EXPECT_EQ(DistributeMainAxis(tree, tree.Root()), 0);

    EXPECT_EQ(tree[big].width, 50);
    EXPECT_EQ(tree[small].width, 50);
}

TEST(GrowSizingTest, LargerChildKeepsSizeWhenSpaceRunsOut) {
    LayoutTree tree = MakeRow(60, 10);
    const NodeId big = AddGrowBox(tree, "big", 40);
    const NodeId small = AddGrowBox(tree, "small", 10);

    FitSizing(tree, tree.Root());
    DistributeMainAxis(tree, tree.Root());

    EXPECT_EQ(tree[big].width, 40);
    EXPECT_EQ(tree[small].width, 20);
}

TEST(GrowSizingTest, RemainderGoesToFirstTiedChildren) {
    LayoutTree tree = MakeRow(11, 10);
    const NodeId a = AddGrowBox(tree, "a");
    const NodeId b = AddGrowBox(tree, "b");
    const NodeId c = AddGrowBox(tree, "c");

    FitSizing(tree, tree.Root());
    EXPECT_EQ(DistributeMainAxis(tree, tree.Root()), 0);

    EXPECT_EQ(tree[a].width, 4);
    EXPECT_EQ(tree[b].width, 4);
    EXPECT_EQ(tree[c].width, 3);
}

TEST(GrowSizingTest, AllChildrenMaxedLeavesSpaceUnused) {
    LayoutTree tree = MakeRow(100, 10);
    LayoutNode first = LayoutNode::CreateContainer("first", Sizing::Grow());
    first.maxWidth = 20;
    LayoutNode second = LayoutNode::CreateContainer("second", Sizing::Grow());
    second.maxWidth = 30;
    const NodeId a = tree.AddChild(tree.Root(), first);
    const NodeId b = tree.AddChild(tree.Root(), second);

    FitSizing(tree, tree.Root());
    EXPECT_EQ(DistributeMainAxis(tree, tree.Root()), 50);

    EXPECT_EQ(tree[a].width, 20);
    EXPECT_EQ(tree[b].width, 30);
}

TEST(GrowSizingTest, OverflowLeavesChildrenUnchanged) {
    LayoutTree tree = MakeRow(50, 10);
    const NodeId leafA = tree.AddLeaf(tree.Root(), "a", 40, 5);
    const NodeId leafB = tree.AddLeaf(tree.Root(), "b", 40, 5);
    const NodeId grow = AddGrowBox(tree, "grow");

    FitSizing(tree, tree.Root());
    EXPECT_EQ(DistributeMainAxis(tree, tree.Root()), -30);

    EXPECT_EQ(tree[leafA].width, 40);
    EXPECT_EQ(tree[leafB].width, 40);
    EXPECT_EQ(tree[grow].width, 0);
}

TEST(GrowSizingTest, FitAndFixedChildrenDoNotGrow) {
    LayoutTree tree = MakeRow(200, 10);
    const NodeId fit = tree.AddContainer(tree.Root(), "fit", Sizing::Fit());
    const NodeId fixed = tree.AddContainer(tree.Root(), "fixed", Sizing::Fixed(30, 5));
    const NodeId leaf = tree.AddLeaf(tree.Root(), "leaf", 12, 5);
    const NodeId grow = AddGrowBox(tree, "grow");

    FitSizing(tree, tree.Root());
    GrowSizing(tree, tree.Root());

    EXPECT_EQ(tree[fit].width, 0);
    EXPECT_EQ(tree[fixed].width, 30);
    EXPECT_EQ(tree[leaf].width, 12);
    EXPECT_EQ(tree[grow].width, 158);
}

TEST(GrowSizingTest, NoGrowChildrenReturnsLeftover) {
    LayoutTree tree = MakeRow(100, 10);
    tree.AddLeaf(tree.Root(), "a", 30, 5);

    FitSizing(tree, tree.Root());
    EXPECT_EQ(DistributeMainAxis(tree, tree.Root()), 70);
}

// ---------------------------------------------------------------------------
// Cross axis stretch
// ---------------------------------------------------------------------------

TEST(GrowSizingTest, CrossAxisGrowFillsContentBox) {
    LayoutTree tree;
    LayoutNode root = LayoutNode::CreateContainer("root", Sizing::Fixed(100, 80));
    root.padding = 5;
    tree.SetRoot(root);
    const NodeId tall = tree.AddContainer(tree.Root(), "tall", Sizing{SizingMode::Fit(), SizingMode::Grow()});
    LayoutNode cappedNode = LayoutNode::CreateContainer("capped", Sizing{SizingMode::Fit(), SizingMode::Grow()});
    cappedNode.maxHeight = 50;
    const NodeId capped = tree.AddChild(tree.Root(), cappedNode);
    const NodeId leaf = tree.AddLeaf(tree.Root(), "leaf", 10, 10);

    FitSizing(tree, tree.Root());
    GrowSizing(tree, tree.Root());

    EXPECT_EQ(tree[tall].height, 70);
    EXPECT_EQ(tree[capped].height, 50);
    EXPECT_EQ(tree[leaf].height, 10);
}

TEST(GrowSizingTest, TopToBottomGrowsVertically) {
    LayoutTree tree;
    tree.SetRoot(LayoutNode::CreateContainer("column", Sizing::Fixed(40, 90), LayoutMode::TopToBottom));
    const NodeId a = tree.AddContainer(tree.Root(), "a", Sizing::Grow());
    const NodeId b = tree.AddContainer(tree.Root(), "b", Sizing::Grow());

    FitSizing(tree, tree.Root());
    GrowSizing(tree, tree.Root());

    EXPECT_EQ(tree[a].height, 45);
    EXPECT_EQ(tree[b].height, 45);
    EXPECT_EQ(tree[a].width, 40);
    EXPECT_EQ(tree[b].width, 40);
}

// ---------------------------------------------------------------------------
// Recursion
// ---------------------------------------------------------------------------

TEST(GrowSizingTest, NestedContainersGrowTopDown) {
    LayoutTree tree;
    tree.SetRoot(LayoutNode::CreateContainer("root", Sizing::Grow()));
    const NodeId panel = tree.AddContainer(tree.Root(), "panel", Sizing::Grow(), LayoutMode::TopToBottom);
    const NodeId top = tree.AddContainer(panel, "top", Sizing::Grow());
    const NodeId bottom = tree.AddContainer(panel, "bottom", Sizing::Grow());

    ComputeLayout(tree, glm::ivec2(400, 300));

    EXPECT_EQ(tree[panel].width, 400);
    EXPECT_EQ(tree[panel].height, 300);
    EXPECT_EQ(tree[top].height, 150);
    EXPECT_EQ(tree[bottom].height, 150);
    EXPECT_EQ(tree[top].width, 400);
}

TEST(GrowSizingTest, RepeatedLayoutIsStable) {
    LayoutTree tree;
    tree.SetRoot(LayoutNode::CreateContainer("root", Sizing::Grow()));
    const NodeId a = tree.AddContainer(tree.Root(), "a", Sizing::Grow());
    const NodeId b = tree.AddContainer(tree.Root(), "b", Sizing::Grow());

    ComputeLayout(tree, glm::ivec2(300, 100));
    ComputeLayout(tree, glm::ivec2(300, 100));
    EXPECT_EQ(tree[a].width, 150);
    EXPECT_EQ(tree[b].width, 150);

    // Shrinking the viewport must not keep the previous frame's sizes
    ComputeLayout(tree, glm::ivec2(100, 100));
    EXPECT_EQ(tree[a].width, 50);
    EXPECT_EQ(tree[b].width, 50);
}
