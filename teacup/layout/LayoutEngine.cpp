#include "teacup/layout/LayoutEngine.hpp"

#include <algorithm>
#include <initializer_list>
#include <iostream>
#include <limits>
#include <optional>
#include <vector>

namespace teacup::layout
{
namespace
{
int AxisIndex(Axis axis)
{
    return axis == Axis::Horizontal ? 0 : 1;
}

int GapTotal(const LayoutNode& node)
{
    const auto count = static_cast<int>(node.children.size());
    return count > 0 ? (count - 1) * node.childGap : 0;
}

void ResolveFitAxis(LayoutNode& node, Axis axis, int contentSize)
{
    const SizingMode mode = node.Mode(axis);
    const int size = mode.IsFixed() ? mode.value : contentSize;
    node.SetSize(axis, node.Clamp(axis, size));
}

void FitLeaf(LayoutNode& leaf)
{
    leaf.width = leaf.Clamp(Axis::Horizontal, leaf.minWidth);
    leaf.height = leaf.Clamp(Axis::Vertical, leaf.minHeight);
}

void FitNode(LayoutTree& tree, NodeId id)
{
    if (tree[id].IsLeaf())
    {
        FitLeaf(tree[id]);
        return;
    }

    // Measure children first
    for (NodeId child : tree[id].children)
    {
        FitNode(tree, child);
    }

    LayoutNode& node = tree[id];
    const Axis main = MainAxis(node.layoutMode);
    const Axis cross = !main;

    int mainContent = 0;
    int crossContent = 0;
    for (NodeId child : node.children)
    {
        mainContent += tree[child].Size(main);
        crossContent = std::max(crossContent, tree[child].Size(cross));
    }
    mainContent += GapTotal(node) + 2 * node.padding;
    crossContent += 2 * node.padding;

    ResolveFitAxis(node, main, mainContent);
    ResolveFitAxis(node, cross, crossContent);
}

void GrowNode(LayoutTree& tree, NodeId id)
{
    if (tree[id].IsLeaf())
    {
        return;
    }

    DistributeMainAxis(tree, id);

    const LayoutNode& node = tree[id];
    const Axis cross = !MainAxis(node.layoutMode);
    const int crossAvailable = node.Size(cross) - 2 * node.padding;

    // Children overlay the cross axis, so every Grow child takes all of it
    for (NodeId child : node.children)
    {
        LayoutNode& childNode = tree[child];
        if (childNode.Mode(cross).IsGrow())
        {
            childNode.SetSize(cross, childNode.Clamp(cross, crossAvailable));
        }
    }

    for (NodeId child : node.children)
    {
        if (tree[child].IsContainer())
        {
            GrowNode(tree, child);
        }
    }
}

void PositionNode(LayoutTree& tree, NodeId id)
{
    const LayoutNode& node = tree[id];
    const Axis main = MainAxis(node.layoutMode);

    glm::ivec2 cursor = node.position + glm::ivec2(node.padding, node.padding);
    for (NodeId child : node.children)
    {
        LayoutNode& childNode = tree[child];
        childNode.position = cursor;
        cursor[AxisIndex(main)] += childNode.Size(main) + node.childGap;

        if (childNode.IsContainer())
        {
            PositionNode(tree, child);
        }
    }
}

bool CheckNode(const LayoutTree& tree, NodeId id, const char* pass)
{
    if (tree.IsValid(id))
    {
        return true;
    }
    std::cerr << "[LayoutEngine] " << pass << ": node " << id << " is not part of the tree, skipping\n";
    return false;
}
} // namespace

void FitSizing(LayoutTree& tree, NodeId id)
{
    if (!CheckNode(tree, id, "FitSizing"))
    {
        return;
    }
    FitNode(tree, id);
}

void GrowSizing(LayoutTree& tree, NodeId id)
{
    if (!CheckNode(tree, id, "GrowSizing"))
    {
        return;
    }
    GrowNode(tree, id);
}

int DistributeMainAxis(LayoutTree& tree, NodeId id)
{
    if (!CheckNode(tree, id, "DistributeMainAxis") || tree[id].IsLeaf())
    {
        return 0;
    }

    const LayoutNode& container = tree[id];
    const Axis main = MainAxis(container.layoutMode);
    const std::vector<NodeId>& children = container.children;
    const int available = container.Size(main) - 2 * container.padding - GapTotal(container);

    const auto remainingSpace = [&]() {
        int used = 0;
        for (NodeId child : children)
        {
            used += tree[child].Size(main);
        }
        return available - used;
    };

    std::vector<NodeId> growable;
    for (NodeId child : children)
    {
        if (tree[child].Mode(main).IsGrow())
        {
            growable.push_back(child);
        }
    }

    int remaining = remainingSpace();
    if (remaining <= 0 || growable.empty())
    {
        return remaining;
    }

    const auto grow = [&](NodeId child, int step) {
        LayoutNode& node = tree[child];
        int newSize = std::max(node.Size(main) + step, node.MinSize(main));
        const std::optional<int> maxSize = node.MaxSize(main);
        if (maxSize && newSize >= *maxSize)
        {
            newSize = *maxSize;
            growable.erase(std::remove(growable.begin(), growable.end(), child), growable.end());
        }
        node.SetSize(main, newSize);
    };

    // Tier merges and maxed children bound the number of iterations
    const std::size_t maxIterations = 2 * growable.size() + 2;
    std::size_t iteration = 0;
    std::vector<NodeId> tied;

    while (remaining > 0 && !growable.empty())
    {
        if (iteration++ >= maxIterations)
        {
            std::cerr << "[LayoutEngine] DistributeMainAxis: node '" << container.id << "' did not settle after " << maxIterations
                      << " iterations, " << remaining << "px left\n";
            break;
        }

        int floor = std::numeric_limits<int>::max();
        for (NodeId child : growable)
        {
            floor = std::min(floor, tree[child].Size(main));
        }

        tied.clear();
        std::optional<int> next;
        for (NodeId child : growable)
        {
            const int size = tree[child].Size(main);
            if (size == floor)
            {
                tied.push_back(child);
            }
            else
            {
                next = next ? std::min(*next, size) : size;
            }
        }

        if (tied.empty())
        {
            std::cerr << "[LayoutEngine] DistributeMainAxis: no smallest child found for '" << container.id << "'\n";
            break;
        }

        const auto tiedCount = static_cast<int>(tied.size());
        int step = remaining / tiedCount;
        if (next)
        {
            step = std::min(*next - floor, step);
        }

        if (step > 0)
        {
            for (NodeId child : tied)
            {
                grow(child, step);
            }
        }
        else
        {
            // Remainder is smaller than the tied set: one pixel each, in child order
            for (int i = 0; i < remaining; ++i)
            {
                grow(tied[static_cast<std::size_t>(i)], 1);
            }
        }

        remaining = remainingSpace();
    }

    return remaining;
}

void AssignPositions(LayoutTree& tree, NodeId id)
{
    if (!CheckNode(tree, id, "AssignPositions") || tree[id].IsLeaf())
    {
        return;
    }
    PositionNode(tree, id);
}

void ForceRootToViewport(LayoutTree& tree, glm::ivec2 viewport)
{
    if (tree.Empty())
    {
        return;
    }

    LayoutNode& root = tree[tree.Root()];
    for (Axis axis : {Axis::Horizontal, Axis::Vertical})
    {
        if (root.Mode(axis).IsGrow())
        {
            root.SetSize(axis, root.Clamp(axis, viewport[AxisIndex(axis)]));
        }
    }
}

void ComputeLayout(LayoutTree& tree, glm::ivec2 viewport)
{
    if (tree.Empty())
    {
        return;
    }

    const NodeId root = tree.Root();

    // Fit pass
    FitSizing(tree, root);

    ForceRootToViewport(tree, viewport);

    // Grow pass
    GrowSizing(tree, root);

    // Position pass
    tree[root].position = glm::ivec2(0, 0);
    AssignPositions(tree, root);
}
} // namespace teacup::layout
