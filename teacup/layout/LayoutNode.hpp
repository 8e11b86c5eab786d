#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <glm/vec2.hpp>
#include <glm/vec4.hpp>

#include "teacup/layout/Sizing.hpp"

namespace teacup::layout
{
// Stable index of a node inside its LayoutTree
using NodeId = std::uint32_t;
constexpr NodeId kInvalidNode = std::numeric_limits<NodeId>::max();

// Node kinds
enum class NodeKind
{
    Leaf,     // Primitive with no sizing policy and no children; resolves to its minimum
    Container // Sizable node that stacks its children
};

// A single rectangle of the layout tree.
// Resolved fields (width, height, position) are rewritten by every layout pass.
struct LayoutNode
{
    // Identification (optional, for lookup and diagnostics)
    std::string id;

    NodeKind kind = NodeKind::Container;

    // Resolved size
    int width = 0;
    int height = 0;

    // Constraints
    int minWidth = 0;
    int minHeight = 0;
    std::optional<int> maxWidth;
    std::optional<int> maxHeight;

    // Top-left corner, valid after the position pass
    glm::ivec2 position{0, 0};

    // Container properties
    Sizing sizing;
    LayoutMode layoutMode = LayoutMode::LeftToRight;
    int padding = 0;
    int childGap = 0;

    glm::vec4 color{1.0F, 1.0F, 1.0F, 1.0F};

    // Tree structure (indices into the owning LayoutTree)
    NodeId parent = kInvalidNode;
    std::vector<NodeId> children;

    // --- Per-axis access ---

    [[nodiscard]] int Size(Axis axis) const
    {
        return axis == Axis::Horizontal ? width : height;
    }
    void SetSize(Axis axis, int value)
    {
        (axis == Axis::Horizontal ? width : height) = value;
    }

    [[nodiscard]] int MinSize(Axis axis) const
    {
        return axis == Axis::Horizontal ? minWidth : minHeight;
    }
    void SetMinSize(Axis axis, int value)
    {
        (axis == Axis::Horizontal ? minWidth : minHeight) = value;
    }

    [[nodiscard]] std::optional<int> MaxSize(Axis axis) const
    {
        return axis == Axis::Horizontal ? maxWidth : maxHeight;
    }
    void SetMaxSize(Axis axis, std::optional<int> value)
    {
        (axis == Axis::Horizontal ? maxWidth : maxHeight) = value;
    }

    [[nodiscard]] int Position(Axis axis) const
    {
        return axis == Axis::Horizontal ? position.x : position.y;
    }
    void SetPosition(Axis axis, int value)
    {
        (axis == Axis::Horizontal ? position.x : position.y) = value;
    }

    // Leaves carry no sizing policy of their own and always behave as Fit.
    [[nodiscard]] SizingMode Mode(Axis axis) const
    {
        return kind == NodeKind::Leaf ? SizingMode::Fit() : sizing.Along(axis);
    }

    // Raises value to min, then lowers it to max (max wins on conflict)
    [[nodiscard]] int Clamp(Axis axis, int value) const
    {
        value = std::max(value, MinSize(axis));
        if (const auto maxValue = MaxSize(axis))
        {
            value = std::min(value, *maxValue);
        }
        return value;
    }

    [[nodiscard]] bool IsLeaf() const
    {
        return kind == NodeKind::Leaf;
    }
    [[nodiscard]] bool IsContainer() const
    {
        return kind == NodeKind::Container;
    }

    // Helper factory methods
    static LayoutNode CreateContainer(std::string nodeId, Sizing nodeSizing = Sizing::Fit(), LayoutMode mode = LayoutMode::LeftToRight)
    {
        LayoutNode node;
        node.id = std::move(nodeId);
        node.kind = NodeKind::Container;
        node.sizing = nodeSizing;
        node.layoutMode = mode;
        return node;
    }

    static LayoutNode CreateLeaf(std::string nodeId, int minW, int minH)
    {
        LayoutNode node;
        node.id = std::move(nodeId);
        node.kind = NodeKind::Leaf;
        node.minWidth = minW;
        node.minHeight = minH;
        return node;
    }
};
} // namespace teacup::layout
