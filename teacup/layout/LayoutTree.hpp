#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "teacup/layout/LayoutNode.hpp"

namespace teacup::layout
{
// Layout tree - owns every node in a flat arena addressed by NodeId.
// Children are stored as indices, the parent link is a plain index used for lookup only.
class LayoutTree
{
public:
    LayoutTree() = default;

    // Root management
    NodeId SetRoot(LayoutNode root);
    [[nodiscard]] NodeId Root() const
    {
        return m_nodes.empty() ? kInvalidNode : 0;
    }
    [[nodiscard]] bool Empty() const
    {
        return m_nodes.empty();
    }
    [[nodiscard]] std::size_t Size() const
    {
        return m_nodes.size();
    }
    void Clear();

    // Tree building. Returns kInvalidNode if the parent can't take children.
    NodeId AddChild(NodeId parent, LayoutNode node);
    NodeId AddContainer(NodeId parent, std::string id, Sizing sizing = Sizing::Fit(), LayoutMode mode = LayoutMode::LeftToRight);
    NodeId AddLeaf(NodeId parent, std::string id, int minWidth, int minHeight);

    // Node access
    [[nodiscard]] bool IsValid(NodeId id) const
    {
        return id < m_nodes.size();
    }
    // Checked access, nullptr for invalid ids
    [[nodiscard]] LayoutNode* Node(NodeId id)
    {
        return IsValid(id) ? &m_nodes[id] : nullptr;
    }
    [[nodiscard]] const LayoutNode* Node(NodeId id) const
    {
        return IsValid(id) ? &m_nodes[id] : nullptr;
    }
    // Unchecked access
    LayoutNode& operator[](NodeId id)
    {
        return m_nodes[id];
    }
    const LayoutNode& operator[](NodeId id) const
    {
        return m_nodes[id];
    }

    [[nodiscard]] NodeId ParentOf(NodeId id) const;
    [[nodiscard]] const std::vector<NodeId>& ChildrenOf(NodeId id) const;
    [[nodiscard]] const std::vector<LayoutNode>& Nodes() const
    {
        return m_nodes;
    }

    // Node lookup by ID
    [[nodiscard]] NodeId FindNode(std::string_view id) const;
    void RebuildNodeIndex();

    // Debug dump, one line per node in pre-order
    [[nodiscard]] std::string DescribeTree() const;

private:
    void DescribeNode(NodeId id, int depth, std::string& out) const;

    std::vector<LayoutNode> m_nodes;
    std::unordered_map<std::string, NodeId> m_nodeIndex;
};
} // namespace teacup::layout
