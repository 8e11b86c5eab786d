#include "teacup/layout/LayoutTree.hpp"

#include <iostream>
#include <sstream>

namespace teacup::layout
{
namespace
{
const std::vector<NodeId> kNoChildren;

std::string SizingModeToString(const SizingMode& mode)
{
    switch (mode.kind)
    {
        case SizingMode::Kind::Fixed:
            return "fixed(" + std::to_string(mode.value) + ")";
        case SizingMode::Kind::Grow:
            return "grow";
        case SizingMode::Kind::Fit:
        default:
            return "fit";
    }
}
} // namespace

NodeId LayoutTree::SetRoot(LayoutNode root)
{
    Clear();

    root.parent = kInvalidNode;
    root.children.clear();
    m_nodes.push_back(std::move(root));
    RebuildNodeIndex();
    return 0;
}

void LayoutTree::Clear()
{
    m_nodes.clear();
    m_nodeIndex.clear();
}

NodeId LayoutTree::AddChild(NodeId parent, LayoutNode node)
{
    if (!IsValid(parent))
    {
        std::cerr << "[LayoutTree] AddChild: invalid parent " << parent << "\n";
        return kInvalidNode;
    }
    if (m_nodes[parent].IsLeaf())
    {
        std::cerr << "[LayoutTree] AddChild: parent '" << m_nodes[parent].id << "' is a leaf and can't hold children\n";
        return kInvalidNode;
    }

    const auto childId = static_cast<NodeId>(m_nodes.size());
    node.parent = parent;
    node.children.clear();
    if (!node.id.empty())
    {
        m_nodeIndex.emplace(node.id, childId);
    }
    // push_back may reallocate, so index again afterwards
    m_nodes.push_back(std::move(node));
    m_nodes[parent].children.push_back(childId);
    return childId;
}

NodeId LayoutTree::AddContainer(NodeId parent, std::string id, Sizing sizing, LayoutMode mode)
{
    return AddChild(parent, LayoutNode::CreateContainer(std::move(id), sizing, mode));
}

NodeId LayoutTree::AddLeaf(NodeId parent, std::string id, int minWidth, int minHeight)
{
    return AddChild(parent, LayoutNode::CreateLeaf(std::move(id), minWidth, minHeight));
}

NodeId LayoutTree::ParentOf(NodeId id) const
{
    return IsValid(id) ? m_nodes[id].parent : kInvalidNode;
}

const std::vector<NodeId>& LayoutTree::ChildrenOf(NodeId id) const
{
    return IsValid(id) ? m_nodes[id].children : kNoChildren;
}

NodeId LayoutTree::FindNode(std::string_view id) const
{
    auto it = m_nodeIndex.find(std::string(id));
    if (it != m_nodeIndex.end())
    {
        return it->second;
    }
    return kInvalidNode;
}

void LayoutTree::RebuildNodeIndex()
{
    m_nodeIndex.clear();
    for (std::size_t i = 0; i < m_nodes.size(); ++i)
    {
        // First node wins on duplicate ids
        if (!m_nodes[i].id.empty())
        {
            m_nodeIndex.emplace(m_nodes[i].id, static_cast<NodeId>(i));
        }
    }
}

std::string LayoutTree::DescribeTree() const
{
    if (m_nodes.empty())
    {
        return "(empty)\n";
    }
    std::string out;
    DescribeNode(Root(), 0, out);
    return out;
}

void LayoutTree::DescribeNode(NodeId id, int depth, std::string& out) const
{
    const LayoutNode& node = m_nodes[id];

    std::ostringstream line;
    line << std::string(static_cast<std::size_t>(depth) * 2, ' ');
    line << (node.IsLeaf() ? "[Leaf]" : "[Container]");
    line << " #" << id;
    if (!node.id.empty())
    {
        line << " '" << node.id << "'";
    }
    line << " " << node.width << "x" << node.height << " @(" << node.position.x << "," << node.position.y << ")";
    if (node.IsContainer())
    {
        line << " sizing=" << SizingModeToString(node.sizing.width) << "/" << SizingModeToString(node.sizing.height);
        line << (node.layoutMode == LayoutMode::TopToBottom ? " ttb" : " ltr");
    }
    line << "\n";
    out += line.str();

    for (NodeId child : node.children)
    {
        DescribeNode(child, depth + 1, out);
    }
}
} // namespace teacup::layout
