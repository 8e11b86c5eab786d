#include "teacup/layout/UiRoot.hpp"

#include <algorithm>
#include <iostream>
#include <utility>

#include "teacup/layout/LayoutEngine.hpp"
#include "teacup/render/Mesh.hpp"
#include "teacup/render/RenderBackend.hpp"

namespace teacup::layout
{
namespace
{
const glm::vec4 kDebugBoundsColor(0.0F, 1.0F, 0.0F, 0.5F);
const glm::vec4 kDebugContentColor(0.0F, 1.0F, 1.0F, 0.5F);
} // namespace

UiRoot::UiRoot(glm::ivec2 viewport)
{
    SetViewportSize(viewport.x, viewport.y);
}

void UiRoot::SetViewportSize(int width, int height)
{
    // Minimized windows report zero; keep the last usable size
    if (width <= 0 || height <= 0)
    {
        std::cerr << "[UiRoot] Ignoring viewport " << width << "x" << height << "\n";
        return;
    }
    m_viewport = glm::ivec2(width, height);
}

void UiRoot::SetTree(LayoutTree tree)
{
    m_tree = std::move(tree);
}

void UiRoot::ClearTree()
{
    m_tree.reset();
}

void UiRoot::ComputeLayout()
{
    if (!HasTree())
    {
        return;
    }
    layout::ComputeLayout(*m_tree, m_viewport);
}

void UiRoot::Draw(render::RenderBackend& backend)
{
    render::RenderPass pass;
    pass.viewport = m_viewport;
    pass.clearColor = m_backgroundColor;
    pass.frameIndex = m_frameIndex++;

    backend.BeginPass(pass);
    if (HasTree())
    {
        DrawNode(*m_tree, m_tree->Root(), backend, pass);

        // Debug overlay
        if (m_debugLayout)
        {
            DrawDebugLayout(*m_tree, m_tree->Root(), backend, pass);
        }
    }
    backend.EndPass(pass);
}

void UiRoot::DrawNode(const LayoutTree& tree, NodeId id, render::RenderBackend& backend, const render::RenderPass& pass) const
{
    const LayoutNode& node = tree[id];
    const glm::ivec2 size(node.width, node.height);
    backend.Submit(render::MakeScreenSpaceRectangle(node.position, size, node.color, pass.viewport), pass);

    for (NodeId child : node.children)
    {
        DrawNode(tree, child, backend, pass);
    }
}

void UiRoot::DrawDebugLayout(const LayoutTree& tree, NodeId id, render::RenderBackend& backend, const render::RenderPass& pass) const
{
    const LayoutNode& node = tree[id];

    // Green outline for bounds
    DrawRectOutline(node.position, glm::ivec2(node.width, node.height), kDebugBoundsColor, backend, pass);

    // Cyan for content area
    if (node.padding > 0)
    {
        const glm::ivec2 contentPosition = node.position + glm::ivec2(node.padding, node.padding);
        const glm::ivec2 contentSize(std::max(0, node.width - 2 * node.padding), std::max(0, node.height - 2 * node.padding));
        DrawRectOutline(contentPosition, contentSize, kDebugContentColor, backend, pass);
    }

    for (NodeId child : node.children)
    {
        DrawDebugLayout(tree, child, backend, pass);
    }
}

void UiRoot::DrawRectOutline(glm::ivec2 position, glm::ivec2 size, const glm::vec4& color, render::RenderBackend& backend, const render::RenderPass& pass) const
{
    const int t = 1;
    backend.Submit(render::MakeScreenSpaceRectangle(position, glm::ivec2(size.x, t), color, pass.viewport), pass);
    backend.Submit(render::MakeScreenSpaceRectangle(glm::ivec2(position.x, position.y + size.y - t), glm::ivec2(size.x, t), color, pass.viewport), pass);
    backend.Submit(render::MakeScreenSpaceRectangle(position, glm::ivec2(t, size.y), color, pass.viewport), pass);
    backend.Submit(render::MakeScreenSpaceRectangle(glm::ivec2(position.x + size.x - t, position.y), glm::ivec2(t, size.y), color, pass.viewport), pass);
}
} // namespace teacup::layout
