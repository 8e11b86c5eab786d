#pragma once

#include <cstdint>
#include <optional>

#include <glm/vec2.hpp>
#include <glm/vec4.hpp>

#include "teacup/layout/LayoutTree.hpp"

namespace teacup::render
{
class RenderBackend;
struct RenderPass;
} // namespace teacup::render

namespace teacup::layout
{
// Root driver - owns the tree and the viewport and runs the layout passes each frame.
// The root is the only node sized from outside the tree: on every axis where its
// sizing is Grow it takes the viewport dimension.
class UiRoot
{
public:
    UiRoot() = default;
    explicit UiRoot(glm::ivec2 viewport);

    // Viewport, usually the framebuffer size. Non-positive sizes are ignored.
    void SetViewportSize(int width, int height);
    [[nodiscard]] glm::ivec2 ViewportSize() const
    {
        return m_viewport;
    }

    void SetBackgroundColor(const glm::vec4& color)
    {
        m_backgroundColor = color;
    }
    [[nodiscard]] const glm::vec4& BackgroundColor() const
    {
        return m_backgroundColor;
    }

    // Tree ownership. Replacing the tree is how callers apply structural changes.
    void SetTree(LayoutTree tree);
    void ClearTree();
    [[nodiscard]] bool HasTree() const
    {
        return m_tree.has_value() && !m_tree->Empty();
    }
    [[nodiscard]] LayoutTree* Tree()
    {
        return m_tree ? &*m_tree : nullptr;
    }
    [[nodiscard]] const LayoutTree* Tree() const
    {
        return m_tree ? &*m_tree : nullptr;
    }

    // Layout pass - fit, root forcing, grow, positions
    void ComputeLayout();

    // Emits one rectangle per node, parents before children
    void Draw(render::RenderBackend& backend);

    // Debug/Editor support
    void SetDebugLayout(bool enabled)
    {
        m_debugLayout = enabled;
    }
    [[nodiscard]] bool IsDebugLayout() const
    {
        return m_debugLayout;
    }

    [[nodiscard]] std::uint64_t FrameIndex() const
    {
        return m_frameIndex;
    }

private:
    void DrawNode(const LayoutTree& tree, NodeId id, render::RenderBackend& backend, const render::RenderPass& pass) const;
    void DrawDebugLayout(const LayoutTree& tree, NodeId id, render::RenderBackend& backend, const render::RenderPass& pass) const;
    void DrawRectOutline(glm::ivec2 position, glm::ivec2 size, const glm::vec4& color, render::RenderBackend& backend, const render::RenderPass& pass) const;

    std::optional<LayoutTree> m_tree;
    glm::ivec2 m_viewport{800, 600};
    glm::vec4 m_backgroundColor{0.0F, 0.0F, 0.0F, 1.0F};
    bool m_debugLayout = false;
    std::uint64_t m_frameIndex = 0;
};
} // namespace teacup::layout
