#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "teacup/render/RenderBackend.hpp"

namespace teacup::render
{
// Backend that consolidates all meshes of a pass into one vertex and one index
// list, so a GPU backend can upload them in a single call per frame.
class MeshBatch : public RenderBackend
{
public:
    void BeginPass(const RenderPass& pass) override;
    void Submit(const Mesh& mesh, const RenderPass& pass) override;
    void EndPass(const RenderPass& pass) override;

    [[nodiscard]] const std::vector<Vertex>& Vertices() const
    {
        return m_vertices;
    }
    [[nodiscard]] const std::vector<std::uint32_t>& Indices() const
    {
        return m_indices;
    }
    // Meshes submitted in the current (or last finished) pass
    [[nodiscard]] std::uint32_t DrawCalls() const
    {
        return m_drawCalls;
    }
    [[nodiscard]] const RenderPass& LastPass() const
    {
        return m_pass;
    }
    [[nodiscard]] bool InPass() const
    {
        return m_inPass;
    }
    [[nodiscard]] std::uint64_t PassesCompleted() const
    {
        return m_passesCompleted;
    }

    void Clear();

private:
    std::vector<Vertex> m_vertices;
    std::vector<std::uint32_t> m_indices;
    std::uint32_t m_drawCalls = 0;
    RenderPass m_pass{};
    bool m_inPass = false;
    std::uint64_t m_passesCompleted = 0;
};
} // namespace teacup::render
