#include "teacup/render/MeshBatch.hpp"

#include <iostream>

namespace teacup::render
{
void MeshBatch::BeginPass(const RenderPass& pass)
{
    if (m_inPass)
    {
        std::cerr << "[MeshBatch] BeginPass: frame " << m_pass.frameIndex << " was never ended, discarding it\n";
    }
    Clear();
    m_pass = pass;
    m_inPass = true;
}

void MeshBatch::Submit(const Mesh& mesh, const RenderPass& pass)
{
    if (!m_inPass || pass.frameIndex != m_pass.frameIndex)
    {
        std::cerr << "[MeshBatch] Submit: mesh for frame " << pass.frameIndex << " outside of an open pass, ignored\n";
        return;
    }
    if (mesh.Empty())
    {
        return;
    }

    // Rebase indices onto the consolidated vertex list
    const auto baseVertex = static_cast<std::uint32_t>(m_vertices.size());
    m_vertices.insert(m_vertices.end(), mesh.vertices.begin(), mesh.vertices.end());
    m_indices.reserve(m_indices.size() + mesh.indices.size());
    for (std::uint16_t index : mesh.indices)
    {
        m_indices.push_back(baseVertex + index);
    }
    ++m_drawCalls;
}

void MeshBatch::EndPass(const RenderPass& pass)
{
    if (!m_inPass || pass.frameIndex != m_pass.frameIndex)
    {
        std::cerr << "[MeshBatch] EndPass: frame " << pass.frameIndex << " is not the open pass\n";
        return;
    }
    m_inPass = false;
    ++m_passesCompleted;
}

void MeshBatch::Clear()
{
    m_vertices.clear();
    m_indices.clear();
    m_drawCalls = 0;
}
} // namespace teacup::render
