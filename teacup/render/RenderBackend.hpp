#pragma once

#include <cstdint>

#include <glm/vec2.hpp>
#include <glm/vec4.hpp>

#include "teacup/render/Mesh.hpp"

namespace teacup::render
{
// One frame's render pass as seen by a backend
struct RenderPass
{
    glm::ivec2 viewport{0, 0};
    glm::vec4 clearColor{0.0F, 0.0F, 0.0F, 1.0F};
    std::uint64_t frameIndex = 0;
};

// Submission side of a renderer. Device, surface and pipeline setup live in the
// implementation; the layout core only hands over finished meshes.
class RenderBackend
{
public:
    virtual ~RenderBackend() = default;

    virtual void BeginPass(const RenderPass& pass) = 0;
    virtual void Submit(const Mesh& mesh, const RenderPass& pass) = 0;
    virtual void EndPass(const RenderPass& pass) = 0;
};
} // namespace teacup::render
