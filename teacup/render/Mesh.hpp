#pragma once

#include <cstdint>
#include <vector>

#include <glm/vec2.hpp>
#include <glm/vec3.hpp>
#include <glm/vec4.hpp>

namespace teacup::render
{
struct Vertex
{
    glm::vec3 position{0.0F, 0.0F, 0.0F};
    glm::vec4 color{1.0F, 1.0F, 1.0F, 1.0F};
};

// Indexed triangle geometry ready for upload
struct Mesh
{
    std::vector<Vertex> vertices;
    std::vector<std::uint16_t> indices;

    [[nodiscard]] bool Empty() const
    {
        return indices.empty();
    }
};

// Quad with its top-left corner at (x, y) extending right by w and down by h
// in a y-up space (normalized device coordinates). Two triangles, four vertices.
Mesh MakeRectangle(float x, float y, float w, float h, const glm::vec4& color);

// Same quad from pixel coordinates (origin top-left, y down) inside a viewport
// of the given size. Returns an empty mesh for a non-positive viewport.
Mesh MakeScreenSpaceRectangle(glm::ivec2 position, glm::ivec2 size, const glm::vec4& color, glm::ivec2 viewport);
} // namespace teacup::render
