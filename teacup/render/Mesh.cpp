#include "teacup/render/Mesh.hpp"

namespace teacup::render
{
Mesh MakeRectangle(float x, float y, float w, float h, const glm::vec4& color)
{
    Mesh mesh;
    mesh.vertices = {
        Vertex{glm::vec3(x, y, 0.0F), color},
        Vertex{glm::vec3(x + w, y, 0.0F), color},
        Vertex{glm::vec3(x, y - h, 0.0F), color},
        Vertex{glm::vec3(x + w, y - h, 0.0F), color},
    };
    mesh.indices = {0, 2, 1, 3, 1, 2};
    return mesh;
}

Mesh MakeScreenSpaceRectangle(glm::ivec2 position, glm::ivec2 size, const glm::vec4& color, glm::ivec2 viewport)
{
    if (viewport.x <= 0 || viewport.y <= 0)
    {
        return Mesh{};
    }

    const glm::vec2 extent(static_cast<float>(viewport.x), static_cast<float>(viewport.y));
    const float x = 2.0F * static_cast<float>(position.x) / extent.x - 1.0F;
    const float y = 1.0F - 2.0F * static_cast<float>(position.y) / extent.y;
    const float w = 2.0F * static_cast<float>(size.x) / extent.x;
    const float h = 2.0F * static_cast<float>(size.y) / extent.y;

    return MakeRectangle(x, y, w, h, color);
}
} // namespace teacup::render
