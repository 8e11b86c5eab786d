#pragma once

#include <optional>
#include <string>

#include <glm/vec2.hpp>
#include <glm/vec4.hpp>

#include "teacup/layout/LayoutTree.hpp"
#include "teacup/layout/UiRoot.hpp"

namespace teacup::io
{
// A screen file: driver settings plus the tree to lay out
struct ScreenDefinition
{
    std::string id;
    float dpi = 96.0F;
    std::optional<glm::ivec2> viewport;
    glm::vec4 background{0.0F, 0.0F, 0.0F, 1.0F};
    layout::LayoutTree tree;
};

// Load a screen definition from JSON file
// Format:
// {
//   "asset_version": 1,
//   "id": "main",
//   "dpi": 96,
//   "viewport": [800, 600],
//   "background": "#000000",
//   "root": {
//     "id": "root",
//     "type": "Container",
//     "layout": { "mode": "leftToRight", "padding": 16, "childGap": 16 },
//     "sizing": { "width": "grow", "height": "grow" },
//     "color": "#ff0000",
//     "children": [...]
//   }
// }
// Lengths are pixels when numeric; strings may carry a px, mm or in suffix.
std::optional<ScreenDefinition> LoadScreen(const std::string& filePath);

// Load a screen definition from JSON string
std::optional<ScreenDefinition> ParseScreen(const std::string& jsonContent);

// Save a screen definition to JSON file
bool SaveScreen(const std::string& filePath, const ScreenDefinition& screen);

// Serialize a screen definition to JSON string. Lengths are written in pixels.
std::string SerializeScreen(const ScreenDefinition& screen);

// Moves the screen's tree and settings into a root driver
// Returns false if the screen has no nodes
bool ApplyScreen(layout::UiRoot& root, ScreenDefinition screen);

// Hot reload support - true when the file's modification time differs from lastModTime,
// which is then updated. Missing files report no change.
bool HasFileChanged(const std::string& filePath, long long& lastModTime);

// Colors: #rgb, #rrggbb, #rrggbbaa, rgb(r,g,b), rgba(r,g,b,a) or a named color.
// rgb channels are 0..255, alpha 0..1; out-of-range channels are clamped.
std::optional<glm::vec4> ParseColor(const std::string& value);
std::string ColorToHex(const glm::vec4& color);

// Lengths: "12", "12px", "4.5mm", "0.5in". Rounded to whole pixels; negative values
// and values beyond int range are rejected.
std::optional<int> ParseLength(const std::string& value, float dpi);
} // namespace teacup::io
