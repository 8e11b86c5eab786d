#include "teacup/io/LayoutSerialization.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <iterator>
#include <limits>
#include <sstream>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace teacup::io
{
namespace
{
using json = nlohmann::json;
using layout::LayoutMode;
using layout::LayoutNode;
using layout::LayoutTree;
using layout::NodeId;
using layout::NodeKind;
using layout::Sizing;
using layout::SizingMode;

constexpr int kAssetVersion = 1;
constexpr double kMillimetersPerInch = 25.4;

std::string Trim(const std::string& str)
{
    const auto first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
    {
        return "";
    }
    const auto last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::string ToLower(std::string str)
{
    std::transform(str.begin(), str.end(), str.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return str;
}

bool EndsWith(const std::string& str, const std::string& suffix)
{
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Whole-string decimal number, nullopt on trailing garbage
std::optional<double> ParseNumber(const std::string& str)
{
    const std::string v = Trim(str);
    if (v.empty())
    {
        return std::nullopt;
    }
    char* end = nullptr;
    const double number = std::strtod(v.c_str(), &end);
    if (end != v.c_str() + v.size() || !std::isfinite(number))
    {
        return std::nullopt;
    }
    return number;
}

// Rounds to whole pixels; negative or beyond int range is rejected
std::optional<int> ToPixels(double pixels)
{
    if (!std::isfinite(pixels) || pixels < 0.0 || pixels > static_cast<double>(std::numeric_limits<int>::max()))
    {
        return std::nullopt;
    }
    return static_cast<int>(std::lround(pixels));
}

// #rgb, #rrggbb or #rrggbbaa
std::optional<glm::vec4> ParseHexColor(const std::string& hex)
{
    std::string digits = hex.substr(1);
    if (!std::all_of(digits.begin(), digits.end(), [](unsigned char ch) { return std::isxdigit(ch) != 0; }))
    {
        return std::nullopt;
    }
    if (digits.size() == 3)
    {
        digits = {digits[0], digits[0], digits[1], digits[1], digits[2], digits[2]};
    }
    if (digits.size() != 6 && digits.size() != 8)
    {
        return std::nullopt;
    }

    glm::vec4 color(1.0F);
    for (std::size_t i = 0; i < digits.size() / 2; ++i)
    {
        const auto byte = std::strtoul(digits.substr(i * 2, 2).c_str(), nullptr, 16);
        color[static_cast<glm::length_t>(i)] = static_cast<float>(byte) / 255.0F;
    }
    return color;
}

// rgb(r, g, b) with 0..255 channels, rgba(r, g, b, a) with alpha 0..1. Channels are clamped.
std::optional<glm::vec4> ParseFunctionalColor(const std::string& str)
{
    const bool hasAlpha = str.compare(0, 5, "rgba(") == 0;
    const std::size_t open = hasAlpha ? 4 : 3;
    if ((!hasAlpha && str.compare(0, 4, "rgb(") != 0) || str.back() != ')')
    {
        return std::nullopt;
    }

    std::vector<float> channels;
    std::stringstream args(str.substr(open + 1, str.size() - open - 2));
    std::string arg;
    while (std::getline(args, arg, ','))
    {
        const auto number = ParseNumber(arg);
        if (!number)
        {
            return std::nullopt;
        }
        channels.push_back(static_cast<float>(*number));
    }
    if (channels.size() != (hasAlpha ? 4U : 3U))
    {
        return std::nullopt;
    }

    glm::vec4 color(1.0F);
    for (std::size_t i = 0; i < 3; ++i)
    {
        color[static_cast<glm::length_t>(i)] = std::clamp(channels[i] / 255.0F, 0.0F, 1.0F);
    }
    if (hasAlpha)
    {
        color.a = std::clamp(channels[3], 0.0F, 1.0F);
    }
    return color;
}

std::optional<glm::vec4> ParseNamedColor(const std::string& name)
{
    static const std::unordered_map<std::string, glm::vec4> kNamedColors = {
        {"transparent", glm::vec4(0.0F)},
        {"black", glm::vec4(0.0F, 0.0F, 0.0F, 1.0F)},
        {"white", glm::vec4(1.0F)},
        {"red", glm::vec4(1.0F, 0.0F, 0.0F, 1.0F)},
        {"green", glm::vec4(0.0F, 1.0F, 0.0F, 1.0F)},
        {"blue", glm::vec4(0.0F, 0.0F, 1.0F, 1.0F)},
        {"purple", glm::vec4(0.5F, 0.0F, 0.5F, 1.0F)},
        {"aqua", glm::vec4(0.0F, 1.0F, 1.0F, 1.0F)},
        {"yellow", glm::vec4(1.0F, 1.0F, 0.0F, 1.0F)},
        {"gray", glm::vec4(0.5F, 0.5F, 0.5F, 1.0F)},
    };

    const auto it = kNamedColors.find(name);
    if (it == kNamedColors.end())
    {
        return std::nullopt;
    }
    return it->second;
}

// Numbers are pixels; strings go through ParseLength
std::optional<int> ReadLength(const json& value, float dpi)
{
    if (value.is_number())
    {
        return ToPixels(value.get<double>());
    }
    if (value.is_string())
    {
        return ParseLength(value.get<std::string>(), dpi);
    }
    return std::nullopt;
}

void ReadLengthInto(const json& j, const char* key, float dpi, const std::string& nodeId, int& out)
{
    if (!j.contains(key))
    {
        return;
    }
    if (auto length = ReadLength(j[key], dpi))
    {
        out = *length;
        return;
    }
    std::cerr << "[LayoutSerialization] Node '" << nodeId << "': invalid length for '" << key << "'\n";
}

void ReadOptionalLengthInto(const json& j, const char* key, float dpi, const std::string& nodeId, std::optional<int>& out)
{
    if (!j.contains(key) || j[key].is_null())
    {
        return;
    }
    if (auto length = ReadLength(j[key], dpi))
    {
        out = *length;
        return;
    }
    std::cerr << "[LayoutSerialization] Node '" << nodeId << "': invalid length for '" << key << "'\n";
}

std::optional<SizingMode> ParseSizingMode(const json& value, float dpi)
{
    if (value.is_string())
    {
        const std::string mode = ToLower(Trim(value.get<std::string>()));
        if (mode == "fit")
        {
            return SizingMode::Fit();
        }
        if (mode == "grow")
        {
            return SizingMode::Grow();
        }
    }
    if (value.is_object() && value.contains("fixed"))
    {
        if (auto length = ReadLength(value["fixed"], dpi))
        {
            return SizingMode::Fixed(*length);
        }
        return std::nullopt;
    }
    if (auto length = ReadLength(value, dpi))
    {
        return SizingMode::Fixed(*length);
    }
    return std::nullopt;
}

json SizingModeToJson(const SizingMode& mode)
{
    switch (mode.kind)
    {
        case SizingMode::Kind::Fixed:
            return mode.value;
        case SizingMode::Kind::Grow:
            return "grow";
        case SizingMode::Kind::Fit:
        default:
            return "fit";
    }
}

LayoutMode ParseLayoutMode(const std::string& str)
{
    const std::string mode = ToLower(str);
    if (mode == "toptobottom" || mode == "top-to-bottom" || mode == "vertical")
    {
        return LayoutMode::TopToBottom;
    }
    return LayoutMode::LeftToRight;
}

std::string LayoutModeToString(LayoutMode mode)
{
    switch (mode)
    {
        case LayoutMode::TopToBottom:
            return "topToBottom";
        case LayoutMode::LeftToRight:
        default:
            return "leftToRight";
    }
}

// Node properties without children
LayoutNode ParseNodeProperties(const json& j, float dpi)
{
    LayoutNode node;
    node.id = j.value("id", std::string());
    node.kind = j.value("type", std::string("Container")) == "Leaf" ? NodeKind::Leaf : NodeKind::Container;

    // Parse layout
    if (j.contains("layout") && j["layout"].is_object())
    {
        const auto& layoutJson = j["layout"];
        if (layoutJson.contains("mode") && layoutJson["mode"].is_string())
        {
            node.layoutMode = ParseLayoutMode(layoutJson["mode"].get<std::string>());
        }
        ReadLengthInto(layoutJson, "padding", dpi, node.id, node.padding);
        ReadLengthInto(layoutJson, "childGap", dpi, node.id, node.childGap);
    }

    // Parse sizing
    if (j.contains("sizing") && j["sizing"].is_object())
    {
        const auto& sizingJson = j["sizing"];
        for (const char* key : {"width", "height"})
        {
            if (!sizingJson.contains(key))
            {
                continue;
            }
            if (auto mode = ParseSizingMode(sizingJson[key], dpi))
            {
                (key[0] == 'w' ? node.sizing.width : node.sizing.height) = *mode;
            }
            else
            {
                std::cerr << "[LayoutSerialization] Node '" << node.id << "': invalid sizing for '" << key << "'\n";
            }
        }
    }
    else if (j.contains("sizing") && j["sizing"].is_string())
    {
        // Shorthand for both axes
        if (auto mode = ParseSizingMode(j["sizing"], dpi))
        {
            node.sizing = Sizing{*mode, *mode};
        }
    }

    // Parse constraints
    ReadLengthInto(j, "minWidth", dpi, node.id, node.minWidth);
    ReadLengthInto(j, "minHeight", dpi, node.id, node.minHeight);
    ReadOptionalLengthInto(j, "maxWidth", dpi, node.id, node.maxWidth);
    ReadOptionalLengthInto(j, "maxHeight", dpi, node.id, node.maxHeight);

    // Parse color
    if (j.contains("color") && j["color"].is_string())
    {
        if (auto color = ParseColor(j["color"].get<std::string>()))
        {
            node.color = *color;
        }
        else
        {
            std::cerr << "[LayoutSerialization] Node '" << node.id << "': unknown color '" << j["color"].get<std::string>() << "'\n";
        }
    }

    return node;
}

bool ParseNode(const json& j, LayoutTree& tree, NodeId parent, float dpi)
{
    if (!j.is_object())
    {
        return false;
    }

    LayoutNode node = ParseNodeProperties(j, dpi);
    const bool isLeaf = node.IsLeaf();
    const std::string nodeId = node.id;

    const NodeId id = parent == layout::kInvalidNode ? tree.SetRoot(std::move(node)) : tree.AddChild(parent, std::move(node));
    if (id == layout::kInvalidNode)
    {
        return false;
    }

    // Parse children
    if (j.contains("children") && j["children"].is_array())
    {
        if (isLeaf)
        {
            if (!j["children"].empty())
            {
                std::cerr << "[LayoutSerialization] Leaf '" << nodeId << "' can't have children, skipping " << j["children"].size() << "\n";
            }
            return true;
        }
        for (const auto& childJson : j["children"])
        {
            if (!ParseNode(childJson, tree, id, dpi))
            {
                std::cerr << "[LayoutSerialization] Skipping malformed child of '" << nodeId << "'\n";
            }
        }
    }

    return true;
}

void SerializeNode(json& j, const LayoutTree& tree, NodeId id)
{
    const LayoutNode& node = tree[id];

    if (!node.id.empty())
    {
        j["id"] = node.id;
    }
    j["type"] = node.IsLeaf() ? "Leaf" : "Container";

    if (node.IsContainer())
    {
        json layoutJson;
        layoutJson["mode"] = LayoutModeToString(node.layoutMode);
        layoutJson["padding"] = node.padding;
        layoutJson["childGap"] = node.childGap;
        j["layout"] = layoutJson;

        json sizingJson;
        sizingJson["width"] = SizingModeToJson(node.sizing.width);
        sizingJson["height"] = SizingModeToJson(node.sizing.height);
        j["sizing"] = sizingJson;
    }

    if (node.minWidth != 0)
        j["minWidth"] = node.minWidth;
    if (node.minHeight != 0)
        j["minHeight"] = node.minHeight;
    if (node.maxWidth.has_value())
        j["maxWidth"] = *node.maxWidth;
    if (node.maxHeight.has_value())
        j["maxHeight"] = *node.maxHeight;

    j["color"] = ColorToHex(node.color);

    if (!node.children.empty())
    {
        json childrenJson = json::array();
        for (NodeId child : node.children)
        {
            json childJson;
            SerializeNode(childJson, tree, child);
            childrenJson.push_back(childJson);
        }
        j["children"] = childrenJson;
    }
}
} // namespace

std::optional<ScreenDefinition> LoadScreen(const std::string& filePath)
{
    std::ifstream file(filePath);
    if (!file.is_open())
    {
        std::cerr << "[LayoutSerialization] Failed to open " << filePath << "\n";
        return std::nullopt;
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    auto screen = ParseScreen(content);
    if (screen)
    {
        std::cout << "[LayoutSerialization] Loaded screen '" << screen->id << "' (" << screen->tree.Size() << " nodes) from " << filePath << "\n";
    }
    return screen;
}

std::optional<ScreenDefinition> ParseScreen(const std::string& jsonContent)
{
    try
    {
        json root = json::parse(jsonContent);

        if (!root.is_object() || !root.contains("asset_version"))
        {
            std::cerr << "[LayoutSerialization] Missing asset_version\n";
            return std::nullopt;
        }

        if (!root.contains("root"))
        {
            std::cerr << "[LayoutSerialization] Missing root node\n";
            return std::nullopt;
        }

        ScreenDefinition screen;
        screen.id = root.value("id", std::string());

        if (root.contains("dpi") && root["dpi"].is_number())
        {
            const float dpi = root["dpi"].get<float>();
            if (dpi > 0.0F)
            {
                screen.dpi = dpi;
            }
        }

        if (root.contains("viewport") && root["viewport"].is_array() && root["viewport"].size() >= 2)
        {
            const auto width = ReadLength(root["viewport"][0], screen.dpi);
            const auto height = ReadLength(root["viewport"][1], screen.dpi);
            if (width && height)
            {
                screen.viewport = glm::ivec2(*width, *height);
            }
        }

        if (root.contains("background") && root["background"].is_string())
        {
            if (auto color = ParseColor(root["background"].get<std::string>()))
            {
                screen.background = *color;
            }
        }

        if (!ParseNode(root["root"], screen.tree, layout::kInvalidNode, screen.dpi))
        {
            std::cerr << "[LayoutSerialization] Root node is not an object\n";
            return std::nullopt;
        }

        return screen;
    }
    catch (const std::exception& e)
    {
        std::cerr << "[LayoutSerialization] Parse error: " << e.what() << "\n";
        return std::nullopt;
    }
}

bool SaveScreen(const std::string& filePath, const ScreenDefinition& screen)
{
    std::string content = SerializeScreen(screen);
    if (content.empty())
    {
        return false;
    }

    std::ofstream file(filePath);
    if (!file.is_open())
    {
        std::cerr << "[LayoutSerialization] Failed to write " << filePath << "\n";
        return false;
    }

    file << content;
    if (!file)
    {
        std::cerr << "[LayoutSerialization] Write to " << filePath << " failed\n";
        return false;
    }
    std::cout << "[LayoutSerialization] Saved screen '" << screen.id << "' to " << filePath << "\n";
    return true;
}

std::string SerializeScreen(const ScreenDefinition& screen)
{
    if (screen.tree.Empty())
    {
        return "";
    }

    try
    {
        json root;
        root["asset_version"] = kAssetVersion;
        if (!screen.id.empty())
        {
            root["id"] = screen.id;
        }
        root["dpi"] = screen.dpi;
        if (screen.viewport.has_value())
        {
            root["viewport"] = json::array({screen.viewport->x, screen.viewport->y});
        }
        root["background"] = ColorToHex(screen.background);

        json rootJson;
        SerializeNode(rootJson, screen.tree, screen.tree.Root());
        root["root"] = rootJson;

        return root.dump(2);
    }
    catch (const std::exception& e)
    {
        std::cerr << "[LayoutSerialization] Serialize error: " << e.what() << "\n";
        return "";
    }
}

bool ApplyScreen(layout::UiRoot& root, ScreenDefinition screen)
{
    if (screen.tree.Empty())
    {
        return false;
    }
    if (screen.viewport.has_value())
    {
        root.SetViewportSize(screen.viewport->x, screen.viewport->y);
    }
    root.SetBackgroundColor(screen.background);
    root.SetTree(std::move(screen.tree));
    return true;
}

bool HasFileChanged(const std::string& filePath, long long& lastModTime)
{
    std::error_code ec;
    const auto ftime = std::filesystem::last_write_time(filePath, ec);
    if (ec)
    {
        return false;
    }

    const auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(ftime.time_since_epoch()).count();
    // file_clock's epoch is implementation-defined and may put current times below zero
    if (timestamp != lastModTime)
    {
        lastModTime = static_cast<long long>(timestamp);
        return true;
    }
    return false;
}

std::optional<glm::vec4> ParseColor(const std::string& value)
{
    const std::string v = ToLower(Trim(value));
    if (v.empty())
    {
        return std::nullopt;
    }
    if (v[0] == '#')
    {
        return ParseHexColor(v);
    }
    if (v.compare(0, 3, "rgb") == 0)
    {
        return ParseFunctionalColor(v);
    }
    return ParseNamedColor(v);
}

std::string ColorToHex(const glm::vec4& color)
{
    const auto channel = [](float value) {
        return static_cast<int>(std::lround(std::clamp(value, 0.0F, 1.0F) * 255.0F));
    };
    char buf[32];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x", channel(color.r), channel(color.g), channel(color.b), channel(color.a));
    return buf;
}

std::optional<int> ParseLength(const std::string& value, float dpi)
{
    std::string v = ToLower(Trim(value));
    if (v.empty())
    {
        return std::nullopt;
    }

    double pixelsPerUnit = 1.0;
    if (EndsWith(v, "px"))
    {
        v.resize(v.size() - 2);
    }
    else if (EndsWith(v, "mm"))
    {
        v.resize(v.size() - 2);
        pixelsPerUnit = static_cast<double>(dpi) / kMillimetersPerInch;
    }
    else if (EndsWith(v, "in"))
    {
        v.resize(v.size() - 2);
        pixelsPerUnit = dpi;
    }
    const auto amount = ParseNumber(v);
    if (!amount)
    {
        return std::nullopt;
    }
    return ToPixels(*amount * pixelsPerUnit);
}
} // namespace teacup::io
