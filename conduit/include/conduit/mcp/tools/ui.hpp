#pragma once
// MCP UI Tools: RectTransform, Image, Text

#include "../types.hpp"

namespace conduit::mcp::tools::ui {

namespace detail {

inline json vector2(const char* description) {
    return {
        {"type", "object"},
        {"description", description},
        {"properties", {{"x", {{"type", "number"}}}, {"y", {{"type", "number"}}}}}
    };
}

inline json color() {
    return {
        {"type", "object"},
        {"description", "RGBA color, components in [0, 1]"},
        {"properties", {
            {"r", {{"type", "number"}}}, {"g", {{"type", "number"}}},
            {"b", {{"type", "number"}}}, {"a", {{"type", "number"}}}
        }}
    };
}

} // namespace detail

inline void register_schemas(std::vector<ToolSchema>& tools) {
    const json instance_id = {{"type", "number"}, {"description", "GameObject's InstanceID"}};

    tools.push_back({
        "ui_rect_transform_set",
        "Set UI element RectTransform properties (position, size, anchors)",
        "ui",
        object_schema({
            {"instanceId", instance_id},
            {"anchoredPosition", detail::vector2("Anchored position")},
            {"sizeDelta", detail::vector2("Size delta")},
            {"anchorMin", detail::vector2("Lower-left anchor")},
            {"anchorMax", detail::vector2("Upper-right anchor")},
            {"pivot", detail::vector2("Pivot")}
        }, {"instanceId"})
    });

    tools.push_back({
        "ui_rect_transform_get",
        "Get UI element RectTransform information",
        "ui",
        object_schema({
            {"instanceId", instance_id},
            {"includeWorldSpace", {{"type", "boolean"}, {"default", true},
                                   {"description", "Whether to include world space information"}}}
        }, {"instanceId"})
    });

    tools.push_back({
        "ui_image_set",
        "Set UI Image component properties (sprite, color, material)",
        "ui",
        object_schema({
            {"instanceId", instance_id},
            {"spritePath", {{"type", "string"}, {"description", "Sprite asset path"}}},
            {"color", detail::color()},
            {"material", {{"type", "string"}, {"description", "Material asset path"}}},
            {"imageType", {{"type", "string"}}},
            {"preserveAspect", {{"type", "boolean"}}},
            {"fillAmount", {{"type", "number"}, {"minimum", 0}, {"maximum", 1}}}
        }, {"instanceId"})
    });

    tools.push_back({
        "ui_text_set",
        "Set UI Text component properties (text content, font, color)",
        "ui",
        object_schema({
            {"instanceId", instance_id},
            {"text", {{"type", "string"}}},
            {"fontPath", {{"type", "string"}, {"description", "Font asset path"}}},
            {"fontSize", {{"type", "number"}}},
            {"fontStyle", {{"type", "string"}}},
            {"color", detail::color()},
            {"alignment", {{"type", "string"}}},
            {"richText", {{"type", "boolean"}}}
        }, {"instanceId"})
    });
}

} // namespace conduit::mcp::tools::ui
