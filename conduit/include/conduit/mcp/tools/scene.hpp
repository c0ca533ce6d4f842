#pragma once
// MCP Scene Tools: hierarchy, object lifecycle, transforms, scene files
//
// instanceId is the host's integer handle for a scene object; it is only
// valid while the scene that owns the object stays loaded.

#include "../types.hpp"

namespace conduit::mcp::tools::scene {

namespace detail {

inline json instance_id() {
    return {{"type", "number"}, {"description", "GameObject's InstanceID"}};
}

inline json vector3(const char* description) {
    return {
        {"type", "object"},
        {"description", description},
        {"properties", {
            {"x", {{"type", "number"}}},
            {"y", {{"type", "number"}}},
            {"z", {{"type", "number"}}}
        }}
    };
}

} // namespace detail

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "scene_get",
        "Get the current scene hierarchy",
        "scene",
        object_schema({
            {"includeComponents", {{"type", "boolean"}, {"default", false},
                                   {"description", "Whether to include component information"}}},
            {"includeTransform", {{"type", "boolean"}, {"default", true},
                                  {"description", "Whether to include Transform information"}}}
        })
    });

    tools.push_back({
        "scene_create_object",
        "Create new GameObject in the scene",
        "scene",
        object_schema({
            {"name", {{"type", "string"}, {"default", "New GameObject"}, {"description", "GameObject name"}}},
            {"parentId", {{"type", "number"}, {"description", "Parent object's InstanceID"}}}
        })
    });

    tools.push_back({
        "scene_object_add_component",
        "Add component to GameObject in the scene",
        "scene",
        object_schema({
            {"instanceId", detail::instance_id()},
            {"componentType", {{"type", "string"}, {"description", "Component type name to add"}}}
        }, {"instanceId", "componentType"})
    });

    tools.push_back({
        "scene_transform_get",
        "Get Transform information of GameObject in the scene",
        "transform",
        object_schema({
            {"instanceId", detail::instance_id()},
            {"worldSpace", {{"type", "boolean"}, {"default", true},
                            {"description", "Whether to use world coordinate system"}}}
        }, {"instanceId"})
    });

    tools.push_back({
        "scene_transform_set",
        "Set Transform information of GameObject in the scene",
        "transform",
        object_schema({
            {"instanceId", detail::instance_id()},
            {"position", detail::vector3("Position")},
            {"rotation", detail::vector3("Euler angles in degrees")},
            {"scale", detail::vector3("Scale")},
            {"worldSpace", {{"type", "boolean"}, {"default", true},
                            {"description", "Whether position and rotation are world space"}}}
        }, {"instanceId"})
    });

    tools.push_back({
        "scene_save",
        "Save current or specified scene",
        "scene",
        object_schema({
            {"scenePath", {{"type", "string"}, {"description", "Scene file path to save"}}},
            {"saveAsNew", {{"type", "boolean"}, {"default", false}, {"description", "Whether to save as new file"}}},
            {"saveAll", {{"type", "boolean"}, {"default", false}, {"description", "Whether to save all open scenes"}}}
        })
    });

    tools.push_back({
        "scene_load",
        "Load specified scene file",
        "scene",
        object_schema({
            {"scenePath", {{"type", "string"}, {"description", "Scene file path to load"}}},
            {"loadMode", {{"type", "string"}, {"enum", {"single", "additive"}}, {"default", "single"}}},
            {"saveCurrentScene", {{"type", "boolean"}, {"default", true},
                                  {"description", "Whether to save current scene before loading"}}}
        }, {"scenePath"})
    });

    tools.push_back({
        "scene_get_info",
        "Get detailed scene information",
        "scene",
        object_schema({
            {"scenePath", {{"type", "string"}, {"description", "Scene file path"}}},
            {"includeObjects", {{"type", "boolean"}, {"default", false}}},
            {"includeComponents", {{"type", "boolean"}, {"default", false}}},
            {"analyzePerformance", {{"type", "boolean"}, {"default", false}}}
        })
    });

    tools.push_back({
        "scene_find_objects",
        "Find GameObjects in scene by criteria",
        "scene",
        object_schema({
            {"name", {{"type", "string"}, {"description", "Object name to search for"}}},
            {"tag", {{"type", "string"}, {"description", "Object tag to filter by"}}},
            {"componentType", {{"type", "string"}, {"description", "Component type to filter by"}}},
            {"layer", {{"type", "string"}, {"description", "Layer name or number to filter by"}}},
            {"activeOnly", {{"type", "boolean"}, {"default", false}}},
            {"exactMatch", {{"type", "boolean"}, {"default", false}}},
            {"maxResults", {{"type", "number"}, {"description", "Maximum number of results"}}},
            {"scenePath", {{"type", "string"}, {"description", "Scene path to search in"}}}
        })
    });

    tools.push_back({
        "scene_delete_object",
        "Delete GameObject from scene",
        "scene",
        object_schema({
            {"instanceId", detail::instance_id()},
            {"deleteChildren", {{"type", "boolean"}, {"default", true}, {"description", "Whether to delete children"}}}
        }, {"instanceId"})
    });
}

} // namespace conduit::mcp::tools::scene
