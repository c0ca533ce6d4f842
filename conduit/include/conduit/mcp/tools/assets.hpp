#pragma once
// MCP Asset Tools: asset queries, project layout, prefabs

#include "../types.hpp"

namespace conduit::mcp::tools::assets {

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "asset_find",
        "Find project assets by conditions (path, type, name)",
        "asset",
        object_schema({
            {"path", {{"type", "string"}, {"default", "Assets"}, {"description", "Search path relative to Assets directory"}}},
            {"type", {{"type", "string"}, {"description", "Asset type name (Texture2D, AudioClip, etc.)"}}},
            {"name", {{"type", "string"}, {"description", "Asset name (supports wildcards)"}}},
            {"extension", {{"type", "string"}, {"description", "File extension"}}},
            {"recursive", {{"type", "boolean"}, {"default", true}}},
            {"maxResults", {{"type", "number"}, {"description", "Maximum number of results"}}}
        })
    });

    tools.push_back({
        "asset_get_info",
        "Get detailed asset information (metadata, import settings)",
        "asset",
        object_schema({
            {"assetPath", {{"type", "string"}, {"description", "Asset path"}}},
            {"includeMetadata", {{"type", "boolean"}, {"default", true}}},
            {"includeImportSettings", {{"type", "boolean"}, {"default", false}}}
        }, {"assetPath"})
    });

    tools.push_back({
        "asset_get_dependencies",
        "Get asset dependency relationships",
        "asset",
        object_schema({
            {"assetPath", {{"type", "string"}, {"description", "Asset path"}}},
            {"recursive", {{"type", "boolean"}, {"default", false}}},
            {"includeImplicit", {{"type", "boolean"}, {"default", true}}}
        }, {"assetPath"})
    });

    tools.push_back({
        "project_get_structure",
        "Get project directory structure and statistics",
        "project",
        object_schema({
            {"rootPath", {{"type", "string"}, {"default", "Assets"}, {"description", "Root directory path"}}},
            {"maxDepth", {{"type", "number"}, {"description", "Maximum directory depth"}}},
            {"includeFiles", {{"type", "boolean"}, {"default", true}}}
        })
    });

    tools.push_back({
        "prefab_create",
        "Create prefab from scene GameObject",
        "prefab",
        object_schema({
            {"instanceId", {{"type", "number"}, {"description", "GameObject's InstanceID"}}},
            {"prefabPath", {{"type", "string"}, {"description", "Prefab save path"}}},
            {"overwrite", {{"type", "boolean"}, {"default", false}}}
        }, {"instanceId", "prefabPath"})
    });

    tools.push_back({
        "prefab_get_info",
        "Get detailed prefab information",
        "prefab",
        object_schema({
            {"prefabPath", {{"type", "string"}, {"description", "Prefab asset path"}}},
            {"instanceId", {{"type", "number"}, {"description", "Prefab instance ID"}}},
            {"includeInstances", {{"type", "boolean"}, {"default", false}}},
            {"includeVariants", {{"type", "boolean"}, {"default", false}}}
        })
    });

    tools.push_back({
        "prefab_modify",
        "Manage prefab instance modifications",
        "prefab",
        object_schema({
            {"instanceId", {{"type", "number"}, {"description", "Prefab instance ID"}}},
            {"operation", {{"type", "string"},
                           {"enum", {"apply", "revert", "unpack", "disconnect", "check_overrides"}}}}
        }, {"instanceId", "operation"})
    });
}

} // namespace conduit::mcp::tools::assets
