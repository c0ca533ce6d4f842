#pragma once
// MCP Script Tools: script_read, script_write

#include "../types.hpp"

namespace conduit::mcp::tools::scripts {

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "script_read",
        "Read script file content from the host project",
        "file",
        object_schema({
            {"path", {{"type", "string"}, {"description", "Script file path to read (relative to Assets directory)"}}}
        }, {"path"})
    });

    tools.push_back({
        "script_write",
        "Create or update script file in the host project",
        "file",
        object_schema({
            {"path", {{"type", "string"}, {"description", "Script file path (relative to Assets directory)"}}},
            {"content", {{"type", "string"}, {"description", "Script file content"}}},
            {"overwrite", {{"type", "boolean"}, {"default", true},
                           {"description", "Whether to overwrite existing file"}}}
        }, {"path", "content"})
    });
}

} // namespace conduit::mcp::tools::scripts
