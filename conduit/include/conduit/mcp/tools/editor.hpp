#pragma once
// MCP Editor Tools: editor_get_logs

#include "../types.hpp"

namespace conduit::mcp::tools::editor {

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "editor_get_logs",
        "Read the host editor console logs",
        "editor",
        object_schema({
            {"maxLogs", {{"type", "number"}, {"description", "Maximum number of logs to retrieve"}}},
            {"logLevel", {{"type", "string"},
                          {"enum", {"all", "error", "warning", "log", "exception"}},
                          {"default", "all"}}},
            {"clearLogs", {{"type", "boolean"}, {"default", false}}},
            {"includeStackTrace", {{"type", "boolean"}, {"default", false}}}
        })
    });
}

} // namespace conduit::mcp::tools::editor
