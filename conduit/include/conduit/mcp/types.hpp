#pragma once
// MCP Types: tool schema
//
// ToolSchema is the gateway's static view of a host tool; the host's own
// registry (dispatcher.hpp) is the authority on what actually runs.

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace conduit::mcp {

using json = nlohmann::json;

// Tool schema definition for MCP tools/list and GET /tools
struct ToolSchema {
    std::string name;
    std::string description;
    std::string category;
    json input_schema;
};

// Shorthand for the object schema every host tool takes
inline json object_schema(json properties, json required = json::array()) {
    return {
        {"type", "object"},
        {"properties", std::move(properties)},
        {"required", std::move(required)}
    };
}

} // namespace conduit::mcp
