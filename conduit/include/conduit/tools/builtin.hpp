#pragma once
// Built-in host tools: ping, host_status
//
// Automation tools (scene, asset, prefab...) are registered by the embedding
// host; these two exist so a bare host can answer liveness probes.

#include <conduit/dispatcher.hpp>
#include <conduit/version.hpp>
#include <functional>

namespace conduit::tools::builtin {

inline void register_tools(ToolRegistry& registry,
                           std::function<size_t()> connection_count = {}) {
    registry.register_tool(ToolEntry{
        "ping",
        "Connectivity check, answers pong",
        "system",
        [](const json&) { return std::string(); },
        [](const json&, const ToolContext&) {
            return Response::ok({{"message", "pong"}, {"timestamp", now_ms()}});
        }
    });

    // Captures the registry by reference: it outlives the server
    registry.register_tool(ToolEntry{
        "host_status",
        "Report registered tools and live bridge connections",
        "system",
        [](const json&) { return std::string(); },
        [&registry, connection_count](const json&, const ToolContext& ctx) {
            json tools = json::array();
            for (const auto& [name, description] : registry.descriptions()) {
                tools.push_back({{"name", name}, {"description", description}});
            }
            return Response::ok({
                {"version", CONDUIT_VERSION},
                {"toolCount", registry.size()},
                {"tools", tools},
                {"connections", connection_count ? connection_count() : 0},
                {"connectionId", ctx.connection_id}
            });
        }
    });
}

} // namespace conduit::tools::builtin
