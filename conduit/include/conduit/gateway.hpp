#pragma once
// Gateway: MCP tool calls in, bridge round trips out
//
// Every tools/call becomes one request envelope sent through the
// BridgeClient with bounded retries. By default only connection-level
// failures (transport, framing) are retried; message-level failures
// fail fast. RetryPolicy::retry_all_errors restores retry-on-anything.
//
// The catalog is static metadata for MCP clients. Whether a tool really
// exists is decided by the host's registry at call time.

#include <conduit/bridge_client.hpp>
#include <conduit/mcp/protocol.hpp>
#include <conduit/mcp/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace conduit {

class ToolCatalog {
public:
    ToolCatalog();

    const std::vector<mcp::ToolSchema>& tools() const { return tools_; }
    const mcp::ToolSchema* find(const std::string& name) const;
    size_t size() const { return tools_.size(); }

    // [{name, description, category}] for GET /tools
    json to_json() const;

    // Catalog grouped by category, one table per group
    std::string to_markdown() const;

private:
    std::vector<mcp::ToolSchema> tools_;
};

struct RetryPolicy {
    int max_attempts = 3;
    int backoff_ms = 1000;
    bool retry_all_errors = false;
};

struct ToolCallResult {
    bool is_error = false;
    std::string text;
    json data;          // host data on success
    int attempts = 0;   // round trips made
};

class Gateway {
public:
    Gateway(BridgeClient& client, RetryPolicy policy = {}, bool debug_mode = false);

    ToolCallResult call_tool(const std::string& name, const json& arguments);

    // One JSON-RPC request. Returns nullopt for notifications.
    std::optional<json> handle_rpc(const json& request);

    // Parse + handle_rpc. Returns "" when there is nothing to send back.
    std::string handle(const std::string& request_str);

    json health();
    json tools_json() const { return catalog_.to_json(); }
    std::string export_markdown() const { return catalog_.to_markdown(); }

    const ToolCatalog& catalog() const { return catalog_; }
    const RetryPolicy& retry_policy() const { return policy_; }

private:
    BridgeClient& client_;
    ToolCatalog catalog_;
    RetryPolicy policy_;
    bool debug_mode_;

    json handle_initialize(const json& params, const json& id);
    json handle_tools_list(const json& params, const json& id);
    json handle_tools_call(const json& params, const json& id);
};

} // namespace conduit
