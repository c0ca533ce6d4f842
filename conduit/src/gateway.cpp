#include <conduit/gateway.hpp>
#include <conduit/log.hpp>
#include <conduit/mcp/tools/assets.hpp>
#include <conduit/mcp/tools/editor.hpp>
#include <conduit/mcp/tools/scene.hpp>
#include <conduit/mcp/tools/scripts.hpp>
#include <conduit/mcp/tools/ui.hpp>
#include <conduit/version.hpp>
#include <chrono>
#include <map>
#include <sstream>
#include <thread>

namespace conduit {

// ═══════════════════════════════════════════════════════════════════════════
// ToolCatalog
// ═══════════════════════════════════════════════════════════════════════════

ToolCatalog::ToolCatalog() {
    mcp::tools::scripts::register_schemas(tools_);
    mcp::tools::scene::register_schemas(tools_);
    mcp::tools::ui::register_schemas(tools_);
    mcp::tools::assets::register_schemas(tools_);
    mcp::tools::editor::register_schemas(tools_);
}

const mcp::ToolSchema* ToolCatalog::find(const std::string& name) const {
    for (const auto& tool : tools_) {
        if (tool.name == name) return &tool;
    }
    return nullptr;
}

json ToolCatalog::to_json() const {
    json tools = json::array();
    for (const auto& tool : tools_) {
        tools.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"category", tool.category}
        });
    }
    return tools;
}

std::string ToolCatalog::to_markdown() const {
    // Keep first-seen category order
    std::vector<std::string> order;
    std::map<std::string, std::vector<const mcp::ToolSchema*>> groups;
    for (const auto& tool : tools_) {
        auto& group = groups[tool.category];
        if (group.empty()) order.push_back(tool.category);
        group.push_back(&tool);
    }

    std::ostringstream ss;
    ss << "# Host Tools\n\n";
    ss << tools_.size() << " tools in " << order.size() << " categories.\n";
    for (const auto& category : order) {
        ss << "\n## " << category << "\n\n";
        ss << "| Tool | Description | Required |\n";
        ss << "|---|---|---|\n";
        for (const auto* tool : groups[category]) {
            std::string required;
            for (const auto& r : tool->input_schema.value("required", json::array())) {
                if (!required.empty()) required += ", ";
                required += r.get<std::string>();
            }
            ss << "| `" << tool->name << "` | " << tool->description << " | "
               << (required.empty() ? "-" : required) << " |\n";
        }
    }
    return ss.str();
}

// ═══════════════════════════════════════════════════════════════════════════
// Gateway
// ═══════════════════════════════════════════════════════════════════════════

Gateway::Gateway(BridgeClient& client, RetryPolicy policy, bool debug_mode)
    : client_(client), policy_(policy), debug_mode_(debug_mode) {}

ToolCallResult Gateway::call_tool(const std::string& name, const json& arguments) {
    auto start = std::chrono::steady_clock::now();
    Request request = make_request(name, arguments.is_object() ? arguments : json::object());
    log::info("gateway", "Tool call %s (id=%s)", name.c_str(), request.id.c_str());
    log::debug("gateway", "Arguments: %s", request.params.dump().c_str());

    int max_attempts = policy_.max_attempts < 1 ? 1 : policy_.max_attempts;
    std::optional<Response> response;
    std::string last_error;
    int attempts = 0;

    while (attempts < max_attempts) {
        ++attempts;
        try {
            response = client_.send_message(request);
            break;
        } catch (const BridgeError& e) {
            last_error = e.what();
            log::error("gateway", "Attempt %d/%d for %s failed [%s]: %s",
                       attempts, max_attempts, name.c_str(), to_string(e.kind()), e.what());

            if (!policy_.retry_all_errors && !is_retryable(e.kind())) {
                log::debug("gateway", "%s errors are not retried", to_string(e.kind()));
                break;
            }
            if (attempts < max_attempts) {
                std::this_thread::sleep_for(std::chrono::milliseconds(policy_.backoff_ms));
            }
        }
    }

    auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    ToolCallResult result;
    result.attempts = attempts;

    if (!response) {
        log::error("gateway", "Tool %s gave up after %d attempts (%lldms)",
                   name.c_str(), attempts, static_cast<long long>(elapsed_ms));
        result.is_error = true;
        result.text = "Host communication failed after " + std::to_string(attempts) +
                      " attempts: " + last_error;
        return result;
    }

    if (response->id != request.id) {
        log::warn("gateway", "Response id %s does not match request id %s",
                  response->id.empty() ? "(null)" : response->id.c_str(), request.id.c_str());
    }

    if (response->success) {
        result.data = response->data.is_null() ? json::object() : response->data;
        result.text = "Tool " + name + " executed successfully:\n" + result.data.dump(2);
        log::info("gateway", "Tool %s succeeded (%lldms)", name.c_str(), static_cast<long long>(elapsed_ms));
    } else {
        std::string error = response->error.empty() ? "unknown error" : response->error;
        result.is_error = true;
        result.text = "Host tool execution failed: " + error;
        log::error("gateway", "Tool %s failed (%lldms): %s",
                   name.c_str(), static_cast<long long>(elapsed_ms), error.c_str());
    }
    return result;
}

std::string Gateway::handle(const std::string& request_str) {
    json request;
    try {
        request = json::parse(request_str);
    } catch (const json::parse_error& e) {
        return mcp::make_error(json(), mcp::error::PARSE_ERROR,
                               std::string("JSON parse error: ") + e.what()).dump();
    }

    auto response = handle_rpc(request);
    return response ? response->dump() : std::string();
}

std::optional<json> Gateway::handle_rpc(const json& request) {
    std::string error_msg;
    if (!mcp::validate_request(request, error_msg)) {
        json id = request.is_object() ? request.value("id", json()) : json();
        return mcp::make_error(id, mcp::error::INVALID_REQUEST, error_msg);
    }

    auto info = mcp::parse_request(request);
    log::debug("gateway", "JSON-RPC %s", info.method.c_str());

    try {
        if (info.method == "initialize") {
            return handle_initialize(info.params, info.id);
        } else if (info.method == "notifications/initialized") {
            log::info("gateway", "Client initialized");
            return std::nullopt;
        } else if (info.method == "ping") {
            return mcp::make_result(info.id, json::object());
        } else if (info.method == "tools/list") {
            return handle_tools_list(info.params, info.id);
        } else if (info.method == "tools/call") {
            return handle_tools_call(info.params, info.id);
        }
    } catch (const std::exception& e) {
        return mcp::make_error(info.id, mcp::error::INTERNAL_ERROR,
                               std::string("Internal error: ") + e.what());
    }

    if (info.notification) return std::nullopt;
    return mcp::make_error(info.id, mcp::error::METHOD_NOT_FOUND,
                           "Unknown method: " + info.method);
}

json Gateway::handle_initialize(const json& params, const json& id) {
    std::string client = params.contains("clientInfo")
        ? params["clientInfo"].value("name", "unknown") : "unknown";
    log::info("gateway", "Initialize from %s", client.c_str());

    return mcp::make_result(id, {
        {"protocolVersion", mcp::PROTOCOL_VERSION},
        {"serverInfo", {
            {"name", mcp::SERVER_NAME},
            {"version", CONDUIT_VERSION}
        }},
        {"capabilities", {{"tools", json::object()}}}
    });
}

json Gateway::handle_tools_list(const json&, const json& id) {
    json tools_array = json::array();
    for (const auto& tool : catalog_.tools()) {
        tools_array.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.input_schema}
        });
    }
    return mcp::make_result(id, {{"tools", tools_array}});
}

json Gateway::handle_tools_call(const json& params, const json& id) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return mcp::make_error(id, mcp::error::INVALID_PARAMS, "Missing tool name");
    }

    std::string name = params["name"];
    if (!catalog_.find(name)) {
        return mcp::make_error(id, mcp::error::TOOL_NOT_FOUND, "Unknown tool: " + name);
    }

    json arguments = params.value("arguments", json::object());
    if (!arguments.is_object()) {
        return mcp::make_error(id, mcp::error::INVALID_PARAMS, "arguments must be an object");
    }

    ToolCallResult result = call_tool(name, arguments);
    return mcp::make_result(id, mcp::make_tool_response(result.text, result.is_error, result.data));
}

json Gateway::health() {
    bool connected = client_.is_connected();
    log::debug("gateway", "Health check: hostConnected=%s", connected ? "true" : "false");

    auto now = std::chrono::system_clock::now().time_since_epoch();
    return {
        {"status", "healthy"},
        {"timestamp", std::chrono::duration_cast<std::chrono::seconds>(now).count()},
        {"hostAddress", client_.config().host},
        {"hostPort", client_.config().port},
        {"hostConnected", connected},
        {"toolCount", catalog_.size()},
        {"debugMode", debug_mode_},
        {"version", CONDUIT_VERSION}
    };
}

} // namespace conduit
