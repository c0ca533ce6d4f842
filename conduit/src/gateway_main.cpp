// conduit_gateway: MCP front end of the bridge
//
// Speaks MCP over SSE to the agent, forwards every tool call to the
// automation host over the framed socket protocol.
//
// Usage:
//   conduit_gateway [options]
//
// Options:
//   --port N              MCP SSE port; /health and /tools on N+1
//   --host-address HOST   Automation host address (default: localhost)
//   --host-port N         Automation host bridge port (default: 12000)
//   --debug               Debug logging
//   --retry-all           Retry every failure kind
//   --log PATH            Append output to PATH
//   --config FILE         JSON settings file
//   --export-tools        Print the tool catalog as Markdown and exit

#include <conduit/bridge_client.hpp>
#include <conduit/config.hpp>
#include <conduit/gateway.hpp>
#include <conduit/http_gateway.hpp>
#include <conduit/log.hpp>
#include <conduit/version.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

// Global flag for shutdown
static std::atomic<bool> gateway_running{true};

void gateway_signal_handler(int sig) {
    (void)sig;
    gateway_running = false;
}

int main(int argc, char* argv[]) {
    conduit::GatewayConfig config;
    auto outcome = conduit::load_gateway_config(argc, argv, config);
    if (outcome.help) {
        conduit::print_gateway_usage(argv[0]);
        return 0;
    }
    if (!outcome.ok) {
        std::cerr << "[conduit_gateway] " << outcome.error << "\n";
        conduit::print_gateway_usage(argv[0]);
        return 1;
    }

    if (config.export_tools) {
        std::cout << conduit::ToolCatalog().to_markdown();
        return 0;
    }

    if (!config.log_file.empty() && !conduit::log::redirect_to_file(config.log_file)) {
        std::cerr << "[conduit_gateway] Cannot open log file " << config.log_file << "\n";
        return 1;
    }
    conduit::log::set_verbose(config.debug);

    std::signal(SIGTERM, gateway_signal_handler);
    std::signal(SIGINT, gateway_signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    conduit::ClientConfig client_config;
    client_config.host = config.host_address;
    client_config.port = config.host_port;
    conduit::BridgeClient client(client_config);

    conduit::RetryPolicy policy;
    policy.retry_all_errors = config.retry_all_errors;
    conduit::Gateway gateway(client, policy, config.debug);

    conduit::log::info("gateway", "conduit_gateway v%s: host %s, %zu tools, debug=%s",
                       CONDUIT_VERSION, client.endpoint().c_str(), gateway.catalog().size(),
                       config.debug ? "on" : "off");

    // The host may start later; calls dial on demand
    if (client.test_connection()) {
        conduit::log::info("gateway", "Host reachable at %s", client.endpoint().c_str());
    } else {
        conduit::log::warn("gateway", "Host not reachable at %s yet", client.endpoint().c_str());
    }

    conduit::HttpConfig http_config;
    http_config.port = config.port;
    conduit::HttpGateway http(gateway, http_config);
    if (!http.start()) {
        return 1;
    }

    while (gateway_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    conduit::log::info("gateway", "Shutting down");
    http.stop();
    client.close();
    return 0;
}
