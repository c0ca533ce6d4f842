#pragma once
// Configuration for conduit_host and conduit_gateway
//
// Later sources override earlier ones:
//   defaults -> settings file (--config FILE) -> environment -> flags
//
// One settings file can serve both processes:
//   {"host": {"port": 12000, "tickMs": 16, "executionTimeoutMs": 0,
//             "verbose": false, "logFile": ""},
//    "gateway": {"port": 13000, "hostAddress": "localhost", "hostPort": 12000,
//                "debug": false, "retryAllErrors": false, "logFile": ""}}
//
// Environment: CONDUIT_HOST_PORT, CONDUIT_GATEWAY_PORT,
//              CONDUIT_HOST_ADDRESS, CONDUIT_DEBUG

#include <cstdint>
#include <string>

namespace conduit {

struct HostConfig {
    uint16_t port = 12000;
    int tick_ms = 16;
    int execution_timeout_ms = 0;
    bool verbose = false;
    std::string log_file;
};

struct GatewayConfig {
    uint16_t port = 13000;               // SSE; management is port + 1
    std::string host_address = "localhost";
    uint16_t host_port = 12000;
    bool debug = false;
    bool retry_all_errors = false;
    std::string log_file;
    bool export_tools = false;
};

// Result of reading the command line
struct CliOutcome {
    bool ok = true;
    bool help = false;
    std::string error;
};

// Port in [1, 65535]
bool parse_port(const std::string& text, uint16_t& port);

// Settings file section for each process. Missing file or section is an error.
bool apply_settings_file(const std::string& path, HostConfig& config, std::string& error);
bool apply_settings_file(const std::string& path, GatewayConfig& config, std::string& error);

bool apply_environment(HostConfig& config, std::string& error);
bool apply_environment(GatewayConfig& config, std::string& error);

CliOutcome load_host_config(int argc, char* argv[], HostConfig& config);
CliOutcome load_gateway_config(int argc, char* argv[], GatewayConfig& config);

void print_host_usage(const char* prog);
void print_gateway_usage(const char* prog);

} // namespace conduit
