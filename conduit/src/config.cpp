#include <conduit/config.hpp>
#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace conduit {

using json = nlohmann::json;

namespace {

bool parse_int(const std::string& text, int min, int& out) {
    if (text.empty()) return false;
    char* end = nullptr;
    errno = 0;
    long value = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || value < min || value > 86400000) return false;
    out = static_cast<int>(value);
    return true;
}

bool parse_bool(const std::string& text) {
    return text == "1" || text == "true" || text == "yes" || text == "on";
}

// Section of a settings file; throws json/ios errors to the caller
json read_section(const std::string& path, const char* section) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("cannot open " + path);
    }
    json doc = json::parse(in);
    if (!doc.is_object() || !doc.contains(section) || !doc[section].is_object()) {
        throw std::runtime_error(path + " has no \"" + section + "\" object");
    }
    return doc[section];
}

// Integer setting in [min, max]; floats, strings and out-of-range values are rejected
bool int_from_json(const json& j, const char* key, int64_t min, int64_t max,
                   int64_t& out, std::string& error) {
    const json& v = j[key];
    bool in_range = false;
    if (v.is_number_unsigned()) {
        uint64_t u = v.get<uint64_t>();
        in_range = u <= static_cast<uint64_t>(max) && static_cast<int64_t>(u) >= min;
        if (in_range) out = static_cast<int64_t>(u);
    } else if (v.is_number_integer()) {
        int64_t i = v.get<int64_t>();
        in_range = i >= min && i <= max;
        if (in_range) out = i;
    }
    if (!in_range) {
        error = std::string("invalid ") + key + " in settings: " + v.dump();
    }
    return in_range;
}

bool port_from_json(const json& j, const char* key, uint16_t& port, std::string& error) {
    if (!j.contains(key)) return true;
    int64_t value = 0;
    if (!int_from_json(j, key, 1, 65535, value, error)) return false;
    port = static_cast<uint16_t>(value);
    return true;
}

bool ms_from_json(const json& j, const char* key, int min, int& ms, std::string& error) {
    if (!j.contains(key)) return true;
    int64_t value = 0;
    if (!int_from_json(j, key, min, 86400000, value, error)) return false;
    ms = static_cast<int>(value);
    return true;
}

// Locate --config before the other flags so flags still win over the file
const char* find_config_flag(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            return argv[i + 1];
        }
    }
    return nullptr;
}

CliOutcome fail(std::string message) {
    CliOutcome outcome;
    outcome.ok = false;
    outcome.error = std::move(message);
    return outcome;
}

}  // anonymous namespace

bool parse_port(const std::string& text, uint16_t& port) {
    int value = 0;
    if (!parse_int(text, 1, value) || value > 65535) return false;
    port = static_cast<uint16_t>(value);
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Settings file
// ═══════════════════════════════════════════════════════════════════════════

bool apply_settings_file(const std::string& path, HostConfig& config, std::string& error) {
    try {
        json s = read_section(path, "host");
        if (!port_from_json(s, "port", config.port, error)) return false;
        if (!ms_from_json(s, "tickMs", 1, config.tick_ms, error)) return false;
        if (!ms_from_json(s, "executionTimeoutMs", 0, config.execution_timeout_ms, error)) return false;
        config.verbose = s.value("verbose", config.verbose);
        config.log_file = s.value("logFile", config.log_file);
    } catch (const std::exception& e) {
        error = std::string("settings: ") + e.what();
        return false;
    }
    return true;
}

bool apply_settings_file(const std::string& path, GatewayConfig& config, std::string& error) {
    try {
        json s = read_section(path, "gateway");
        if (!port_from_json(s, "port", config.port, error)) return false;
        if (!port_from_json(s, "hostPort", config.host_port, error)) return false;
        config.host_address = s.value("hostAddress", config.host_address);
        config.debug = s.value("debug", config.debug);
        config.retry_all_errors = s.value("retryAllErrors", config.retry_all_errors);
        config.log_file = s.value("logFile", config.log_file);
    } catch (const std::exception& e) {
        error = std::string("settings: ") + e.what();
        return false;
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Environment
// ═══════════════════════════════════════════════════════════════════════════

bool apply_environment(HostConfig& config, std::string& error) {
    if (const char* port = std::getenv("CONDUIT_HOST_PORT")) {
        if (!parse_port(port, config.port)) {
            error = std::string("invalid CONDUIT_HOST_PORT: ") + port;
            return false;
        }
    }
    if (const char* debug = std::getenv("CONDUIT_DEBUG")) {
        config.verbose = parse_bool(debug);
    }
    return true;
}

bool apply_environment(GatewayConfig& config, std::string& error) {
    if (const char* port = std::getenv("CONDUIT_GATEWAY_PORT")) {
        if (!parse_port(port, config.port)) {
            error = std::string("invalid CONDUIT_GATEWAY_PORT: ") + port;
            return false;
        }
    }
    if (const char* port = std::getenv("CONDUIT_HOST_PORT")) {
        if (!parse_port(port, config.host_port)) {
            error = std::string("invalid CONDUIT_HOST_PORT: ") + port;
            return false;
        }
    }
    if (const char* address = std::getenv("CONDUIT_HOST_ADDRESS")) {
        config.host_address = address;
    }
    if (const char* debug = std::getenv("CONDUIT_DEBUG")) {
        config.debug = parse_bool(debug);
    }
    return true;
}

// ═══════════════════════════════════════════════════════════════════════════
// Command line
// ═══════════════════════════════════════════════════════════════════════════

CliOutcome load_host_config(int argc, char* argv[], HostConfig& config) {
    std::string error;
    if (const char* path = find_config_flag(argc, argv)) {
        if (!apply_settings_file(path, config, error)) return fail(error);
    }
    if (!apply_environment(config, error)) return fail(error);

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            if (!parse_port(argv[++i], config.port)) {
                return fail(std::string("invalid port: ") + argv[i]);
            }
        } else if (std::strcmp(argv[i], "--tick-ms") == 0 && i + 1 < argc) {
            if (!parse_int(argv[++i], 1, config.tick_ms)) {
                return fail(std::string("invalid tick: ") + argv[i]);
            }
        } else if (std::strcmp(argv[i], "--exec-timeout-ms") == 0 && i + 1 < argc) {
            if (!parse_int(argv[++i], 0, config.execution_timeout_ms)) {
                return fail(std::string("invalid execution timeout: ") + argv[i]);
            }
        } else if (std::strcmp(argv[i], "--verbose") == 0 || std::strcmp(argv[i], "-v") == 0) {
            config.verbose = true;
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            config.log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            ++i;  // applied above
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            CliOutcome outcome;
            outcome.help = true;
            return outcome;
        } else {
            return fail(std::string("Unknown option: ") + argv[i]);
        }
    }
    return {};
}

CliOutcome load_gateway_config(int argc, char* argv[], GatewayConfig& config) {
    std::string error;
    if (const char* path = find_config_flag(argc, argv)) {
        if (!apply_settings_file(path, config, error)) return fail(error);
    }
    if (!apply_environment(config, error)) return fail(error);

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            if (!parse_port(argv[++i], config.port)) {
                return fail(std::string("invalid port: ") + argv[i]);
            }
        } else if (std::strcmp(argv[i], "--host-address") == 0 && i + 1 < argc) {
            config.host_address = argv[++i];
        } else if (std::strcmp(argv[i], "--host-port") == 0 && i + 1 < argc) {
            if (!parse_port(argv[++i], config.host_port)) {
                return fail(std::string("invalid host port: ") + argv[i]);
            }
        } else if (std::strcmp(argv[i], "--debug") == 0) {
            config.debug = true;
        } else if (std::strcmp(argv[i], "--retry-all") == 0) {
            config.retry_all_errors = true;
        } else if (std::strcmp(argv[i], "--log") == 0 && i + 1 < argc) {
            config.log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--export-tools") == 0) {
            config.export_tools = true;
        } else if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            ++i;
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            CliOutcome outcome;
            outcome.help = true;
            return outcome;
        } else {
            return fail(std::string("Unknown option: ") + argv[i]);
        }
    }

    // The management listener takes port + 1
    if (config.port == 65535) {
        return fail("port 65535 leaves no room for the management port");
    }
    return {};
}

void print_host_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --port N              Bridge listen port (default: 12000)\n"
              << "  --tick-ms N           Main-thread tick interval (default: 16)\n"
              << "  --exec-timeout-ms N   Per-call execution deadline, 0 = none (default: 0)\n"
              << "  --verbose, -v         Debug logging\n"
              << "  --log PATH            Append output to PATH\n"
              << "  --config FILE         JSON settings file (\"host\" section)\n"
              << "  --help                Show this help message\n";
}

void print_gateway_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "Options:\n"
              << "  --port N              MCP SSE port; health/tools on N+1 (default: 13000)\n"
              << "  --host-address HOST   Automation host address (default: localhost)\n"
              << "  --host-port N         Automation host bridge port (default: 12000)\n"
              << "  --debug               Debug logging\n"
              << "  --retry-all           Retry every failure kind, not only connection faults\n"
              << "  --log PATH            Append output to PATH\n"
              << "  --config FILE         JSON settings file (\"gateway\" section)\n"
              << "  --export-tools        Print the tool catalog as Markdown and exit\n"
              << "  --help                Show this help message\n";
}

} // namespace conduit
