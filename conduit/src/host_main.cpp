// conduit_host: automation host side of the bridge
//
// Serves length-prefixed tool requests on a TCP port. Tools run on this
// process's main thread, which drains the main-thread queue once per tick;
// connection workers block until their call has run there.
//
// Usage:
//   conduit_host [options]
//
// Options:
//   --port N              Bridge listen port (default: 12000)
//   --tick-ms N           Main-thread tick interval (default: 16)
//   --exec-timeout-ms N   Per-call execution deadline, 0 = none
//   --verbose             Debug logging
//   --log PATH            Append output to PATH
//   --config FILE         JSON settings file

#include <conduit/config.hpp>
#include <conduit/dispatcher.hpp>
#include <conduit/log.hpp>
#include <conduit/main_thread.hpp>
#include <conduit/stream_server.hpp>
#include <conduit/tools/builtin.hpp>
#include <conduit/version.hpp>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

// Global flag for shutdown
static std::atomic<bool> host_running{true};

void host_signal_handler(int sig) {
    (void)sig;
    host_running = false;
}

int main(int argc, char* argv[]) {
    conduit::HostConfig config;
    auto outcome = conduit::load_host_config(argc, argv, config);
    if (outcome.help) {
        conduit::print_host_usage(argv[0]);
        return 0;
    }
    if (!outcome.ok) {
        std::cerr << "[conduit_host] " << outcome.error << "\n";
        conduit::print_host_usage(argv[0]);
        return 1;
    }

    if (!config.log_file.empty() && !conduit::log::redirect_to_file(config.log_file)) {
        std::cerr << "[conduit_host] Cannot open log file " << config.log_file << "\n";
        return 1;
    }
    conduit::log::set_verbose(config.verbose);

    std::signal(SIGTERM, host_signal_handler);
    std::signal(SIGINT, host_signal_handler);
    std::signal(SIGPIPE, SIG_IGN);

    conduit::MainThreadQueue main_queue;
    conduit::ToolRegistry registry;
    conduit::Dispatcher dispatcher(registry, &main_queue,
                                   conduit::DispatcherConfig{config.execution_timeout_ms});
    conduit::StreamServer server(dispatcher);

    conduit::tools::builtin::register_tools(registry, [&server] { return server.connection_count(); });

    server.on_client_connected([](const conduit::Connection& conn) {
        conduit::log::debug("host", "client %s attached", conn.peer.c_str());
    });
    server.on_client_disconnected([](const conduit::Connection& conn) {
        conduit::log::debug("host", "client %s detached", conn.peer.c_str());
    });

    if (!server.start(config.port)) {
        return 1;
    }

    conduit::log::info("host", "conduit_host v%s ready: %zu tools, tick=%dms, exec timeout=%dms",
                       CONDUIT_VERSION, registry.size(), config.tick_ms, config.execution_timeout_ms);

    main_queue.run(host_running, config.tick_ms);

    conduit::log::info("host", "Shutting down");

    // Workers may still be waiting on queued calls: keep ticking until the
    // server has joined them
    std::atomic<bool> stopped{false};
    std::thread stopper([&] {
        server.stop();
        stopped = true;
    });
    while (!stopped) {
        main_queue.drain();
        std::this_thread::sleep_for(std::chrono::milliseconds(config.tick_ms));
    }
    stopper.join();
    main_queue.drain();

    return 0;
}
