#pragma once
// HTTP front end: MCP over SSE plus a management port
//
// Primary port (MCP SSE transport):
//   GET  /sse                   event stream; first event "endpoint"
//                               with data /message?sessionId=<id>
//   POST /message?sessionId=ID  one JSON-RPC request; 202 Accepted, the
//                               response arrives as a "message" event
// Primary+1 (management):
//   GET  /health                Gateway::health()
//   GET  /tools                 Gateway::tools_json()
//
// The two listeners are separate because the SSE transport owns its
// listening socket exclusively.
//
// Every open stream holds one SSE worker thread, so the SSE pool is sized
// max_sessions + request_threads and further streams get 503. JSON-RPC
// requests run on their own threads after the 202 is sent.

#include <conduit/gateway.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace httplib {
class Server;
}

namespace conduit {

class SseSession;

struct HttpConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 13000;        // 0 = ephemeral for both listeners
    int keepalive_ms = 15000;
    size_t max_sessions = 16;     // concurrent /sse streams
    size_t request_threads = 8;   // SSE pool threads left for POST /message
};

class HttpGateway {
public:
    HttpGateway(Gateway& gateway, HttpConfig config);
    ~HttpGateway();

    // Non-copyable, non-movable (owns listener threads)
    HttpGateway(const HttpGateway&) = delete;
    HttpGateway& operator=(const HttpGateway&) = delete;
    HttpGateway(HttpGateway&&) = delete;
    HttpGateway& operator=(HttpGateway&&) = delete;

    // Binds both ports, then serves on background threads
    bool start();
    void stop();

    uint16_t port() const { return port_; }
    uint16_t management_port() const { return management_port_; }
    size_t session_count() const;

private:
    Gateway& gateway_;
    HttpConfig config_;
    std::unique_ptr<httplib::Server> sse_server_;
    std::unique_ptr<httplib::Server> management_server_;
    std::thread sse_thread_;
    std::thread management_thread_;
    std::atomic<bool> running_{false};
    uint16_t port_ = 0;
    uint16_t management_port_ = 0;

    mutable std::mutex sessions_mutex_;
    std::map<std::string, std::shared_ptr<SseSession>> sessions_;

    struct RpcWorker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::mutex rpc_mutex_;
    std::list<RpcWorker> rpc_workers_;

    void setup_sse_routes();
    void setup_management_routes();
    std::shared_ptr<SseSession> open_session();
    std::shared_ptr<SseSession> find_session(const std::string& id) const;
    void close_session(const std::string& id);
    bool handle_async(std::shared_ptr<SseSession> session, json request);
    void reap_rpc_workers();
};

} // namespace conduit
