#pragma once
// StreamServer: TCP listener for framed envelopes (host side)
//
// One accept thread plus one worker thread per connection. A worker handles
// one request completely (decode, dispatch, write response) before reading
// the next frame, so there is no pipelining on a connection.
//
// Per-message faults are answered with an error envelope and the connection
// stays open. A framing error is answered, then the connection is closed.
// I/O failures close the connection silently (logged).

#include <conduit/dispatcher.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace conduit {

// A live client socket. Only the owning worker reads from or closes fd;
// writes (responses, broadcasts) go through write().
struct Connection {
    uint64_t id = 0;
    int fd = -1;
    std::string peer;

    Connection(uint64_t id_, int fd_, std::string peer_)
        : id(id_), fd(fd_), peer(std::move(peer_)) {}

    // Serialized against other writers and close(). Throws BridgeError.
    void write(const std::string& payload, int timeout_ms);

    // Unblocks the worker's pending read; safe from any thread
    void shutdown();
    void close();

private:
    std::mutex mutex_;
};

// Live connection set, owned by one server instance
class ConnectionRegistry {
public:
    void add(std::shared_ptr<Connection> conn);
    bool remove(uint64_t id);
    std::vector<std::shared_ptr<Connection>> snapshot() const;
    size_t size() const;
    void shutdown_all();

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<Connection>> connections_;
};

struct ServerConfig {
    int backlog = 32;
    int write_timeout_ms = 10000;   // response writes; reads have no deadline
    int accept_poll_ms = 100;
    size_t max_connections = 32;    // further clients are closed on accept
};

class StreamServer {
public:
    using ConnectionCallback = std::function<void(const Connection&)>;

    explicit StreamServer(const Dispatcher& dispatcher, ServerConfig config = {});
    ~StreamServer();

    // Non-copyable, non-movable (owns threads and file descriptors)
    StreamServer(const StreamServer&) = delete;
    StreamServer& operator=(const StreamServer&) = delete;
    StreamServer(StreamServer&&) = delete;
    StreamServer& operator=(StreamServer&&) = delete;

    // Port 0 binds an ephemeral port, see port()
    bool start(uint16_t port);
    void stop();
    bool running() const { return running_; }
    uint16_t port() const { return port_; }

    size_t connection_count() const { return connections_.size(); }

    // Frame one payload to every live connection. Returns deliveries.
    size_t broadcast(const std::string& payload);

    // Set before start()
    void on_client_connected(ConnectionCallback cb) { on_connected_ = std::move(cb); }
    void on_client_disconnected(ConnectionCallback cb) { on_disconnected_ = std::move(cb); }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    const Dispatcher& dispatcher_;
    ServerConfig config_;
    int listen_fd_ = -1;
    uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> next_connection_id_{1};
    std::thread accept_thread_;
    std::mutex workers_mutex_;
    std::list<Worker> workers_;
    std::mutex stop_mutex_;
    ConnectionRegistry connections_;
    ConnectionCallback on_connected_;
    ConnectionCallback on_disconnected_;

    void accept_loop();
    void serve(std::shared_ptr<Connection> conn);
    bool send_response(Connection& conn, const Response& response);
    void reap_workers();
};

} // namespace conduit
