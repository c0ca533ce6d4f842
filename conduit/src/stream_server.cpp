#include <conduit/stream_server.hpp>
#include <conduit/frame.hpp>
#include <conduit/log.hpp>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace conduit {

// ═══════════════════════════════════════════════════════════════════════════
// Connection
// ═══════════════════════════════════════════════════════════════════════════

void Connection::write(const std::string& payload, int timeout_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd < 0) throw TransportError("connection closed");
    frame::write_frame(fd, payload, timeout_ms);
}

void Connection::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
}

void Connection::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// ConnectionRegistry
// ═══════════════════════════════════════════════════════════════════════════

void ConnectionRegistry::add(std::shared_ptr<Connection> conn) {
    std::lock_guard<std::mutex> lock(mutex_);
    connections_.push_back(std::move(conn));
}

bool ConnectionRegistry::remove(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(connections_.begin(), connections_.end(),
        [id](const std::shared_ptr<Connection>& c) { return c->id == id; });
    if (it == connections_.end()) return false;
    connections_.erase(it);
    return true;
}

std::vector<std::shared_ptr<Connection>> ConnectionRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_;
}

size_t ConnectionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

void ConnectionRegistry::shutdown_all() {
    for (auto& conn : snapshot()) {
        conn->shutdown();
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// StreamServer
// ═══════════════════════════════════════════════════════════════════════════

StreamServer::StreamServer(const Dispatcher& dispatcher, ServerConfig config)
    : dispatcher_(dispatcher), config_(config) {}

StreamServer::~StreamServer() {
    stop();
}

bool StreamServer::start(uint16_t port) {
    if (running_) return true;

    listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) {
        log::error("stream_server", "socket() failed: %s", strerror(errno));
        return false;
    }

    int reuse = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

    // Non-blocking so a connection that vanishes between poll and accept
    // cannot wedge the accept loop
    int flags = fcntl(listen_fd_, F_GETFL, 0);
    if (flags >= 0) {
        fcntl(listen_fd_, F_SETFL, flags | O_NONBLOCK);
    }

    struct sockaddr_in addr;
    memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);

    if (bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        log::error("stream_server", "bind() to port %u failed: %s", port, strerror(errno));
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }

    if (listen(listen_fd_, config_.backlog) < 0) {
        log::error("stream_server", "listen() failed: %s", strerror(errno));
        ::close(listen_fd_);
        listen_fd_ = -1;
        return false;
    }

    socklen_t len = sizeof(addr);
    if (getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
        port_ = ntohs(addr.sin_port);
    } else {
        port_ = port;
    }

    running_ = true;
    accept_thread_ = std::thread([this] { accept_loop(); });

    log::info("stream_server", "Listening on 0.0.0.0:%u", port_);
    return true;
}

void StreamServer::stop() {
    std::lock_guard<std::mutex> stop_lock(stop_mutex_);

    bool was_running = running_.exchange(false);
    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    if (listen_fd_ >= 0) {
        ::close(listen_fd_);
        listen_fd_ = -1;
    }

    connections_.shutdown_all();

    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }

    if (was_running) {
        log::info("stream_server", "Stopped");
    }
}

size_t StreamServer::broadcast(const std::string& payload) {
    size_t delivered = 0;
    for (auto& conn : connections_.snapshot()) {
        try {
            conn->write(payload, config_.write_timeout_ms);
            ++delivered;
        } catch (const BridgeError& e) {
            log::warn("stream_server", "broadcast to connection %llu failed: %s",
                      static_cast<unsigned long long>(conn->id), e.what());
        }
    }
    return delivered;
}

void StreamServer::accept_loop() {
    while (running_) {
        reap_workers();

        pollfd pfd{listen_fd_, POLLIN, 0};
        int ret = ::poll(&pfd, 1, config_.accept_poll_ms);
        if (ret < 0) {
            if (errno == EINTR) continue;
            log::error("stream_server", "poll() error: %s", strerror(errno));
            break;
        }
        if (ret == 0 || !(pfd.revents & POLLIN)) continue;

        struct sockaddr_in peer_addr;
        socklen_t peer_len = sizeof(peer_addr);
        int client_fd = accept(listen_fd_, reinterpret_cast<struct sockaddr*>(&peer_addr), &peer_len);
        if (client_fd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                log::error("stream_server", "accept() error: %s", strerror(errno));
            }
            continue;
        }

        char ip[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &peer_addr.sin_addr, ip, sizeof(ip));
        std::string peer = std::string(ip) + ":" + std::to_string(ntohs(peer_addr.sin_port));

        if (connections_.size() >= config_.max_connections) {
            log::warn("stream_server", "Max connections reached (%zu), rejecting %s",
                      config_.max_connections, peer.c_str());
            ::close(client_fd);
            continue;
        }

        int nodelay = 1;
        setsockopt(client_fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

        auto conn = std::make_shared<Connection>(next_connection_id_++, client_fd, peer);
        connections_.add(conn);
        log::info("stream_server", "Client connected: %s (id=%llu, total=%zu)",
                  peer.c_str(), static_cast<unsigned long long>(conn->id), connections_.size());

        if (on_connected_) on_connected_(*conn);

        auto done = std::make_shared<std::atomic<bool>>(false);
        try {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            workers_.push_back(Worker{
                std::thread([this, conn, done] {
                    serve(conn);
                    *done = true;
                }),
                done
            });
        } catch (const std::system_error& e) {
            log::error("stream_server", "cannot start worker for %s: %s", peer.c_str(), e.what());
            connections_.remove(conn->id);
            conn->close();
            if (on_disconnected_) on_disconnected_(*conn);
        }
    }
}

void StreamServer::serve(std::shared_ptr<Connection> conn) {
    ToolContext ctx{conn->id, conn->peer};

    while (running_) {
        std::optional<std::string> payload;
        try {
            payload = frame::read_frame(conn->fd, -1);
        } catch (const FramingError& e) {
            // Stream position is unknown after a bad prefix: answer, then drop
            log::warn("stream_server", "framing error from %s: %s", conn->peer.c_str(), e.what());
            send_response(*conn, Response::fail(std::string("framing error: ") + e.what()));
            break;
        } catch (const TransportError& e) {
            log::info("stream_server", "connection %s dropped: %s", conn->peer.c_str(), e.what());
            break;
        }

        if (!payload) break;  // peer closed between frames

        log::debug("stream_server", "<- %s %zu bytes", conn->peer.c_str(), payload->size());
        Response response = dispatcher_.dispatch_payload(*payload, ctx);
        if (!send_response(*conn, response)) break;
    }

    connections_.remove(conn->id);
    conn->close();
    log::info("stream_server", "Client disconnected: %s (id=%llu, total=%zu)",
              conn->peer.c_str(), static_cast<unsigned long long>(conn->id), connections_.size());

    if (on_disconnected_) on_disconnected_(*conn);
}

bool StreamServer::send_response(Connection& conn, const Response& response) {
    std::string text = response.dump();
    if (text.size() > frame::MAX_PAYLOAD_SIZE) {
        log::warn("stream_server", "response to %s too large (%zu bytes), replaced",
                  conn.peer.c_str(), text.size());
        text = Response::fail("response too large: " + std::to_string(text.size()) + " bytes",
                              response.id).dump();
    }

    try {
        conn.write(text, config_.write_timeout_ms);
    } catch (const BridgeError& e) {
        log::info("stream_server", "write to %s failed: %s", conn.peer.c_str(), e.what());
        return false;
    }
    log::debug("stream_server", "-> %s %zu bytes", conn.peer.c_str(), text.size());
    return true;
}

void StreamServer::reap_workers() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (*it->done) {
            if (it->thread.joinable()) it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace conduit
