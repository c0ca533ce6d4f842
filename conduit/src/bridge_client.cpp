#include <conduit/bridge_client.hpp>
#include <conduit/frame.hpp>
#include <conduit/log.hpp>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <thread>

namespace conduit {

namespace {

void set_blocking(int fd, bool blocking) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return;
    fcntl(fd, F_SETFL, blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK));
}

// Non-blocking connect bounded by timeout_ms. Returns fd or -1 with err set.
int dial(const addrinfo* ai, int timeout_ms, std::string& err) {
    int fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
        err = std::string("socket() failed: ") + strerror(errno);
        return -1;
    }

    set_blocking(fd, false);
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
        if (errno != EINPROGRESS) {
            err = strerror(errno);
            ::close(fd);
            return -1;
        }

        pollfd pfd{fd, POLLOUT, 0};
        int ret;
        do {
            ret = ::poll(&pfd, 1, timeout_ms);
        } while (ret < 0 && errno == EINTR);

        if (ret == 0) {
            err = "connect timed out after " + std::to_string(timeout_ms) + "ms";
            ::close(fd);
            return -1;
        }
        if (ret < 0) {
            err = std::string("poll() failed: ") + strerror(errno);
            ::close(fd);
            return -1;
        }

        int so_error = 0;
        socklen_t len = sizeof(so_error);
        getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
        if (so_error != 0) {
            err = strerror(so_error);
            ::close(fd);
            return -1;
        }
    }
    set_blocking(fd, true);

    int nodelay = 1;
    setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
    return fd;
}

}  // anonymous namespace

BridgeClient::BridgeClient(ClientConfig config)
    : config_(std::move(config)) {}

BridgeClient::~BridgeClient() {
    close();
}

std::string BridgeClient::endpoint() const {
    return config_.host + ":" + std::to_string(config_.port);
}

void BridgeClient::connect() {
    std::lock_guard<std::mutex> lock(mutex_);
    connect_locked();
}

void BridgeClient::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    close_locked();
}

bool BridgeClient::reconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    return reconnect_locked();
}

void BridgeClient::connect_locked() {
    if (fd_ >= 0) return;

    addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* result = nullptr;
    std::string service = std::to_string(config_.port);
    int rc = getaddrinfo(config_.host.c_str(), service.c_str(), &hints, &result);
    if (rc != 0) {
        throw TransportError("cannot resolve " + config_.host + ": " + gai_strerror(rc));
    }

    std::string err = "no addresses";
    int fd = -1;
    for (addrinfo* ai = result; ai && fd < 0; ai = ai->ai_next) {
        fd = dial(ai, config_.connect_timeout_ms, err);
    }
    freeaddrinfo(result);

    if (fd < 0) {
        throw TransportError("connect to " + endpoint() + " failed: " + err);
    }

    fd_ = fd;
    log::info("bridge", "Connected to host at %s", endpoint().c_str());
}

void BridgeClient::close_locked() {
    int fd = fd_.exchange(-1);
    if (fd >= 0) {
        ::close(fd);
        log::debug("bridge", "Closed connection to %s", endpoint().c_str());
    }
}

bool BridgeClient::reconnect_locked() {
    close_locked();
    std::this_thread::sleep_for(std::chrono::milliseconds(config_.reconnect_backoff_ms));

    try {
        connect_locked();
    } catch (const TransportError& e) {
        log::warn("bridge", "Reconnect failed: %s", e.what());
        return false;
    }
    log::info("bridge", "Reconnected to %s", endpoint().c_str());
    return true;
}

bool BridgeClient::is_connected() {
    std::unique_lock<std::mutex> lock(mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        // A call is in flight on the socket
        return fd_ >= 0;
    }
    if (fd_ < 0) return false;

    char c;
    ssize_t n = recv(fd_, &c, 1, MSG_PEEK | MSG_DONTWAIT);
    if (n > 0) return true;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) return true;

    // Orderly shutdown or error: the next send dials again
    close_locked();
    return false;
}

Response BridgeClient::send_message(const Request& request) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string payload = request.dump();
    if (payload.size() > frame::MAX_PAYLOAD_SIZE) {
        // The socket is untouched, so this is the message's fault
        throw BridgeError(ErrorKind::Validation,
                          "request too large: " + std::to_string(payload.size()) + " bytes");
    }

    connect_locked();

    try {
        frame::write_frame(fd_, payload, config_.io_timeout_ms);
    } catch (const BridgeError& e) {
        log::warn("bridge", "Send of %s failed: %s", request.id.c_str(), e.what());
        reconnect_locked();
        throw;
    }
    log::debug("bridge", "-> %s %s (%zu bytes)", request.action.c_str(), request.id.c_str(), payload.size());

    std::optional<std::string> reply;
    try {
        reply = frame::read_frame(fd_, config_.io_timeout_ms);
        if (!reply) throw TransportError("connection closed by host");
    } catch (const BridgeError& e) {
        log::warn("bridge", "Receive for %s failed: %s", request.id.c_str(), e.what());
        reconnect_locked();
        throw;
    }
    log::debug("bridge", "<- %s (%zu bytes)", request.id.c_str(), reply->size());

    return parse_response(*reply);
}

bool BridgeClient::test_connection() {
    try {
        Response r = send_message(make_request("ping", json::object()));
        return r.success;
    } catch (const BridgeError& e) {
        log::warn("bridge", "Connection test failed: %s", e.what());
        return false;
    }
}

} // namespace conduit
