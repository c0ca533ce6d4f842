#pragma once
// Bridge Client: the gateway's socket to the automation host
//
// One lazily-opened TCP connection, one request in flight at a time.
// send_message() frames a request, waits for the framed response and
// returns it; it never retries. Write/read failures close the socket and
// make one reconnect attempt before the error propagates to the caller.
//
// All calls on an instance are serialized by an internal mutex, so a
// gateway serving concurrent callers can share one client.

#include <conduit/envelope.hpp>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

namespace conduit {

struct ClientConfig {
    std::string host = "localhost";
    uint16_t port = 12000;
    int connect_timeout_ms = 10000;
    int io_timeout_ms = 10000;
    int reconnect_backoff_ms = 1000;
};

class BridgeClient {
public:
    explicit BridgeClient(ClientConfig config);
    ~BridgeClient();

    // Non-copyable, non-movable (owns file descriptor)
    BridgeClient(const BridgeClient&) = delete;
    BridgeClient& operator=(const BridgeClient&) = delete;
    BridgeClient(BridgeClient&&) = delete;
    BridgeClient& operator=(BridgeClient&&) = delete;

    // Dial the host (no-op when a socket is open). Throws TransportError.
    void connect();
    void close();

    // Close, sleep the backoff, dial once. Logs the outcome.
    bool reconnect();

    // Advisory liveness probe; never blocks behind an in-flight call
    bool is_connected();

    // One round trip. Throws BridgeError subclasses; does not compare ids.
    Response send_message(const Request& request);

    // Round trip of the host's ping tool
    bool test_connection();

    std::string endpoint() const;
    const ClientConfig& config() const { return config_; }

private:
    ClientConfig config_;
    std::atomic<int> fd_{-1};
    std::mutex mutex_;

    void connect_locked();
    void close_locked();
    bool reconnect_locked();
};

} // namespace conduit
