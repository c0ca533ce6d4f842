#include <conduit/http_gateway.hpp>
#include <conduit/log.hpp>
#include <httplib.h>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

namespace conduit {

// ═══════════════════════════════════════════════════════════════════════════
// SseSession: one open /sse stream
// ═══════════════════════════════════════════════════════════════════════════

class SseSession {
public:
    explicit SseSession(std::string id) : id_(std::move(id)) {}

    const std::string& id() const { return id_; }

    void push(const std::string& event, const std::string& data) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return;
            pending_.push_back("event: " + event + "\ndata: " + data + "\n\n");
        }
        cv_.notify_one();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    // Content-provider step: flush queued events, or a keep-alive comment
    // when nothing arrived within keepalive_ms. false aborts the stream.
    bool pump(httplib::DataSink& sink, int keepalive_ms) {
        std::deque<std::string> batch;
        bool closed;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::milliseconds(keepalive_ms),
                         [this] { return closed_ || !pending_.empty(); });
            batch.swap(pending_);
            closed = closed_;
        }

        if (batch.empty() && !closed) {
            batch.push_back(": keepalive\n\n");
        }
        for (const auto& chunk : batch) {
            if (sink.is_writable && !sink.is_writable()) return false;
            if (!sink.write(chunk.data(), chunk.size())) return false;
        }
        if (closed) sink.done();
        return true;
    }

private:
    std::string id_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> pending_;
    bool closed_ = false;
};

namespace {

std::string random_session_id() {
    static std::mutex mutex;
    static std::mt19937_64 rng{std::random_device{}()};
    std::lock_guard<std::mutex> lock(mutex);
    std::ostringstream ss;
    ss << std::hex << std::setfill('0') << std::setw(16) << rng() << std::setw(16) << rng();
    return ss.str();
}

// Request start time, set by the pre-routing handler on the worker thread
thread_local std::chrono::steady_clock::time_point request_start;

void install_request_logging(httplib::Server& server) {
    server.set_pre_routing_handler([](const httplib::Request&, httplib::Response&) {
        request_start = std::chrono::steady_clock::now();
        return httplib::Server::HandlerResponse::Unhandled;
    });
    server.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - request_start).count();
        log::info("http", "HTTP [%s] %s - Status: %d, Duration: %lldms",
                  req.method.c_str(), req.path.c_str(), res.status, static_cast<long long>(ms));
    });
}

// Bind host:port, or any port when port is 0. Returns the bound port, 0 on failure.
uint16_t bind_server(httplib::Server& server, const std::string& host, uint16_t port) {
    if (port == 0) {
        int bound = server.bind_to_any_port(host);
        return bound > 0 ? static_cast<uint16_t>(bound) : 0;
    }
    return server.bind_to_port(host, port) ? port : 0;
}

// listen_after_bind() runs on its own thread; stop() is a no-op until the
// server reports running, so start() waits for that.
bool wait_until_running(const httplib::Server& server, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!server.is_running()) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

}  // anonymous namespace

// ═══════════════════════════════════════════════════════════════════════════
// HttpGateway
// ═══════════════════════════════════════════════════════════════════════════

HttpGateway::HttpGateway(Gateway& gateway, HttpConfig config)
    : gateway_(gateway)
    , config_(std::move(config))
    , sse_server_(std::make_unique<httplib::Server>())
    , management_server_(std::make_unique<httplib::Server>()) {
    size_t sse_threads = config_.max_sessions + config_.request_threads;
    sse_server_->new_task_queue = [sse_threads] { return new httplib::ThreadPool(sse_threads); };
    install_request_logging(*sse_server_);
    install_request_logging(*management_server_);
    setup_sse_routes();
    setup_management_routes();
}

HttpGateway::~HttpGateway() {
    stop();
}

bool HttpGateway::start() {
    if (running_) return true;

    port_ = bind_server(*sse_server_, config_.bind_address, config_.port);
    if (port_ == 0) {
        log::error("http", "Cannot bind SSE server to %s:%u", config_.bind_address.c_str(), config_.port);
        return false;
    }

    uint16_t wanted = config_.port == 0 ? 0 : static_cast<uint16_t>(config_.port + 1);
    management_port_ = bind_server(*management_server_, config_.bind_address, wanted);
    if (management_port_ == 0) {
        log::error("http", "Cannot bind management server to %s:%u", config_.bind_address.c_str(), wanted);
        sse_server_->stop();
        return false;
    }

    running_ = true;
    sse_thread_ = std::thread([this] { sse_server_->listen_after_bind(); });
    management_thread_ = std::thread([this] { management_server_->listen_after_bind(); });
    if (!wait_until_running(*sse_server_, 2000) || !wait_until_running(*management_server_, 2000)) {
        log::warn("http", "Listeners slow to start");
    }

    log::info("http", "MCP SSE endpoint: http://%s:%u/sse", config_.bind_address.c_str(), port_);
    log::info("http", "Health check: http://%s:%u/health", config_.bind_address.c_str(), management_port_);
    log::info("http", "Tools list: http://%s:%u/tools", config_.bind_address.c_str(), management_port_);
    return true;
}

void HttpGateway::stop() {
    if (!running_.exchange(false)) return;

    // Finish every stream so the servers' worker pools can drain
    std::map<std::string, std::shared_ptr<SseSession>> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions.swap(sessions_);
    }
    for (auto& [id, session] : sessions) {
        session->close();
    }

    sse_server_->stop();
    management_server_->stop();
    if (sse_thread_.joinable()) sse_thread_.join();
    if (management_thread_.joinable()) management_thread_.join();

    // No handler can start a request thread any more
    std::list<RpcWorker> workers;
    {
        std::lock_guard<std::mutex> lock(rpc_mutex_);
        workers.swap(rpc_workers_);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }
    log::info("http", "Stopped");
}

size_t HttpGateway::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

// nullptr when max_sessions streams are already open
std::shared_ptr<SseSession> HttpGateway::open_session() {
    auto session = std::make_shared<SseSession>(random_session_id());
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    if (sessions_.size() >= config_.max_sessions) return nullptr;
    session->push("endpoint", "/message?sessionId=" + session->id());
    sessions_[session->id()] = session;
    return session;
}

std::shared_ptr<SseSession> HttpGateway::find_session(const std::string& id) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

void HttpGateway::close_session(const std::string& id) {
    std::shared_ptr<SseSession> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) return;
        session = it->second;
        sessions_.erase(it);
    }
    session->close();
    log::info("http", "SSE session %s closed", id.c_str());
}

void HttpGateway::reap_rpc_workers() {
    std::lock_guard<std::mutex> lock(rpc_mutex_);
    for (auto it = rpc_workers_.begin(); it != rpc_workers_.end();) {
        if (*it->done) {
            if (it->thread.joinable()) it->thread.join();
            it = rpc_workers_.erase(it);
        } else {
            ++it;
        }
    }
}

// Run one JSON-RPC request off the HTTP pool; the reply goes to the stream
bool HttpGateway::handle_async(std::shared_ptr<SseSession> session, json request) {
    reap_rpc_workers();
    auto done = std::make_shared<std::atomic<bool>>(false);
    try {
        std::lock_guard<std::mutex> lock(rpc_mutex_);
        rpc_workers_.push_back(RpcWorker{
            std::thread([this, session, done, request = std::move(request)] {
                auto response = gateway_.handle_rpc(request);
                if (response) {
                    session->push("message", response->dump());
                }
                *done = true;
            }),
            done
        });
    } catch (const std::system_error& e) {
        log::error("http", "cannot start request thread: %s", e.what());
        return false;
    }
    return true;
}

void HttpGateway::setup_sse_routes() {
    sse_server_->Get("/sse", [this](const httplib::Request&, httplib::Response& res) {
        auto session = open_session();
        if (!session) {
            log::warn("http", "SSE session limit (%zu) reached", config_.max_sessions);
            res.status = 503;
            res.set_content("too many sessions", "text/plain");
            return;
        }
        log::info("http", "SSE session %s opened", session->id().c_str());

        int keepalive_ms = config_.keepalive_ms;
        std::string id = session->id();
        res.set_header("Cache-Control", "no-cache");
        res.set_header("Connection", "keep-alive");
        res.set_chunked_content_provider(
            "text/event-stream",
            [session, keepalive_ms](size_t, httplib::DataSink& sink) {
                return session->pump(sink, keepalive_ms);
            },
            [this, id](bool) { close_session(id); });
    });

    sse_server_->Post("/message", [this](const httplib::Request& req, httplib::Response& res) {
        std::string id = req.get_param_value("sessionId");
        auto session = find_session(id);
        if (!session) {
            res.status = 404;
            res.set_content(mcp::make_error(json(), mcp::error::INVALID_REQUEST,
                                            "unknown session: " + id).dump(),
                            "application/json");
            return;
        }

        json request;
        try {
            request = json::parse(req.body);
        } catch (const json::parse_error& e) {
            json error = mcp::make_error(json(), mcp::error::PARSE_ERROR,
                                         std::string("JSON parse error: ") + e.what());
            session->push("message", error.dump());
            res.status = 400;
            res.set_content(error.dump(), "application/json");
            return;
        }

        if (!handle_async(session, std::move(request))) {
            res.status = 503;
            res.set_content("server busy", "text/plain");
            return;
        }
        res.status = 202;
        res.set_content("Accepted", "text/plain");
    });
}

void HttpGateway::setup_management_routes() {
    management_server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        res.set_content(gateway_.health().dump(), "application/json");
    });

    management_server_->Get("/tools", [this](const httplib::Request&, httplib::Response& res) {
        json tools = gateway_.tools_json();
        log::debug("http", "Tools list: %zu tools available", tools.size());
        res.set_content(tools.dump(), "application/json");
    });
}

} // namespace conduit
