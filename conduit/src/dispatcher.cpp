#include <conduit/dispatcher.hpp>
#include <conduit/log.hpp>
#include <atomic>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <system_error>
#include <thread>

namespace conduit {

namespace {

// Validate, then execute. Never throws.
Response run_tool(const ToolEntry& tool, const json& params, const ToolContext& ctx) {
    std::string validation_error;
    try {
        validation_error = tool.validate ? tool.validate(params) : std::string();
    } catch (const std::exception& e) {
        validation_error = std::string("parameter validation raised: ") + e.what();
    }
    if (!validation_error.empty()) {
        log::debug("dispatch", "%s rejected params: %s",
                   tool.name.c_str(), validation_error.c_str());
        return Response::fail(validation_error);
    }

    try {
        return tool.execute(params, ctx);
    } catch (const std::exception& e) {
        log::error("dispatch", "tool %s raised: %s", tool.name.c_str(), e.what());
        return Response::fail(std::string("Tool execution failed: ") + e.what());
    } catch (...) {
        log::error("dispatch", "tool %s raised a non-standard exception", tool.name.c_str());
        return Response::fail("Tool execution failed: unknown error");
    }
}

// Lifecycle of a queued call: a timed-out call that never started is skipped
enum CallPhase : int { QUEUED = 0, RUNNING = 1, ABANDONED = 2 };

}  // anonymous namespace

// ═══════════════════════════════════════════════════════════════════════════
// ToolRegistry
// ═══════════════════════════════════════════════════════════════════════════

void ToolRegistry::register_tool(ToolEntry entry) {
    if (tools_.count(entry.name)) {
        log::warn("registry", "tool '%s' already registered, overwriting", entry.name.c_str());
    }
    log::debug("registry", "registered %s - %s", entry.name.c_str(), entry.description.c_str());
    std::string name = entry.name;
    tools_[name] = std::move(entry);
}

void ToolRegistry::register_tool(std::string name, std::string description,
                                 ToolValidator validate, ToolExecutor execute) {
    register_tool(ToolEntry{std::move(name), std::move(description), "",
                            std::move(validate), std::move(execute)});
}

bool ToolRegistry::unregister_tool(const std::string& name) {
    if (tools_.erase(name) == 0) return false;
    log::debug("registry", "unregistered %s", name.c_str());
    return true;
}

const ToolEntry* ToolRegistry::find(const std::string& name) const {
    auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : &it->second;
}

std::vector<std::string> ToolRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(tools_.size());
    for (const auto& [name, entry] : tools_) {
        out.push_back(name);
    }
    return out;
}

std::map<std::string, std::string> ToolRegistry::descriptions() const {
    std::map<std::string, std::string> out;
    for (const auto& [name, entry] : tools_) {
        out[name] = entry.description;
    }
    return out;
}

// ═══════════════════════════════════════════════════════════════════════════
// Dispatcher
// ═══════════════════════════════════════════════════════════════════════════

Dispatcher::Dispatcher(const ToolRegistry& registry, MainThreadQueue* main_queue,
                       DispatcherConfig config)
    : registry_(registry), main_queue_(main_queue), config_(config) {}

Dispatcher::~Dispatcher() {
    std::list<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }
}

void Dispatcher::reap_workers() const {
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

Response Dispatcher::dispatch(const Request& request, const ToolContext& ctx) const {
    Response response;

    if (request.action.empty()) {
        response = Response::fail("message missing action field");
    } else if (const ToolEntry* tool = registry_.find(request.action)) {
        log::debug("dispatch", "action=%s id=%s conn=%llu", request.action.c_str(),
                   request.id.c_str(), static_cast<unsigned long long>(ctx.connection_id));
        response = run_on_host(*tool, request, ctx);
    } else {
        response = Response::fail("tool not found: " + request.action);
    }

    response.id = request.id;
    if (response.timestamp == 0) response.timestamp = now_ms();
    return response;
}

Response Dispatcher::dispatch_payload(const std::string& payload, const ToolContext& ctx) const {
    Request request;
    try {
        request = parse_request(payload);
    } catch (const DecodeError& e) {
        log::warn("dispatch", "undecodable message on conn %llu: %s",
                  static_cast<unsigned long long>(ctx.connection_id), e.what());
        return Response::fail(std::string("invalid message: ") + e.what(), e.id().value_or(""));
    }
    return dispatch(request, ctx);
}

Response Dispatcher::run_on_host(const ToolEntry& tool, const Request& request,
                                 const ToolContext& ctx) const {
    const int timeout_ms = config_.execution_timeout_ms;

    if (!main_queue_ && timeout_ms <= 0) {
        return run_tool(tool, request.params, ctx);
    }

    // Copies: a timed-out call may outlive this frame
    auto phase = std::make_shared<std::atomic<int>>(QUEUED);
    auto job = [tool, params = request.params, ctx, phase]() -> Response {
        int expected = QUEUED;
        if (!phase->compare_exchange_strong(expected, RUNNING)) {
            return Response::fail("tool execution abandoned: " + tool.name);
        }
        return run_tool(tool, params, ctx);
    };

    std::future<Response> result;
    if (main_queue_) {
        result = main_queue_->submit(std::move(job));
    } else {
        reap_workers();
        auto promise = std::make_shared<std::promise<Response>>();
        result = promise->get_future();
        auto done = std::make_shared<std::atomic<bool>>(false);
        try {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            workers_.push_back(Worker{
                std::thread([promise, done, job = std::move(job)]() mutable {
                    promise->set_value(job());
                    *done = true;
                }),
                done
            });
        } catch (const std::system_error& e) {
            log::error("dispatch", "cannot start worker for %s: %s", tool.name.c_str(), e.what());
            return Response::fail(std::string("Tool execution failed: ") + e.what());
        }
    }

    // A queue destroyed with the call still pending breaks the promise
    auto collect = [&result, &tool]() -> Response {
        try {
            return result.get();
        } catch (const std::future_error& e) {
            log::error("dispatch", "%s never ran: %s", tool.name.c_str(), e.what());
            return Response::fail("tool execution abandoned: " + tool.name);
        }
    };

    if (timeout_ms <= 0) {
        return collect();
    }

    if (result.wait_for(std::chrono::milliseconds(timeout_ms)) == std::future_status::ready) {
        return collect();
    }

    int expected = QUEUED;
    bool never_started = phase->compare_exchange_strong(expected, ABANDONED);
    log::error("dispatch", "%s exceeded %dms (%s)", tool.name.c_str(), timeout_ms,
               never_started ? "dropped from queue" : "still running");
    return Response::fail("tool execution timed out after " + std::to_string(timeout_ms) +
                          "ms: " + tool.name);
}

} // namespace conduit
