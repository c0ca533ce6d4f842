#pragma once
// Dispatcher: tool registry plus the validate-then-execute protocol
//
// The registry is filled before the server starts and is read-only while
// requests are in flight; it is not synchronized against dispatch.
//
// Dispatch rules:
//   empty action        -> "message missing action field"
//   unknown action      -> "tool not found: <action>"
//   validate() != ""    -> that message, execute() never runs
//   execute() throws    -> "Tool execution failed: <what>"
//   response.id         -> always the request id

#include <conduit/envelope.hpp>
#include <conduit/main_thread.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace conduit {

// The connection a request arrived on
struct ToolContext {
    uint64_t connection_id = 0;
    std::string peer;
};

// Returns an empty string when params are acceptable
using ToolValidator = std::function<std::string(const json& params)>;
using ToolExecutor = std::function<Response(const json& params, const ToolContext& ctx)>;

struct ToolEntry {
    std::string name;
    std::string description;
    std::string category;
    ToolValidator validate;
    ToolExecutor execute;
};

class ToolRegistry {
public:
    // Inserts or overwrites (with a warning). Never throws.
    void register_tool(ToolEntry entry);
    void register_tool(std::string name, std::string description,
                       ToolValidator validate, ToolExecutor execute);

    bool unregister_tool(const std::string& name);

    const ToolEntry* find(const std::string& name) const;
    std::vector<std::string> names() const;
    std::map<std::string, std::string> descriptions() const;
    size_t size() const { return tools_.size(); }

private:
    std::map<std::string, ToolEntry> tools_;
};

struct DispatcherConfig {
    // Bound on validate+execute, 0 = wait forever
    int execution_timeout_ms = 0;
};

class Dispatcher {
public:
    // With a main queue, tools run on the thread that drains it
    explicit Dispatcher(const ToolRegistry& registry,
                        MainThreadQueue* main_queue = nullptr,
                        DispatcherConfig config = {});

    // Joins tool workers that outlived their timeout
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    Response dispatch(const Request& request, const ToolContext& ctx) const;

    // Decode an envelope, then dispatch. Decode failures become error envelopes.
    Response dispatch_payload(const std::string& payload, const ToolContext& ctx) const;

    const ToolRegistry& registry() const { return registry_; }

private:
    // Timed execution without a main queue runs each call on its own thread
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    const ToolRegistry& registry_;
    MainThreadQueue* main_queue_;
    DispatcherConfig config_;
    mutable std::mutex workers_mutex_;
    mutable std::list<Worker> workers_;

    Response run_on_host(const ToolEntry& tool, const Request& request,
                         const ToolContext& ctx) const;
    void reap_workers() const;
};

} // namespace conduit
