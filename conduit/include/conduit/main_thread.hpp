#pragma once
// MainThreadQueue: hand-off from connection workers to the host thread
//
// The host's object model is single-threaded. Workers post closures here and
// block on the returned future; the host thread drains the queue once per
// tick, strictly FIFO, as the only consumer.

#include <atomic>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <type_traits>

namespace conduit {

class MainThreadQueue {
public:
    using Task = std::function<void()>;

    MainThreadQueue() = default;

    // Non-copyable, non-movable (shared between threads by reference)
    MainThreadQueue(const MainThreadQueue&) = delete;
    MainThreadQueue& operator=(const MainThreadQueue&) = delete;

    void post(Task task);

    // Queue fn and return a future for its result (exceptions travel with it)
    template <typename F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
        auto future = task->get_future();
        post([task]() { (*task)(); });
        return future;
    }

    // Run every task queued before this call, in order, on the calling thread.
    // Tasks queued while draining wait for the next tick. Returns tasks run.
    size_t drain();

    // Host tick loop: drain, then sleep tick_ms, until running turns false
    void run(const std::atomic<bool>& running, int tick_ms);

    size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::deque<Task> tasks_;
};

} // namespace conduit
