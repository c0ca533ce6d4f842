#include <conduit/main_thread.hpp>
#include <conduit/log.hpp>
#include <chrono>
#include <exception>
#include <thread>

namespace conduit {

void MainThreadQueue::post(Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(std::move(task));
}

size_t MainThreadQueue::drain() {
    std::deque<Task> batch;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(tasks_);
    }

    size_t ran = 0;
    for (auto& task : batch) {
        try {
            task();
        } catch (const std::exception& e) {
            log::error("main", "queued action failed: %s", e.what());
        } catch (...) {
            log::error("main", "queued action failed with a non-standard exception");
        }
        ++ran;
    }
    return ran;
}

void MainThreadQueue::run(const std::atomic<bool>& running, int tick_ms) {
    while (running) {
        drain();
        std::this_thread::sleep_for(std::chrono::milliseconds(tick_ms));
    }
    // Unblock workers still waiting on queued actions
    drain();
}

size_t MainThreadQueue::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

} // namespace conduit
