#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace frontier_crawler::crawler {

// One-way stop flag shared by the controller and its workers. Sleeps taken
// through waitFor() end early as soon as a stop is requested.
class ShutdownSignal {
public:
    void requestStop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopRequested_.store(true);
        }
        cv_.notify_all();
    }

    bool isStopRequested() const {
        return stopRequested_.load();
    }

    // Returns true if stop was requested before the duration elapsed.
    template <typename Rep, typename Period>
    bool waitFor(const std::chrono::duration<Rep, Period>& duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this] { return stopRequested_.load(); });
    }

private:
    std::atomic<bool> stopRequested_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace frontier_crawler::crawler
