#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <vector>

namespace frontier_crawler::crawler {

// In-memory cache of URLs believed to be pending. The frontier store stays
// authoritative: entries may be duplicated or stale, and consumers re-check
// the store before acting on what they pop.
class WorkQueue {
public:
    using Clock = std::chrono::steady_clock;

    WorkQueue() = default;

    void push(const std::string& url);

    // Make url available only after delay has elapsed (retry backoff).
    void pushDelayed(const std::string& url, std::chrono::milliseconds delay);

    // Blocks for at most timeout. Returns std::nullopt on timeout or after wakeAll().
    std::optional<std::string> waitAndPop(std::chrono::milliseconds timeout);

    // Drops every queued entry (ready or delayed) whose url starts with prefix.
    size_t removeByPrefix(const std::string& prefix);

    // Releases all waiters, e.g. on shutdown.
    void wakeAll();

    // Ready plus delayed entries
    size_t size() const;
    size_t delayedSize() const;
    bool empty() const;

private:
    struct DelayedUrl {
        std::string url;
        Clock::time_point readyAt;
        uint64_t sequence = 0;

        // std::priority_queue is a max-heap; earliest readyAt must come out first
        bool operator<(const DelayedUrl& other) const {
            if (readyAt != other.readyAt) {
                return readyAt > other.readyAt;
            }
            return sequence > other.sequence;
        }
    };

    // Caller holds mutex_
    void promoteDueLocked(Clock::time_point now);

    std::deque<std::string> ready_;
    std::priority_queue<DelayedUrl> delayed_;
    uint64_t nextSequence_ = 0;
    uint64_t wakeGeneration_ = 0;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace frontier_crawler::crawler
