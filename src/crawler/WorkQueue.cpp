#include "WorkQueue.h"
#include "../../include/Logger.h"

namespace frontier_crawler::crawler {

void WorkQueue::push(const std::string& url) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_.push_back(url);
    }
    cv_.notify_one();
}

void WorkQueue::pushDelayed(const std::string& url, std::chrono::milliseconds delay) {
    if (delay.count() <= 0) {
        push(url);
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        delayed_.push(DelayedUrl{url, Clock::now() + delay, nextSequence_++});
        LOG_DEBUG("Delayed " + url + " by " + std::to_string(delay.count()) +
                  "ms, delayed queue size: " + std::to_string(delayed_.size()));
    }
    // A waiter may need to shorten its sleep to the new earliest ready time
    cv_.notify_all();
}

void WorkQueue::promoteDueLocked(Clock::time_point now) {
    while (!delayed_.empty() && delayed_.top().readyAt <= now) {
        ready_.push_back(delayed_.top().url);
        delayed_.pop();
    }
}

std::optional<std::string> WorkQueue::waitAndPop(std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;

    std::unique_lock<std::mutex> lock(mutex_);
    const uint64_t generation = wakeGeneration_;

    while (true) {
        auto now = Clock::now();
        promoteDueLocked(now);

        if (!ready_.empty()) {
            std::string url = std::move(ready_.front());
            ready_.pop_front();
            return url;
        }
        if (wakeGeneration_ != generation || now >= deadline) {
            return std::nullopt;
        }

        auto wakeAt = deadline;
        if (!delayed_.empty() && delayed_.top().readyAt < wakeAt) {
            wakeAt = delayed_.top().readyAt;
        }
        cv_.wait_until(lock, wakeAt);
    }
}

size_t WorkQueue::removeByPrefix(const std::string& prefix) {
    auto matches = [&prefix](const std::string& url) {
        return url.compare(0, prefix.size(), prefix) == 0;
    };

    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;

    std::deque<std::string> keptReady;
    for (auto& url : ready_) {
        if (matches(url)) {
            ++removed;
        } else {
            keptReady.push_back(std::move(url));
        }
    }
    ready_.swap(keptReady);

    std::priority_queue<DelayedUrl> keptDelayed;
    while (!delayed_.empty()) {
        if (matches(delayed_.top().url)) {
            ++removed;
        } else {
            keptDelayed.push(delayed_.top());
        }
        delayed_.pop();
    }
    delayed_.swap(keptDelayed);

    return removed;
}

void WorkQueue::wakeAll() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++wakeGeneration_;
    }
    cv_.notify_all();
}

size_t WorkQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ready_.size() + delayed_.size();
}

size_t WorkQueue::delayedSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return delayed_.size();
}

bool WorkQueue::empty() const {
    return size() == 0;
}

} // namespace frontier_crawler::crawler
