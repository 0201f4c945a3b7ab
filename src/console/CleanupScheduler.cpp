#include "console/CleanupScheduler.hpp"
#include <vector>
#include <spdlog/spdlog.h>

namespace llm_reporter {

CleanupScheduler::CleanupScheduler() {
    worker_ = std::thread(&CleanupScheduler::worker_loop, this);
}

CleanupScheduler::~CleanupScheduler() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
        pending_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void CleanupScheduler::schedule(const std::string& id, std::chrono::milliseconds delay, Task task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_[id] = Pending{std::chrono::steady_clock::now() + delay, std::move(task)};
    }
    cv_.notify_all();
}

bool CleanupScheduler::cancel(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.erase(id) > 0;
}

void CleanupScheduler::cancel_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.clear();
}

bool CleanupScheduler::is_pending(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(id) > 0;
}

size_t CleanupScheduler::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void CleanupScheduler::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_) {
        if (pending_.empty()) {
            cv_.wait(lock, [this] { return stop_ || !pending_.empty(); });
            continue;
        }

        auto next_due = pending_.begin()->second.due;
        for (const auto& [id, p] : pending_) {
            if (p.due < next_due) next_due = p.due;
        }

        if (std::chrono::steady_clock::now() < next_due) {
            // Woken early by schedule/cancel; recompute
            cv_.wait_until(lock, next_due);
            continue;
        }

        std::vector<Task> ready;
        auto now = std::chrono::steady_clock::now();
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second.due <= now) {
                ready.push_back(std::move(it->second.task));
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }

        lock.unlock();
        for (auto& task : ready) {
            try {
                task();
            } catch (const std::exception& e) {
                spdlog::error("Scheduled cleanup failed: {}", e.what());
            }
        }
        lock.lock();
    }
}

} // namespace llm_reporter
