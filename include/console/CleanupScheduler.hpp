#pragma once
#include <string>
#include <map>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <thread>
#include <chrono>

namespace llm_reporter {

/**
 * One worker thread running delayed tasks keyed by id.
 * Scheduling an id again replaces its pending task. Tasks run without the scheduler lock held.
 */
class CleanupScheduler {
public:
    using Task = std::function<void()>;

    CleanupScheduler();
    ~CleanupScheduler();

    CleanupScheduler(const CleanupScheduler&) = delete;
    CleanupScheduler& operator=(const CleanupScheduler&) = delete;

    void schedule(const std::string& id, std::chrono::milliseconds delay, Task task);
    bool cancel(const std::string& id);
    void cancel_all();

    bool is_pending(const std::string& id) const;
    size_t pending_count() const;

private:
    struct Pending {
        std::chrono::steady_clock::time_point due;
        Task task;
    };

    void worker_loop();

    std::map<std::string, Pending> pending_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::thread worker_;
};

} // namespace llm_reporter
