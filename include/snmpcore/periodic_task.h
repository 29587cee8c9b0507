#pragma once

#include <snmpcore/config.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace snmpcore {
namespace v1 {

/**
 * Background thread that runs a callback at a fixed interval until stopped.
 *
 * Used by the rate limiter, cache and session pool for their expiry sweeps.
 * stop() wakes the thread immediately and joins it; it is safe to call
 * repeatedly and from the destructor. start() and stop() may be called
 * from several threads at once. The callback must not call stop() on its
 * own task.
 */
class SNMPCORE_API PeriodicTask {
public:
    PeriodicTask() = default;
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /**
     * Start running task every interval. A running task is restarted with
     * the new interval.
     */
    void start(std::chrono::milliseconds interval, std::function<void()> task);

    void stop();

    bool is_running() const { return running_.load(); }

    std::chrono::milliseconds interval() const;

private:
    void run();
    void stop_locked();

    std::thread worker_;
    std::function<void()> task_;
    std::chrono::milliseconds interval_{0};
    std::atomic<bool> running_{false};
    bool stop_requested_ = false;
    std::mutex control_mutex_;   // serializes start() and stop()
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}  // namespace v1
}  // namespace snmpcore
