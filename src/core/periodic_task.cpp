#include <snmpcore/periodic_task.h>

namespace snmpcore {
namespace v1 {

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start(std::chrono::milliseconds interval, std::function<void()> task) {
    std::lock_guard<std::mutex> control(control_mutex_);
    stop_locked();
    if (interval.count() <= 0) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        task_ = std::move(task);
        interval_ = interval;
        stop_requested_ = false;
    }

    running_ = true;
    worker_ = std::thread([this] { run(); });
}

void PeriodicTask::stop() {
    std::lock_guard<std::mutex> control(control_mutex_);
    stop_locked();
}

void PeriodicTask::stop_locked() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }
    running_ = false;
}

std::chrono::milliseconds PeriodicTask::interval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return interval_;
}

void PeriodicTask::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_requested_) {
        cv_.wait_for(lock, interval_, [this] { return stop_requested_; });
        if (stop_requested_) {
            break;
        }

        auto task = task_;
        lock.unlock();
        if (task) {
            task();
        }
        lock.lock();
    }
}

}  // namespace v1
}  // namespace snmpcore
