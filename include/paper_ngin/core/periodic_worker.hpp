// include/paper_ngin/core/periodic_worker.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace paper_ngin {

/**
 * @brief Runs a task on a dedicated thread at a fixed interval
 *
 * The first run happens immediately after start(). trigger() cuts the current wait short.
 * stop() wakes the thread, lets the task in progress finish and joins. Exceptions escaping
 * the task are logged and the loop continues.
 */
class PeriodicWorker {
public:
    explicit PeriodicWorker(std::string name) : name_(std::move(name)) {}
    ~PeriodicWorker();

    PeriodicWorker(const PeriodicWorker&) = delete;
    PeriodicWorker& operator=(const PeriodicWorker&) = delete;

    /**
     * @brief Start the loop; no-op if already running
     * @return false if the worker was already running
     */
    bool start(std::chrono::milliseconds interval, std::function<void()> task);

    void stop();

    /**
     * @brief Run the task as soon as possible; a trigger during a run causes one more run
     */
    void trigger();

    bool is_running() const {
        return running_.load();
    }

private:
    void run();

    std::string name_;
    std::chrono::milliseconds interval_{0};
    std::function<void()> task_;
    std::atomic<bool> running_{false};
    bool triggered_{false};  // Guarded by stop_mutex_
    std::thread thread_;
    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
};

}  // namespace paper_ngin
