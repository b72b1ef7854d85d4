// src/core/periodic_worker.cpp
#include "paper_ngin/core/periodic_worker.hpp"

#include "paper_ngin/core/logger.hpp"

namespace paper_ngin {

PeriodicWorker::~PeriodicWorker() {
    stop();
}

bool PeriodicWorker::start(std::chrono::milliseconds interval, std::function<void()> task) {
    if (thread_.joinable()) {
        return false;
    }

    interval_ = interval;
    task_ = std::move(task);
    running_.store(true);
    thread_ = std::thread([this] { run(); });
    return true;
}

void PeriodicWorker::stop() {
    if (!thread_.joinable()) {
        return;
    }

    {
        // Store under the mutex so the worker cannot miss the notification
        std::lock_guard<std::mutex> lock(stop_mutex_);
        running_.store(false);
    }
    stop_cv_.notify_all();
    thread_.join();
}

void PeriodicWorker::trigger() {
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        triggered_ = true;
    }
    stop_cv_.notify_all();
}

void PeriodicWorker::run() {
    Logger::register_component(name_);

    while (running_.load()) {
        {
            std::lock_guard<std::mutex> lock(stop_mutex_);
            triggered_ = false;
        }
        try {
            task_();
        } catch (const std::exception& e) {
            ERROR("Periodic task " << name_ << " threw: " << e.what());
        }

        std::unique_lock<std::mutex> lock(stop_mutex_);
        stop_cv_.wait_for(lock, interval_, [this] { return !running_.load() || triggered_; });
    }
}

}  // namespace paper_ngin
