#include "scheduler.hpp"
#include <spdlog/spdlog.h>

UpdateScheduler::UpdateScheduler(Task task, std::chrono::milliseconds interval)
    : task_(std::move(task))
    , interval_(interval)
{}

UpdateScheduler::~UpdateScheduler() {
    stop();
}

void UpdateScheduler::start() {
    if (running_.exchange(true)) {
        spdlog::warn("Scheduler already running");
        return;
    }
    
    run_once();
    
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) return;  // stopped during the first run
    
    worker_ = std::thread(&UpdateScheduler::run_loop, this);
    spdlog::info("Scheduler started, interval {}ms", interval_.count());
}

void UpdateScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    
    if (worker_.joinable()) {
        worker_.join();
        spdlog::info("Scheduler stopped");
    }
}

void UpdateScheduler::run_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    
    while (running_) {
        if (cv_.wait_for(lock, interval_, [this] { return !running_; })) {
            break;
        }
        
        lock.unlock();
        run_once();
        lock.lock();
    }
}

void UpdateScheduler::run_once() {
    try {
        task_();
    } catch (const std::exception& e) {
        spdlog::error("Scheduled task failed: {}", e.what());
    }
    run_count_++;
}
