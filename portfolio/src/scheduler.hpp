#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

/**
 * Runs a task once synchronously on start(), then every interval on a single
 * worker thread until stop(). Runs never overlap.
 */
class UpdateScheduler {
public:
    using Task = std::function<void()>;
    
    UpdateScheduler(Task task, std::chrono::milliseconds interval);
    ~UpdateScheduler();
    
    UpdateScheduler(const UpdateScheduler&) = delete;
    UpdateScheduler& operator=(const UpdateScheduler&) = delete;
    
    void start();
    void stop();
    
    bool is_running() const { return running_; }
    uint64_t run_count() const { return run_count_.load(); }

private:
    Task task_;
    std::chrono::milliseconds interval_;
    
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> run_count_{0};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_;
    
    void run_loop();
    void run_once();
};
