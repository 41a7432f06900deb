#pragma once
#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <stdexcept>
#include <iostream>

namespace ddcore {

// Fixed number of threads draining one job queue. Jobs are expected to
// handle their own errors; an escaping exception is logged and dropped so
// the worker survives.
class WorkerPool {
public:
    explicit WorkerPool(size_t threads) {
        if (threads == 0) threads = 1;
        for (size_t i = 0; i < threads; ++i) {
            workers_.emplace_back([this]() { run_loop(); });
        }
    }

    ~WorkerPool() { shutdown(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(std::function<void()> job) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) throw std::runtime_error("worker pool is shut down");
            jobs_.push(std::move(job));
        }
        cv_.notify_one();
    }

    // Finishes queued jobs, then joins every worker
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_ && workers_.empty()) return;
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto& t : workers_) {
            if (t.joinable()) t.join();
        }
        workers_.clear();
    }

    size_t size() const { return workers_.size(); }

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> jobs_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;

    void run_loop() {
        while (true) {
            std::function<void()> job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
                if (jobs_.empty()) return;
                job = std::move(jobs_.front());
                jobs_.pop();
            }
            try {
                job();
            } catch (const std::exception& e) {
                std::cerr << "[subagent] Worker job failed: " << e.what() << "\n";
            }
        }
    }
};

} // namespace ddcore
