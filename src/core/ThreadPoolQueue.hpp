#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../interfaces/ILogger.hpp"

struct TimedTask {
    std::function<void()> task;
    std::chrono::steady_clock::time_point enqueued_time;
};

// Fixed pool of workers draining a FIFO queue. Used for remote-tier I/O, read-through
// backfills and admin request handling.
class ThreadPoolQueue {
public:
    ThreadPoolQueue(
        size_t thread_count,
        std::shared_ptr<ILogger> logger,
        std::string name = "ThreadPoolQueue")
        : logger_(std::move(logger)),
          name_(std::move(name)),
          shutdown_(false) {
        if (thread_count == 0) {
            thread_count = 1;
        }
        threads_.reserve(thread_count);
        for (size_t i = 0; i < thread_count; ++i) {
            threads_.emplace_back([this] { worker_thread(); });
        }
        logger_->setup(name_ + " initialized with " + std::to_string(thread_count) + " threads");
    }

    ~ThreadPoolQueue() {
        shutdown(false);
    }

    ThreadPoolQueue(const ThreadPoolQueue&) = delete;
    ThreadPoolQueue& operator=(const ThreadPoolQueue&) = delete;

    // Returns false once shutdown has begun.
    bool enqueue(std::function<void()> fn) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (shutdown_) {
                logger_->warn("Attempted to enqueue task on shut down " + name_ + ".");
                return false;
            }
            task_queue_.push_back({std::move(fn), std::chrono::steady_clock::now()});
        }
        cv_.notify_one();
        return true;
    }

    // With drain, queued tasks still run before the workers exit; otherwise they are dropped.
    void shutdown(bool drain = true) {
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (shutdown_) {
                return;
            }
            shutdown_ = true;
            if (!drain && !task_queue_.empty()) {
                logger_->warn(name_ + " dropping " + std::to_string(task_queue_.size()) + " queued task(s) on shutdown.");
                task_queue_.clear();
            }
        }
        logger_->debug("Shutting down " + name_ + "...");
        cv_.notify_all();
        for (std::thread& t : threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
        idle_cv_.notify_all();
        logger_->debug(name_ + " shut down complete.");
    }

    // Blocks until nothing is queued or running, or the timeout passes.
    bool waitIdle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        return idle_cv_.wait_for(lock, timeout, [this] { return task_queue_.empty() && active_ == 0; });
    }

    // Queued plus running.
    size_t pending() const {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        return task_queue_.size() + active_;
    }

private:
    void worker_thread() {
        while (true) {
            TimedTask current_task;
            {
                std::unique_lock<std::mutex> lock(queue_mutex_);
                cv_.wait(lock, [this] { return !task_queue_.empty() || shutdown_; });
                if (task_queue_.empty()) {
                    return; // shutdown requested and nothing left to run
                }
                current_task = std::move(task_queue_.front());
                task_queue_.pop_front();
                ++active_;
            }

            auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - current_task.enqueued_time);
            if (waited.count() > 1000) {
                logger_->warn(name_ + " task waited " + std::to_string(waited.count()) + "ms in queue.");
            }

            try {
                current_task.task();
            } catch (const std::exception& e) {
                logger_->error("Exception caught in " + name_ + " task: " + std::string(e.what()));
            }

            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                --active_;
            }
            idle_cv_.notify_all();
        }
    }

    std::shared_ptr<ILogger> logger_;
    std::string name_;
    std::deque<TimedTask> task_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::vector<std::thread> threads_;
    size_t active_ = 0;
    bool shutdown_;
};
