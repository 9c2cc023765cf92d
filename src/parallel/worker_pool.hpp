// src/parallel/worker_pool.hpp
#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "../core/error.hpp"

namespace dprof {

// Blocking FIFO. After finish(), pop_blocking() drains what is left and then
// returns false.
template <typename T>
class task_queue {
public:
    void push(T item) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            queue_.push(std::move(item));
        }
        cv_.notify_one();
    }

    bool pop_blocking(T& item) {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait(lock, [this] { return !queue_.empty() || finished_; });
        if (queue_.empty()) return false;
        item = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    void finish() {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            finished_ = true;
        }
        cv_.notify_all();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return queue_.size();
    }

private:
    mutable std::mutex      mtx_;
    std::queue<T>           queue_;
    std::condition_variable cv_;
    bool                    finished_ = false;
};

// Fixed set of worker threads fed from one task_queue. Results come back
// through std::future; an exception thrown by a task is stored in its future.
class worker_pool {
public:
    explicit worker_pool(std::size_t workers, std::string name = "pool")
        : name_(std::move(name))
    {
        if (workers == 0) throw configuration_error("worker pool '" + name_ + "' needs at least one worker");
        workers_.reserve(workers);
        for (std::size_t i = 0; i < workers; ++i) {
            workers_.emplace_back(&worker_pool::worker_thread, this, i);
        }
        spdlog::debug("{}: started {} workers", name_, workers);
    }

    ~worker_pool() { shutdown(); }

    worker_pool(const worker_pool&) = delete;
    worker_pool& operator=(const worker_pool&) = delete;

    template <class F>
    auto submit(F&& fn) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
        using result_t = std::invoke_result_t<std::decay_t<F>>;
        if (stopping_.load()) throw error("worker pool '" + name_ + "' is shutting down");

        auto task = std::make_shared<std::packaged_task<result_t()>>(std::forward<F>(fn));
        std::future<result_t> fut = task->get_future();
        tasks_.push([task]() { (*task)(); });
        return fut;
    }

    // Lets queued tasks finish, then joins every worker. Idempotent.
    void shutdown() {
        if (stopping_.exchange(true)) return;
        tasks_.finish();
        for (auto& w : workers_) {
            if (w.joinable()) w.join();
        }
        spdlog::debug("{}: stopped after {} tasks", name_, completed_.load());
    }

    std::size_t size() const noexcept { return workers_.size(); }
    std::size_t completed_tasks() const noexcept { return completed_.load(); }
    std::size_t pending_tasks() const { return tasks_.size(); }

private:
    void worker_thread(std::size_t worker_id) {
        std::function<void()> task;
        while (tasks_.pop_blocking(task)) {
            try {
                task();
            } catch (const std::exception& e) {
                // packaged_task stores task exceptions; this is only reached
                // when the promise itself cannot be satisfied.
                spdlog::error("{}: worker #{} task failed: {}", name_, worker_id, e.what());
            }
            ++completed_;
        }
    }

    std::string                        name_;
    std::vector<std::thread>           workers_;
    task_queue<std::function<void()>>  tasks_;
    std::atomic<std::size_t>           completed_{0};
    std::atomic<bool>                  stopping_{false};
};

}
