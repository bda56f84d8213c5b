#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <vector>

namespace voxplay::utils {

// Fixed-size worker pool. Tasks run in FIFO order; with a single worker
// this gives a serial background queue.
class ThreadPool {
public:
    explicit ThreadPool(size_t threads = std::thread::hardware_concurrency()) {
        if (threads == 0) {
            threads = 1;
        }
        for (size_t i = 0; i < threads; ++i) {
            this->workers_.emplace_back([this] { this->worker_loop(); });
        }
    }

    template <class F, class... Args>
    auto enqueue(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
        using return_type = std::invoke_result_t<F, Args...>;

        auto task = std::make_shared<std::packaged_task<return_type()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...));

        std::future<return_type> res = task->get_future();
        {
            std::unique_lock<std::mutex> lock(this->queue_mutex_);
            if (this->stop_)
                throw std::runtime_error("enqueue on stopped ThreadPool");
            this->tasks_.emplace([task]() { (*task)(); });
        }
        this->condition_.notify_one();
        return res;
    }

    // Drops tasks that have not started yet. Their futures report broken_promise.
    size_t clear_pending() {
        std::unique_lock<std::mutex> lock(this->queue_mutex_);
        size_t dropped = this->tasks_.size();
        std::queue<std::function<void()>> empty;
        this->tasks_.swap(empty);
        return dropped;
    }

    size_t pending() const {
        std::unique_lock<std::mutex> lock(this->queue_mutex_);
        return this->tasks_.size();
    }

    size_t size() const { return this->workers_.size(); }

    ~ThreadPool() {
        {
            std::unique_lock<std::mutex> lock(this->queue_mutex_);
            this->stop_ = true;
        }
        this->condition_.notify_all();
        for (std::thread& worker : this->workers_) {
            worker.join();
        }
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

private:
    void worker_loop() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(this->queue_mutex_);
                this->condition_.wait(lock, [this] { return this->stop_ || !this->tasks_.empty(); });
                if (this->stop_ && this->tasks_.empty())
                    return;
                task = std::move(this->tasks_.front());
                this->tasks_.pop();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stop_ = false;
};

} // namespace voxplay::utils
