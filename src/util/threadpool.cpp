// Copyright (c) 2024 Bridgescout
// Distributed under the MIT software license

#include "util/threadpool.hpp"

namespace bridgescout {
namespace util {

ThreadPool::ThreadPool(size_t num_threads)
    : stop_(false)
{
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) {
            num_threads = 4;  // Fallback if hardware_concurrency() fails
        }
    }

    workers_.reserve(num_threads);
    for(size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this] {
            while(true) {
                std::function<void()> task;

                {
                    std::unique_lock<std::mutex> lock(this->queue_mutex_);
                    this->condition_.wait(lock, [this]{
                        return this->stop_ || !this->tasks_.empty();
                    });

                    if(this->stop_ && this->tasks_.empty()) {
                        return;
                    }

                    task = std::move(this->tasks_.front());
                    this->tasks_.pop();
                }

                task();
            }
        });
    }
}

ThreadPool::~ThreadPool()
{
    Shutdown(false);
}

void ThreadPool::Shutdown(bool discard_pending)
{
    std::queue<std::function<void()>> dropped;
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
        if (discard_pending) {
            std::swap(dropped, tasks_);
        }
    }
    condition_.notify_all();

    for(std::thread &worker: workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    // dropped tasks are destroyed here, outside the lock
}

size_t ThreadPool::pending() const
{
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

} // namespace util
} // namespace bridgescout
