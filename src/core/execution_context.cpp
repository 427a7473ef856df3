/**
 * @file execution_context.cpp
 * @brief Worker-pool backed local execution context
 *
 * @date 2025
 */

#include "attributor/core/execution_context.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace attributor {
namespace core {

LocalExecutionContext::LocalExecutionContext(std::size_t parallelism,
                                             std::shared_ptr<spdlog::logger> logger)
    : parallelism_(parallelism > 0 ? parallelism
                                   : std::max<std::size_t>(1, std::thread::hardware_concurrency()))
    , logger_(std::move(logger)) {
    workers_.reserve(parallelism_);
    for (std::size_t i = 0; i < parallelism_; ++i) {
        workers_.emplace_back(&LocalExecutionContext::WorkerLoop, this);
    }
    logger_->debug("Local execution context with {} workers", parallelism_);
}

LocalExecutionContext::~LocalExecutionContext() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    ready_.notify_all();
    for (auto& worker : workers_) {
        worker.join();
    }
}

std::future<void> LocalExecutionContext::Submit(std::function<void()> task) {
    std::packaged_task<void()> job(std::move(task));
    auto done = job.get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("Execution context is shutting down");
        }
        queue_.push_back(std::move(job));
    }
    ready_.notify_one();
    return done;
}

void LocalExecutionContext::WorkerLoop() {
    while (true) {
        std::packaged_task<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ready_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            // Queued work still runs after shutdown starts
            if (queue_.empty()) {
                return;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        // Task exceptions land in the future
        job();
    }
}

} // namespace core
} // namespace attributor
