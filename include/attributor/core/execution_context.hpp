/**
 * @file execution_context.hpp
 * @brief Execution context abstraction for batch work
 *
 * Batch jobs (e.g. training over thousands of intrusion sets) can be fanned
 * out over an execution context supplied by the caller. The attribution core
 * never creates one on its own; it only submits tasks to the context it is
 * handed.
 *
 * @date 2025
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

namespace attributor {
namespace core {

/**
 * @class ExecutionContext
 * @brief Runs independent tasks, possibly in parallel
 *
 * Implementations must run every submitted task exactly once and report
 * task exceptions through the returned future.
 */
class ExecutionContext {
public:
    virtual ~ExecutionContext() = default;

    /**
     * @brief Schedule a task
     * @return Future completing when the task has run
     */
    virtual std::future<void> Submit(std::function<void()> task) = 0;

    /**
     * @brief Maximum number of tasks expected to run at once
     */
    virtual std::size_t Parallelism() const = 0;
};

/**
 * @class LocalExecutionContext
 * @brief In-process context backed by a fixed pool of worker threads
 *
 * At most Parallelism() tasks run at once; the rest wait in a FIFO queue.
 * Destruction drains the queue and joins the workers.
 *
 * **Usage Example**:
 * @code
 * LocalExecutionContext context(4);
 * auto done = context.Submit([] { DoWork(); });
 * done.get();  // rethrows task exceptions
 * @endcode
 */
class LocalExecutionContext : public ExecutionContext {
public:
    /**
     * @param parallelism Worker count; 0 means hardware concurrency
     */
    explicit LocalExecutionContext(std::size_t parallelism = 0,
                                   std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());
    ~LocalExecutionContext() override;

    LocalExecutionContext(const LocalExecutionContext&) = delete;
    LocalExecutionContext& operator=(const LocalExecutionContext&) = delete;

    std::future<void> Submit(std::function<void()> task) override;
    std::size_t Parallelism() const override { return parallelism_; }

private:
    void WorkerLoop();

    std::size_t parallelism_;
    std::shared_ptr<spdlog::logger> logger_;

    std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<std::packaged_task<void()>> queue_;
    bool stopping_ = false;
    std::vector<std::thread> workers_;
};

} // namespace core
} // namespace attributor
