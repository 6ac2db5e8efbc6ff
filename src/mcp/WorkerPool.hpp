// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace mcprt
{

/// @brief Fixed-size thread pool with a bounded task queue.
///
/// Tasks must not throw; an escaping exception is logged and the worker keeps running.
/// Queued tasks are still executed when the pool is stopped.
class WorkerPool
{
  public:
    using Task = std::function<void()>;

    /// @param threadCount Number of worker threads (at least one is started).
    /// @param queueLimit Maximum number of tasks waiting for a worker.
    WorkerPool(size_t threadCount, size_t queueLimit);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// @brief Queues a task.
    /// @return DispatcherOverloaded if the queue is full, InvalidArgument after stop().
    [[nodiscard]] auto submit(Task task) -> VoidResult;

    /// @brief Runs the remaining queued tasks and joins all workers.
    void stop();

    [[nodiscard]] auto threadCount() const noexcept -> size_t { return _workers.size(); }
    [[nodiscard]] auto queueLimit() const noexcept -> size_t { return _queueLimit; }
    [[nodiscard]] auto pendingCount() const -> size_t;

  private:
    void workerLoop();

    size_t _queueLimit;
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::deque<Task> _queue;
    bool _stopping = false;
    std::vector<std::jthread> _workers;
};

} // namespace mcprt
