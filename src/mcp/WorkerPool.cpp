// SPDX-License-Identifier: Apache-2.0
#include "WorkerPool.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <format>

namespace mcprt
{

WorkerPool::WorkerPool(size_t threadCount, size_t queueLimit): _queueLimit(queueLimit)
{
    threadCount = std::max<size_t>(threadCount, 1);
    _workers.reserve(threadCount);
    for (size_t i = 0; i < threadCount; ++i)
        _workers.emplace_back([this] { workerLoop(); });

    log::debug("Worker pool started with {} thread(s), queue limit {}", threadCount, queueLimit);
}

WorkerPool::~WorkerPool()
{
    stop();
}

auto WorkerPool::submit(Task task) -> VoidResult
{
    {
        auto lock = std::lock_guard(_mutex);
        if (_stopping)
            return makeError(ErrorCode::InvalidArgument, "Worker pool is stopped");
        if (_queue.size() >= _queueLimit)
            return makeError(ErrorCode::DispatcherOverloaded,
                             std::format("Worker queue is full ({} pending)", _queue.size()));
        _queue.push_back(std::move(task));
    }
    _cv.notify_one();
    return {};
}

void WorkerPool::stop()
{
    {
        auto lock = std::lock_guard(_mutex);
        if (_stopping)
            return;
        _stopping = true;
    }
    _cv.notify_all();

    for (auto& worker: _workers)
    {
        if (worker.joinable())
            worker.join();
    }
    log::debug("Worker pool stopped");
}

auto WorkerPool::pendingCount() const -> size_t
{
    auto lock = std::lock_guard(_mutex);
    return _queue.size();
}

void WorkerPool::workerLoop()
{
    while (true)
    {
        auto task = Task {};
        {
            auto lock = std::unique_lock(_mutex);
            _cv.wait(lock, [this] { return _stopping || !_queue.empty(); });
            if (_queue.empty())
                return;
            task = std::move(_queue.front());
            _queue.pop_front();
        }

        try
        {
            task();
        }
        catch (const std::exception& e)
        {
            log::error("Worker task failed: {}", e.what());
        }
        catch (...)
        {
            log::error("Worker task failed with an unknown exception");
        }
    }
}

} // namespace mcprt
