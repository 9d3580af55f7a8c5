#include "WorkerPool.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <exception>

namespace streaming
{

WorkerPool::WorkerPool(std::size_t thread_count)
{
    const std::size_t n = std::max<std::size_t>(1, thread_count);
    workers_.reserve(n);
    for (std::size_t i = 0; i < n; ++i)
        workers_.emplace_back(&WorkerPool::workerLoop, this);
    PLOG_DEBUG << "WorkerPool started with " << n << " threads";
}

WorkerPool::~WorkerPool()
{
    Shutdown();
}

bool WorkerPool::submit(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopping_)
            return false;
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

std::size_t WorkerPool::abort()
{
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        dropped = tasks_.size();
        tasks_.clear();
    }
    if (dropped > 0)
        PLOG_INFO << "WorkerPool aborted, discarded " << dropped << " queued task(s)";
    return dropped;
}

std::size_t WorkerPool::queued() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return tasks_.size();
}

void WorkerPool::Shutdown()
{
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopping_)
            return;
        stopping_ = true;
        tasks_.clear();
    }
    cv_.notify_all();
    for (auto& worker : workers_)
    {
        if (worker.joinable())
            worker.join();
    }
    PLOG_DEBUG << "WorkerPool shutdown complete";
}

void WorkerPool::workerLoop()
{
    while (true)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (stopping_)
                return;
            task = std::move(tasks_.front());
            tasks_.pop_front();
            active_.fetch_add(1, std::memory_order_relaxed);
        }

        try
        {
            task();
        }
        catch (const std::exception& ex)
        {
            PLOG_ERROR << "WorkerPool task threw: " << ex.what();
        }
        active_.fetch_sub(1, std::memory_order_relaxed);
    }
}

} // namespace streaming
