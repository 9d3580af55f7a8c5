#pragma once

#include "../utils/IShutdownable.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace streaming
{

// Fixed-size thread pool. abort() drops queued tasks without waiting for the
// running ones; the pool stays usable afterwards. Shutdown() drops queued
// tasks and joins every worker.
class WorkerPool : public utils::IShutdownable
{
public:
    explicit WorkerPool(std::size_t thread_count);
    ~WorkerPool() override;

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Returns false once the pool has been shut down.
    bool submit(std::function<void()> task);

    // Returns the number of queued tasks that were discarded.
    std::size_t abort();

    std::size_t threadCount() const { return workers_.size(); }
    std::size_t queued() const;
    std::size_t active() const { return active_.load(std::memory_order_relaxed); }

    const char* Name() const override { return "WorkerPool"; }
    void Shutdown() override;

private:
    void workerLoop();

    std::vector<std::thread> workers_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> tasks_;
    bool stopping_ = false;
    std::atomic<std::size_t> active_{ 0 };
};

} // namespace streaming
