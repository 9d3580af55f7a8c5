#include "ProgressReporter.hpp"

#include <plog/Log.h>

#include <exception>

namespace streaming
{

ProgressReporter::ProgressReporter(SnapshotFn snapshot, std::chrono::milliseconds interval)
    : snapshot_(std::move(snapshot))
    , interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(500))
{
}

ProgressReporter::~ProgressReporter()
{
    stop();
}

void ProgressReporter::addCallback(ProgressCallback cb)
{
    if (!cb)
        return;
    std::lock_guard<std::mutex> lock(cb_mtx_);
    callbacks_.push_back(std::move(cb));
}

bool ProgressReporter::hasCallbacks() const
{
    std::lock_guard<std::mutex> lock(cb_mtx_);
    return !callbacks_.empty();
}

bool ProgressReporter::start()
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (worker_.joinable() || !snapshot_)
        return false;
    stop_ = false;
    worker_ = std::thread(
        [this]
        {
            std::unique_lock<std::mutex> lk(mtx_);
            while (!stop_)
            {
                if (cv_.wait_for(lk, interval_, [this] { return stop_; }))
                    break;
                lk.unlock();
                tick();
                lk.lock();
            }
        });
    return true;
}

void ProgressReporter::stop()
{
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (!worker_.joinable())
            return;
        stop_ = true;
    }
    cv_.notify_all();
    worker_.join();
    tick();
}

bool ProgressReporter::running() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return worker_.joinable() && !stop_;
}

void ProgressReporter::tick()
{
    std::vector<ProgressCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(cb_mtx_);
        callbacks = callbacks_;
    }
    if (callbacks.empty())
        return;

    const StreamingProgress snap = snapshot_();
    for (const auto& cb : callbacks)
    {
        try
        {
            cb(snap);
        }
        catch (const std::exception& ex)
        {
            PLOG_WARNING << "Progress callback error: " << ex.what();
        }
        catch (...)
        {
            PLOG_WARNING << "Progress callback error: unknown exception";
        }
    }
}

} // namespace streaming
