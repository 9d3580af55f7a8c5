#pragma once

#include "StreamingTypes.hpp"
#include "../utils/IShutdownable.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace streaming
{

using ProgressCallback = std::function<void(const StreamingProgress&)>;

// Periodically hands a progress snapshot to every registered callback on a
// dedicated thread. Callback exceptions are logged and do not stop the timer.
class ProgressReporter : public utils::IShutdownable
{
public:
    using SnapshotFn = std::function<StreamingProgress()>;

    ProgressReporter(SnapshotFn snapshot, std::chrono::milliseconds interval);
    ~ProgressReporter() override;

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    void addCallback(ProgressCallback cb);
    bool hasCallbacks() const;

    // Starting twice is a no-op. Returns false when no thread was started.
    bool start();
    // Stops and joins the timer thread, then delivers one final snapshot.
    void stop();
    bool running() const;

    const char* Name() const override { return "ProgressReporter"; }
    void Shutdown() override { stop(); }

private:
    void tick();

    SnapshotFn snapshot_;
    std::chrono::milliseconds interval_;

    mutable std::mutex cb_mtx_;
    std::vector<ProgressCallback> callbacks_;

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::thread worker_;
};

} // namespace streaming
