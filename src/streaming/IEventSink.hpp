#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace streaming
{

// Best-effort notifications. The pipeline catches and logs anything thrown
// from these, so a faulty sink never affects a run.
class IEventSink
{
public:
    virtual ~IEventSink() = default;

    // direction is "increase" or "decrease"
    virtual void onResizeDecision(std::size_t previous_size, std::size_t next_size, const std::string& direction) = 0;
    virtual void onChunkProcessed(std::size_t index, bool success, std::chrono::milliseconds duration) = 0;
    virtual void onStreamCompleted(std::size_t processed_chunks) = 0;
};

class NullEventSink final : public IEventSink
{
public:
    void onResizeDecision(std::size_t, std::size_t, const std::string&) override {}
    void onChunkProcessed(std::size_t, bool, std::chrono::milliseconds) override {}
    void onStreamCompleted(std::size_t) override {}
};

} // namespace streaming
