#pragma once

#include "../config/PipelineConfig.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>

namespace streaming
{

// Proposes the size of the next chunk. Proposals are clamped by ChunkSource,
// so a sizer never has to know the hard cap.
class IChunkSizer
{
public:
    virtual ~IChunkSizer() = default;
    virtual std::size_t nextChunkSize(std::size_t default_size) = 0;
    // Called once per collected chunk with its size and wall time.
    virtual void recordOutcome(std::size_t size, std::chrono::milliseconds duration, bool success) = 0;
};

class FixedChunkSizer final : public IChunkSizer
{
public:
    std::size_t nextChunkSize(std::size_t default_size) override { return default_size; }
    void recordOutcome(std::size_t, std::chrono::milliseconds, bool) override {}
};

// Shrinks after a failure, grows after a success faster than the target
// duration, otherwise keeps the current size. Bounded by
// [min_chunk_size, 2 * max_context_length].
class AdaptiveChunkSizer final : public IChunkSizer
{
public:
    explicit AdaptiveChunkSizer(const config::ChunkingConfig& cfg);

    std::size_t nextChunkSize(std::size_t default_size) override;
    void recordOutcome(std::size_t size, std::chrono::milliseconds duration, bool success) override;

    std::size_t currentSize() const;

private:
    std::size_t clamp(std::size_t size) const;

    std::size_t min_size_;
    std::size_t max_size_;
    double growth_;
    double shrink_;
    std::chrono::milliseconds target_;

    mutable std::mutex mtx_;
    std::size_t current_ = 0;
};

} // namespace streaming
