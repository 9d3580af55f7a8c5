#include "ChunkSizer.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace streaming
{

AdaptiveChunkSizer::AdaptiveChunkSizer(const config::ChunkingConfig& cfg)
    : min_size_(std::max<std::size_t>(1, cfg.min_chunk_size))
    , max_size_(std::max(min_size_, cfg.max_context_length * 2))
    , growth_(cfg.growth_factor > 1.0 ? cfg.growth_factor : 1.0)
    , shrink_(cfg.shrink_factor > 0.0 && cfg.shrink_factor < 1.0 ? cfg.shrink_factor : 0.5)
    , target_(cfg.target_chunk_duration)
    , current_(clamp(cfg.chunk_size))
{
}

std::size_t AdaptiveChunkSizer::clamp(std::size_t size) const
{
    return std::min(max_size_, std::max(min_size_, size));
}

std::size_t AdaptiveChunkSizer::nextChunkSize(std::size_t default_size)
{
    std::lock_guard<std::mutex> lock(mtx_);
    if (current_ == 0)
        current_ = clamp(default_size);
    return current_;
}

void AdaptiveChunkSizer::recordOutcome(std::size_t size, std::chrono::milliseconds duration, bool success)
{
    std::lock_guard<std::mutex> lock(mtx_);
    const std::size_t before = current_;
    if (!success)
    {
        current_ = clamp(static_cast<std::size_t>(static_cast<double>(current_) * shrink_));
    }
    else if (duration < target_)
    {
        auto grown = static_cast<std::size_t>(static_cast<double>(current_) * growth_);
        current_ = clamp(std::max(grown, current_ + 1));
    }

    if (current_ != before)
    {
        PLOG_DEBUG << "Adaptive chunk size " << before << " -> " << current_ << " after chunk of " << size
                   << " bytes (" << duration.count() << " ms, " << (success ? "ok" : "failed") << ")";
    }
}

std::size_t AdaptiveChunkSizer::currentSize() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return current_;
}

} // namespace streaming
