#pragma once

#include "StreamingTypes.hpp"
#include "ChunkSizer.hpp"
#include "IEventSink.hpp"
#include "../config/PipelineConfig.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace streaming
{

// Lazily cuts the input into contiguous chunks. The sequence is finite and
// cannot be restarted. Sizes proposed by the sizer are clamped to
// [1, 2 * max_context_length]; a change from the previous chunk's size is
// announced to the event sink before the chunk is produced.
class ChunkSource
{
public:
    ChunkSource(std::string_view text, const config::ChunkingConfig& cfg, IChunkSizer& sizer, IEventSink& events);

    std::optional<Chunk> next();

    bool exhausted() const { return pos_ >= text_.size(); }
    std::size_t produced() const { return produced_; }
    std::size_t totalBytes() const { return text_.size(); }
    std::size_t hardCap() const { return hard_cap_; }

    // Chunks produced so far plus the remaining bytes divided by the last
    // chunk size. Exact once the source is exhausted.
    std::size_t estimateTotal() const;

private:
    std::size_t clampSize(std::size_t proposed) const;
    std::size_t findBoundary(std::size_t start, std::size_t size) const;
    void announceResize(std::size_t size);

    std::string_view text_;
    std::size_t default_size_;
    std::size_t hard_cap_;
    IChunkSizer& sizer_;
    IEventSink& events_;

    std::size_t pos_ = 0;
    std::size_t produced_ = 0;
    std::size_t last_size_ = 0;
};

} // namespace streaming
