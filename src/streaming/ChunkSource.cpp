#include "ChunkSource.hpp"

#include "../processing/Diagnostics.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <exception>

namespace streaming
{

namespace
{

bool isUtf8Continuation(char c)
{
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

ChunkSource::ChunkSource(std::string_view text, const config::ChunkingConfig& cfg, IChunkSizer& sizer,
                         IEventSink& events)
    : text_(text)
    , default_size_(cfg.chunk_size)
    , hard_cap_(std::max<std::size_t>(1, cfg.max_context_length * 2))
    , sizer_(sizer)
    , events_(events)
{
}

std::size_t ChunkSource::clampSize(std::size_t proposed) const
{
    return std::min(hard_cap_, std::max<std::size_t>(1, proposed));
}

std::size_t ChunkSource::findBoundary(std::size_t start, std::size_t size) const
{
    const std::size_t limit = std::min(text_.size(), start + size);
    if (limit == text_.size())
        return limit;

    // Cut after the last newline inside the window.
    const auto window = text_.substr(start, limit - start);
    const auto nl = window.rfind('\n');
    if (nl != std::string_view::npos)
        return start + nl + 1;

    // Hard cut, moved back so a multi-byte sequence is not split.
    std::size_t cut = limit;
    while (cut > start + 1 && isUtf8Continuation(text_[cut]))
        --cut;
    return cut;
}

void ChunkSource::announceResize(std::size_t size)
{
    if (last_size_ == 0 || size == last_size_)
        return;

    const char* direction = size > last_size_ ? "increase" : "decrease";
    PLOG_DEBUG << "Chunk size " << direction << ": " << last_size_ << " -> " << size;
    try
    {
        events_.onResizeDecision(last_size_, size, direction);
    }
    catch (const std::exception& ex)
    {
        PLOG_WARNING << "Resize event handler threw: " << ex.what();
    }
    catch (...)
    {
        PLOG_WARNING << "Resize event handler threw an unknown exception";
    }
}

std::optional<Chunk> ChunkSource::next()
{
    if (exhausted())
        return std::nullopt;

    const std::size_t size = clampSize(sizer_.nextChunkSize(default_size_));
    announceResize(size);
    last_size_ = size;

    const std::size_t end = findBoundary(pos_, size);

    Chunk chunk;
    chunk.index = produced_++;
    chunk.start_offset = pos_;
    chunk.content = std::string(text_.substr(pos_, end - pos_));
    chunk.size = chunk.content.size();
    pos_ = end;

    if (processing::Diagnostics::IsVerbose())
    {
        PLOG_DEBUG_(processing::Diagnostics::kLogInstance)
            << "Chunk " << chunk.index << " @" << chunk.start_offset << " (" << chunk.size
            << " bytes): " << processing::Diagnostics::Preview(chunk.content);
    }
    return chunk;
}

std::size_t ChunkSource::estimateTotal() const
{
    if (exhausted())
        return produced_;
    const std::size_t per_chunk = last_size_ > 0 ? last_size_ : clampSize(default_size_);
    const std::size_t remaining = text_.size() - pos_;
    return produced_ + (remaining + per_chunk - 1) / per_chunk;
}

} // namespace streaming
