#include "ChunkBuffer.hpp"

#include <plog/Log.h>

namespace streaming
{

std::size_t ChunkBuffer::resultBytes(const ChunkResult& result)
{
    std::size_t bytes = 0;
    for (const auto& block : result.parsed_blocks)
        bytes += block.content.size();
    for (const auto& block : result.translated_blocks)
        bytes += block.content.size();
    return bytes;
}

bool ChunkBuffer::add(ChunkResult result)
{
    std::lock_guard<std::mutex> lock(mtx_);
    const std::size_t index = result.index;
    if (results_.count(index))
    {
        PLOG_WARNING << "Chunk " << index << " is already buffered; ignoring duplicate";
        return false;
    }
    bytes_ += resultBytes(result);
    results_.emplace(index, std::move(result));
    return true;
}

std::optional<ChunkResult> ChunkBuffer::get(std::size_t index) const
{
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = results_.find(index);
    if (it == results_.end())
        return std::nullopt;
    return it->second;
}

bool ChunkBuffer::contains(std::size_t index) const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return results_.count(index) != 0;
}

std::size_t ChunkBuffer::size() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return results_.size();
}

std::size_t ChunkBuffer::byteSize() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return bytes_;
}

void ChunkBuffer::clear()
{
    std::lock_guard<std::mutex> lock(mtx_);
    results_.clear();
    bytes_ = 0;
}

} // namespace streaming
