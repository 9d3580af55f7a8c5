#pragma once

#include "StreamingTypes.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>

namespace streaming
{

// Index-keyed store of finished chunk results. Entries are write-once.
class ChunkBuffer
{
public:
    // Returns false when the index is already buffered.
    bool add(ChunkResult result);
    std::optional<ChunkResult> get(std::size_t index) const;
    bool contains(std::size_t index) const;

    std::size_t size() const;
    std::size_t byteSize() const;
    void clear();

private:
    static std::size_t resultBytes(const ChunkResult& result);

    mutable std::mutex mtx_;
    std::map<std::size_t, ChunkResult> results_;
    std::size_t bytes_ = 0;
};

} // namespace streaming
