#pragma once

#include "../model/CodeBlock.hpp"

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace streaming
{

// Contiguous slice of the input. Concatenating every chunk's content in index
// order reproduces the input exactly.
struct Chunk
{
    std::size_t index = 0;
    std::string content;
    std::size_t size = 0; // bytes
    std::size_t start_offset = 0;
};

// Created once per chunk and never mutated after it enters the ChunkBuffer.
struct ChunkResult
{
    std::size_t index = 0;
    bool success = true;
    std::vector<model::CodeBlock> parsed_blocks;
    std::vector<model::CodeBlock> translated_blocks;
    std::optional<std::string> error;
    std::vector<std::string> warnings;
    std::chrono::milliseconds processing_time{ 0 };
};

struct StreamingProgress
{
    std::size_t total_chunks = 0;
    std::size_t processed_chunks = 0;
    std::optional<std::size_t> current_chunk;
    std::size_t bytes_processed = 0;
    std::size_t total_bytes = 0;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    double progressPercentage() const
    {
        if (total_chunks == 0)
            return 0.0;
        return static_cast<double>(processed_chunks) / static_cast<double>(total_chunks) * 100.0;
    }

    bool isComplete() const { return processed_chunks >= total_chunks; }
};

struct MemoryUsage
{
    std::size_t buffer_bytes = 0;
    std::size_t context_window_bytes = 0;
    std::size_t outstanding = 0; // submitted but not yet collected
};

// Separator placed between carried-over context and the chunk's own text.
inline std::string chunkMarker(std::size_t index)
{
    return "# --- Chunk " + std::to_string(index) + " ---";
}

} // namespace streaming
