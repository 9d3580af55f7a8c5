#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace config
{

// Streaming behaviour. Copied into the pipeline at construction and never
// mutated afterwards.
struct StreamConfig
{
    bool enable_streaming = true;
    std::size_t min_file_size_for_streaming = 1024 * 100; // 100KB
    int max_concurrent_chunks = 3;
    int max_queue_size = 10;
    std::chrono::milliseconds chunk_timeout{ 30000 };
    std::chrono::milliseconds progress_callback_interval{ 500 };
    bool maintain_context_window = true;
    std::size_t context_window_size = 1024; // characters of previous code passed as context
    bool enable_backpressure = true;
    int thread_pool_size = 4;
};

struct ChunkingConfig
{
    std::size_t chunk_size = 4096;
    std::size_t max_context_length = 2048; // chunks never exceed twice this
    bool adaptive_chunking_enabled = false;
    double growth_factor = 1.25;
    double shrink_factor = 0.5;
    std::size_t min_chunk_size = 256;
    std::chrono::milliseconds target_chunk_duration{ 2000 };
};

struct AssemblerConfig
{
    int indent_size = 4;
    std::size_t max_line_length = 88;
    bool preserve_comments = true;
    bool preserve_docstrings = true;
    bool auto_import_common = true;
};

struct PipelineConfig
{
    StreamConfig streaming;
    ChunkingConfig chunking;
    AssemblerConfig assembler;
    std::string target_language = "python";
    std::size_t max_input_length = 10000; // per translation request
};

} // namespace config
