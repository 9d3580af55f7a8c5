#pragma once

#include "StreamingTypes.hpp"
#include "ProgressReporter.hpp"
#include "../config/PipelineConfig.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace parsing
{
class IBlockParser;
}

namespace translate
{
class ITranslator;
}

namespace streaming
{

class IEventSink;
class IChunkSizer;

// Collaborators chosen once by the caller. parser and translator are
// required; a null event sink or sizer is replaced by a built-in default.
// Unless collaborators_thread_safe is set, parser and translator calls are
// serialized with a mutex.
struct PipelineCapabilities
{
    parsing::IBlockParser* parser = nullptr;
    translate::ITranslator* translator = nullptr;
    IEventSink* events = nullptr;
    IChunkSizer* sizer = nullptr;
    bool collaborators_thread_safe = false;
};

/**
 * @brief Chunked parse/translate orchestrator feeding the CodeAssembler
 *
 * stream() cuts the input into chunks and, per chunk, injects the tail of the
 * previous chunk's translation, parses it, translates every natural-language
 * block and buffers the result by index. With max_concurrent_chunks <= 1 the
 * chunks run in order on the calling thread; otherwise they run on a worker
 * pool with outstanding work bounded by max_concurrent_chunks +
 * max_queue_size (max_concurrent_chunks without backpressure), and results
 * reach the callback in completion order.
 *
 * A chunk that throws, fails to parse or exceeds chunk_timeout becomes a
 * failed ChunkResult; the stream keeps going. stream() is not reentrant.
 */
class StreamingPipeline
{
public:
    using ResultCallback = std::function<void(const ChunkResult&)>;

    StreamingPipeline(config::PipelineConfig config, PipelineCapabilities caps);
    ~StreamingPipeline();

    StreamingPipeline(const StreamingPipeline&) = delete;
    StreamingPipeline& operator=(const StreamingPipeline&) = delete;

    bool shouldStream(const std::string& input) const;

    // Clears buffer, context window and progress before starting. Returns the
    // collected results in the order they were delivered.
    std::vector<ChunkResult> stream(const std::string& input, const ResultCallback& on_result = {});

    // Streams, or processes small inputs as one chunk, then assembles.
    std::string translate(const std::string& input);

    // Buffered chunks 0..N-1 of the last run, in index order, through the
    // assembler. Throws assembly::AssemblyError.
    std::string assembleStreamedCode();

    void addProgressCallback(ProgressCallback cb);

    // Stops submitting new chunks and drops queued work without waiting for
    // chunks already running.
    void cancel();
    bool cancelled() const;

    StreamingProgress progress() const;
    MemoryUsage memoryUsage() const;
    std::size_t peakOutstanding() const;

    void reset();

    // Stops the progress reporter, joins the worker pool and shuts the
    // translator down, once.
    void shutdown();

    const config::PipelineConfig& config() const { return config_; }

private:
    struct Impl;

    config::PipelineConfig config_;
    std::unique_ptr<Impl> impl_;
};

} // namespace streaming
