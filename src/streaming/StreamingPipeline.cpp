#include "StreamingPipeline.hpp"

#include "ChunkBuffer.hpp"
#include "ChunkSizer.hpp"
#include "ChunkSource.hpp"
#include "ContextWindow.hpp"
#include "IEventSink.hpp"
#include "WorkerPool.hpp"
#include "../assembly/CodeAssembler.hpp"
#include "../parsing/IBlockParser.hpp"
#include "../processing/Diagnostics.hpp"
#include "../translate/ITranslator.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/IShutdownable.hpp"
#include "../utils/PendingQueue.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <atomic>
#include <exception>
#include <map>
#include <mutex>
#include <stdexcept>

namespace streaming
{

namespace
{

using Clock = std::chrono::steady_clock;

// Per-chunk handshake between a worker and the collector in parallel mode.
constexpr int kRunning = 0;
constexpr int kCommitted = 1;
constexpr int kAbandoned = 2;

constexpr std::size_t kInjectedContextLines = 10;
constexpr auto kCollectorPoll = std::chrono::milliseconds(50);

std::string joinStrings(const std::vector<std::string>& parts, const char* sep)
{
    std::string out;
    for (const auto& part : parts)
    {
        if (!out.empty())
            out += sep;
        out += part;
    }
    return out;
}

std::vector<std::string> lastLines(const std::string& text, std::size_t count)
{
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size())
    {
        auto nl = text.find('\n', start);
        if (nl == std::string::npos)
        {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    if (lines.size() > count)
        lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(count));
    return lines;
}

std::string timeoutMessage(std::size_t index, std::chrono::milliseconds timeout)
{
    return "Chunk " + std::to_string(index) + " timed out after " + std::to_string(timeout.count()) + " ms";
}

std::chrono::milliseconds elapsedSince(Clock::time_point start)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

} // namespace

struct StreamingPipeline::Impl
{
    struct Pending
    {
        Clock::time_point deadline;
        std::shared_ptr<std::atomic<int>> state;
        std::size_t size = 0;
    };

    Impl(const config::PipelineConfig& cfg, PipelineCapabilities capabilities)
        : cfg(cfg)
        , caps(capabilities)
        , events(capabilities.events ? capabilities.events : &null_events)
        , reporter([this] { return snapshot(); }, cfg.streaming.progress_callback_interval)
        , assembler(cfg.assembler)
    {
        if (caps.sizer)
            sizer = caps.sizer;
        else if (cfg.chunking.adaptive_chunking_enabled)
        {
            adaptive_sizer = std::make_unique<AdaptiveChunkSizer>(cfg.chunking);
            sizer = adaptive_sizer.get();
        }
        else
            sizer = &fixed_sizer;

        // Built once here so cancel() can reach it from any thread.
        const auto& sc = cfg.streaming;
        if (sc.max_concurrent_chunks > 1)
        {
            const auto concurrency = static_cast<std::size_t>(sc.max_concurrent_chunks);
            const auto threads = static_cast<std::size_t>(std::max(1, sc.thread_pool_size));
            pool = std::make_unique<WorkerPool>(std::min(concurrency, threads));
        }

        shutdown_sequence.add(reporter);
        shutdown_sequence.add("WorkerPool",
                              [this]
                              {
                                  if (pool)
                                      pool->Shutdown();
                              });
        shutdown_sequence.add("Translator", [this] { caps.translator->shutdown(); });
    }

    std::unique_lock<std::mutex> lockCollaborators()
    {
        if (caps.collaborators_thread_safe)
            return std::unique_lock<std::mutex>(collab_mtx, std::defer_lock);
        return std::unique_lock<std::mutex>(collab_mtx);
    }

    StreamingProgress snapshot() const
    {
        std::lock_guard<std::mutex> lock(progress_mtx);
        return progress_state;
    }

    void resetState()
    {
        buffer.clear();
        window.clear();
        {
            std::lock_guard<std::mutex> lock(progress_mtx);
            progress_state = StreamingProgress{};
        }
        chunk_count = 0;
        outstanding.store(0);
        peak_outstanding.store(0);
    }

    void setTotals(std::size_t total_chunks, std::size_t total_bytes)
    {
        std::lock_guard<std::mutex> lock(progress_mtx);
        progress_state.total_chunks = total_chunks;
        progress_state.total_bytes = total_bytes;
    }

    void setCurrent(std::size_t index)
    {
        std::lock_guard<std::mutex> lock(progress_mtx);
        progress_state.current_chunk = index;
    }

    void trackOutstanding(std::size_t count)
    {
        outstanding.store(count);
        std::size_t peak = peak_outstanding.load();
        while (count > peak && !peak_outstanding.compare_exchange_weak(peak, count))
        {
        }
    }

    std::string injectContext(const Chunk& chunk) const
    {
        if (!cfg.streaming.maintain_context_window || chunk.index == 0)
            return chunk.content;

        auto prev = buffer.get(chunk.index - 1);
        if (!prev || prev->translated_blocks.empty())
            return chunk.content;

        const auto lines = lastLines(prev->translated_blocks.back().content, kInjectedContextLines);
        if (lines.empty())
            return chunk.content;

        const std::string carried = joinStrings(lines, "\n");
        if (processing::Diagnostics::IsVerbose())
        {
            PLOG_DEBUG_(processing::Diagnostics::kLogInstance)
                << "Chunk " << chunk.index << " carries context: " << processing::Diagnostics::PreviewTail(carried);
        }
        return carried + "\n\n" + chunkMarker(chunk.index) + "\n\n" + chunk.content;
    }

    nlohmann::json translationContext(std::size_t index) const
    {
        nlohmann::json ctx = { { "chunk_index", index }, { "code", "" }, { "before", "" }, { "after", "" } };
        if (index == 0)
            return ctx;

        std::string before;
        if (auto prev = buffer.get(index - 1))
        {
            std::vector<std::string> code;
            for (const auto& block : prev->translated_blocks)
            {
                if (block.type == model::BlockType::TargetCode)
                    code.push_back(block.content);
            }
            before = utf8Tail(joinStrings(code, "\n"), cfg.streaming.context_window_size);
        }
        else
        {
            before = window.recentCode(cfg.streaming.context_window_size, index);
        }
        ctx["before"] = before;
        ctx["code"] = before;
        return ctx;
    }

    ChunkResult timedOut(std::size_t index, Clock::time_point start) const
    {
        ChunkResult result;
        result.index = index;
        result.success = false;
        result.error = timeoutMessage(index, cfg.streaming.chunk_timeout);
        result.processing_time = elapsedSince(start);
        return result;
    }

    // Runs on the caller thread (sequential) or a pool thread (parallel).
    // state is null in sequential mode.
    ChunkResult processChunk(const Chunk& chunk, Clock::time_point deadline, std::atomic<int>* state)
    {
        PROFILE_SCOPE_CUSTOM("streaming.chunk");
        const auto start = Clock::now();

        ChunkResult result;
        result.index = chunk.index;

        try
        {
            const std::string text = injectContext(chunk);

            parsing::ParseResult parsed;
            {
                auto lock = lockCollaborators();
                parsed = caps.parser->parse(text);
            }
            if (!parsed.success)
            {
                result.success = false;
                result.error = "Parse error: " + joinStrings(parsed.errors, ", ");
                result.warnings = std::move(parsed.warnings);
                utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Parsing, "Chunk could not be parsed",
                                                    *result.error);
                result.processing_time = elapsedSince(start);
                return result;
            }
            if (Clock::now() > deadline)
                return timedOut(chunk.index, start);

            result.parsed_blocks = parsed.blocks;
            result.warnings = std::move(parsed.warnings);

            std::vector<model::CodeBlock> translated;
            translated.reserve(parsed.blocks.size());
            for (const auto& block : parsed.blocks)
            {
                if (block.type != model::BlockType::NaturalLanguage)
                {
                    translated.push_back(block);
                    continue;
                }

                auto error = translateBlock(block, chunk.index, translated);
                if (error)
                {
                    PLOG_WARNING << "Translation error in chunk " << chunk.index << ": " << *error;
                    result.warnings.push_back("Translation error: " + *error);
                    translated.push_back(block);
                }
                if (Clock::now() > deadline)
                    return timedOut(chunk.index, start);
            }
            result.translated_blocks = std::move(translated);

            if (Clock::now() > deadline)
                return timedOut(chunk.index, start);

            if (state)
            {
                int expected = kRunning;
                if (!state->compare_exchange_strong(expected, kCommitted))
                {
                    result.success = false;
                    result.error = "Chunk " + std::to_string(chunk.index) + " was abandoned";
                    result.processing_time = elapsedSince(start);
                    return result;
                }
            }

            result.processing_time = elapsedSince(start);
            commit(result);
        }
        catch (const std::exception& ex)
        {
            PLOG_ERROR << "Error in chunk " << chunk.index << ": " << ex.what();
            result.success = false;
            result.error = ex.what();
            result.processing_time = elapsedSince(start);
        }
        catch (...)
        {
            PLOG_ERROR << "Error in chunk " << chunk.index << ": unknown exception";
            result.success = false;
            result.error = "unknown exception";
            result.processing_time = elapsedSince(start);
        }
        return result;
    }

    // Appends the translated block on success, otherwise returns the reason.
    std::optional<std::string> translateBlock(const model::CodeBlock& block, std::size_t chunk_index,
                                              std::vector<model::CodeBlock>& out)
    {
        try
        {
            const auto ctx = translationContext(chunk_index);
            translate::TranslationOutcome outcome;
            {
                auto lock = lockCollaborators();
                outcome = caps.translator->translate(block.content, cfg.target_language, ctx);
            }
            if (!outcome.success || outcome.code.empty())
            {
                return "Translation failed: " +
                       (outcome.errors.empty() ? std::string("No code returned") : joinStrings(outcome.errors, ", "));
            }
            out.push_back(block.withTranslation(std::move(outcome.code)));
            return std::nullopt;
        }
        catch (const std::exception& ex)
        {
            return std::string(ex.what());
        }
        catch (...)
        {
            return std::string("unknown exception");
        }
    }

    void commit(const ChunkResult& result)
    {
        if (!buffer.add(result))
            return;
        for (const auto& block : result.translated_blocks)
        {
            if (block.type == model::BlockType::TargetCode)
                window.push(ContextEntry{ result.index, block.content, block.metadata });
        }
        if (processing::Diagnostics::IsVerbose())
        {
            PLOG_DEBUG_(processing::Diagnostics::kLogInstance)
                << "Chunk " << result.index << " buffered: " << result.parsed_blocks.size() << " parsed, "
                << result.translated_blocks.size() << " translated block(s)";
        }
    }

    void collect(ChunkResult result, std::size_t chunk_size, std::vector<ChunkResult>& results,
                 const ResultCallback& on_result)
    {
        {
            std::lock_guard<std::mutex> lock(progress_mtx);
            ++progress_state.processed_chunks;
            progress_state.bytes_processed += chunk_size;
            progress_state.current_chunk = result.index;
            if (result.error)
                progress_state.errors.push_back(*result.error);
            progress_state.warnings.insert(progress_state.warnings.end(), result.warnings.begin(),
                                           result.warnings.end());
        }

        if (!result.success)
        {
            PLOG_WARNING << "Chunk " << result.index << " failed: " << result.error.value_or("unknown error");
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Streaming, "Chunk processing failed",
                                                result.error.value_or("unknown error"));
        }

        try
        {
            events->onChunkProcessed(result.index, result.success, result.processing_time);
        }
        catch (const std::exception& ex)
        {
            PLOG_WARNING << "Chunk event handler threw: " << ex.what();
        }
        catch (...)
        {
            PLOG_WARNING << "Chunk event handler threw an unknown exception";
        }

        sizer->recordOutcome(chunk_size, result.processing_time, result.success);

        results.push_back(std::move(result));
        if (on_result)
        {
            try
            {
                on_result(results.back());
            }
            catch (const std::exception& ex)
            {
                PLOG_WARNING << "Result callback threw: " << ex.what();
            }
            catch (...)
            {
                PLOG_WARNING << "Result callback threw an unknown exception";
            }
        }
    }

    void runSequential(ChunkSource& source, std::vector<ChunkResult>& results, const ResultCallback& on_result)
    {
        while (!cancel_requested.load())
        {
            auto chunk = source.next();
            if (!chunk)
                break;
            setTotals(source.estimateTotal(), source.totalBytes());
            setCurrent(chunk->index);
            trackOutstanding(1);

            const auto deadline = Clock::now() + cfg.streaming.chunk_timeout;
            auto result = processChunk(*chunk, deadline, nullptr);
            trackOutstanding(0);
            collect(std::move(result), chunk->size, results, on_result);
        }
    }

    void runParallel(ChunkSource& source, std::vector<ChunkResult>& results, const ResultCallback& on_result)
    {
        const auto& sc = cfg.streaming;
        const auto concurrency = static_cast<std::size_t>(std::max(1, sc.max_concurrent_chunks));
        const auto queue_size = static_cast<std::size_t>(std::max(0, sc.max_queue_size));
        const std::size_t bound = sc.enable_backpressure ? concurrency + queue_size : concurrency;

        // Late pushes from abandoned chunks land in a queue nobody reads.
        auto completed = std::make_shared<PendingQueue<ChunkResult>>();
        std::map<std::size_t, Pending> pending;
        bool exhausted = false;

        while (true)
        {
            while (!exhausted && !cancel_requested.load() && pending.size() < bound)
            {
                auto chunk = source.next();
                if (!chunk)
                {
                    exhausted = true;
                    break;
                }
                setTotals(source.estimateTotal(), source.totalBytes());
                setCurrent(chunk->index);

                Pending entry{ Clock::now() + sc.chunk_timeout, std::make_shared<std::atomic<int>>(kRunning),
                               chunk->size };
                const std::size_t index = chunk->index;
                auto task = [this, chunk = std::move(*chunk), deadline = entry.deadline, state = entry.state,
                             completed]() mutable
                {
                    auto result = processChunk(chunk, deadline, state.get());
                    if (state->load() != kAbandoned)
                        completed->push(std::move(result));
                };
                pending.emplace(index, std::move(entry));
                trackOutstanding(pending.size());

                if (!pool->submit(std::move(task)))
                {
                    ChunkResult rejected;
                    rejected.index = index;
                    rejected.success = false;
                    rejected.error = "Worker pool is shut down";
                    const auto size = pending[index].size;
                    pending.erase(index);
                    trackOutstanding(pending.size());
                    collect(std::move(rejected), size, results, on_result);
                    exhausted = true;
                    break;
                }
            }

            if (cancel_requested.load())
            {
                for (auto& [index, entry] : pending)
                    entry.state->store(kAbandoned);
                if (!pending.empty())
                    PLOG_INFO << "Stream cancelled with " << pending.size() << " chunk(s) outstanding";
                pending.clear();
                trackOutstanding(0);
                break;
            }
            if (pending.empty())
                break;

            auto earliest = pending.begin()->second.deadline;
            for (const auto& [index, entry] : pending)
                earliest = std::min(earliest, entry.deadline);
            auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(earliest - Clock::now());
            wait = std::clamp(wait, std::chrono::milliseconds(1), kCollectorPoll);

            std::vector<ChunkResult> ready;
            completed->waitDrain(ready, wait);
            for (auto& result : ready)
            {
                auto it = pending.find(result.index);
                if (it == pending.end())
                {
                    PLOG_DEBUG << "Discarding late result for chunk " << result.index;
                    continue;
                }
                const auto size = it->second.size;
                pending.erase(it);
                trackOutstanding(pending.size());
                collect(std::move(result), size, results, on_result);
            }

            const auto now = Clock::now();
            for (auto it = pending.begin(); it != pending.end();)
            {
                if (it->second.deadline > now)
                {
                    ++it;
                    continue;
                }
                int expected = kRunning;
                if (!it->second.state->compare_exchange_strong(expected, kAbandoned))
                {
                    // Committed; its result is already on the way.
                    ++it;
                    continue;
                }
                const auto index = it->first;
                const auto size = it->second.size;
                const auto submitted = it->second.deadline - sc.chunk_timeout;
                it = pending.erase(it);
                trackOutstanding(pending.size());
                collect(timedOut(index, submitted), size, results, on_result);
            }
        }
    }

    config::PipelineConfig cfg;
    PipelineCapabilities caps;

    NullEventSink null_events;
    IEventSink* events;
    FixedChunkSizer fixed_sizer;
    std::unique_ptr<AdaptiveChunkSizer> adaptive_sizer;
    IChunkSizer* sizer = nullptr;

    ChunkBuffer buffer;
    ContextWindow window;

    mutable std::mutex progress_mtx;
    StreamingProgress progress_state;
    std::size_t chunk_count = 0;

    ProgressReporter reporter;
    std::unique_ptr<WorkerPool> pool;
    std::mutex collab_mtx;

    std::atomic<bool> cancel_requested{ false };
    std::atomic<std::size_t> outstanding{ 0 };
    std::atomic<std::size_t> peak_outstanding{ 0 };

    assembly::CodeAssembler assembler;

    std::mutex shutdown_mtx;
    utils::ShutdownSequence shutdown_sequence;
};

StreamingPipeline::StreamingPipeline(config::PipelineConfig config, PipelineCapabilities caps)
    : config_(std::move(config))
{
    if (!caps.parser)
        throw std::invalid_argument("StreamingPipeline requires a block parser");
    if (!caps.translator)
        throw std::invalid_argument("StreamingPipeline requires a translator");
    impl_ = std::make_unique<Impl>(config_, caps);
}

StreamingPipeline::~StreamingPipeline()
{
    shutdown();
}

bool StreamingPipeline::shouldStream(const std::string& input) const
{
    return config_.streaming.enable_streaming && input.size() >= config_.streaming.min_file_size_for_streaming;
}

std::vector<ChunkResult> StreamingPipeline::stream(const std::string& input, const ResultCallback& on_result)
{
    std::vector<ChunkResult> results;
    {
        std::lock_guard<std::mutex> lock(impl_->shutdown_mtx);
        if (impl_->shutdown_sequence.hasRun())
        {
            PLOG_ERROR << "stream() called after shutdown";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Streaming, "Pipeline is shut down",
                                              "stream() called after shutdown()");
            return results;
        }
    }

    PROFILE_SCOPE_CUSTOM("streaming.stream");
    const auto start = Clock::now();

    impl_->resetState();
    impl_->cancel_requested.store(false);
    impl_->setTotals(0, input.size());

    ChunkSource source(input, config_.chunking, *impl_->sizer, *impl_->events);
    const bool parallel = config_.streaming.max_concurrent_chunks > 1;
    PLOG_INFO << "Streaming " << input.size() << " bytes (" << (parallel ? "parallel" : "sequential") << ")";

    const bool reporting = impl_->reporter.hasCallbacks() && impl_->reporter.start();

    if (parallel)
        impl_->runParallel(source, results, on_result);
    else
        impl_->runSequential(source, results, on_result);

    impl_->chunk_count = source.produced();
    if (source.exhausted())
        impl_->setTotals(source.produced(), input.size());

    if (reporting)
        impl_->reporter.stop();

    const auto processed = impl_->snapshot().processed_chunks;
    try
    {
        impl_->events->onStreamCompleted(processed);
    }
    catch (const std::exception& ex)
    {
        PLOG_WARNING << "Stream completion handler threw: " << ex.what();
    }
    catch (...)
    {
        PLOG_WARNING << "Stream completion handler threw an unknown exception";
    }

    PLOG_INFO << "Stream finished: " << processed << "/" << source.produced() << " chunk(s) in "
              << elapsedSince(start).count() << " ms" << (impl_->cancel_requested.load() ? " (cancelled)" : "");
    return results;
}

std::string StreamingPipeline::translate(const std::string& input)
{
    if (shouldStream(input))
    {
        stream(input);
        return assembleStreamedCode();
    }

    impl_->resetState();
    impl_->cancel_requested.store(false);
    impl_->setTotals(input.empty() ? 0 : 1, input.size());
    if (!input.empty())
    {
        Chunk whole{ 0, input, input.size(), 0 };
        std::vector<ChunkResult> results;
        impl_->setCurrent(0);
        auto result = impl_->processChunk(whole, Clock::now() + config_.streaming.chunk_timeout, nullptr);
        impl_->collect(std::move(result), whole.size, results, {});
        impl_->chunk_count = 1;
    }
    return assembleStreamedCode();
}

std::string StreamingPipeline::assembleStreamedCode()
{
    std::vector<model::CodeBlock> blocks;
    for (std::size_t i = 0; i < impl_->chunk_count; ++i)
    {
        auto result = impl_->buffer.get(i);
        if (!result || result->translated_blocks.empty())
            continue;
        blocks.insert(blocks.end(), result->translated_blocks.begin(), result->translated_blocks.end());
    }
    PLOG_DEBUG << "Assembling " << blocks.size() << " block(s) from " << impl_->chunk_count << " chunk(s)";
    return impl_->assembler.assemble(blocks);
}

void StreamingPipeline::addProgressCallback(ProgressCallback cb)
{
    impl_->reporter.addCallback(std::move(cb));
}

void StreamingPipeline::cancel()
{
    impl_->cancel_requested.store(true);
    if (impl_->pool)
        impl_->pool->abort();
    PLOG_INFO << "Stream cancellation requested";
}

bool StreamingPipeline::cancelled() const
{
    return impl_->cancel_requested.load();
}

StreamingProgress StreamingPipeline::progress() const
{
    return impl_->snapshot();
}

MemoryUsage StreamingPipeline::memoryUsage() const
{
    MemoryUsage usage;
    usage.buffer_bytes = impl_->buffer.byteSize();
    usage.context_window_bytes = impl_->window.byteSize();
    usage.outstanding = impl_->outstanding.load();
    return usage;
}

std::size_t StreamingPipeline::peakOutstanding() const
{
    return impl_->peak_outstanding.load();
}

void StreamingPipeline::reset()
{
    impl_->resetState();
    impl_->cancel_requested.store(false);
}

void StreamingPipeline::shutdown()
{
    if (!impl_)
        return;
    std::lock_guard<std::mutex> lock(impl_->shutdown_mtx);
    if (!impl_->shutdown_sequence.run())
        return;
    for (const auto& failure : impl_->shutdown_sequence.failures())
        PLOG_WARNING << "Shutdown step failed: " << failure;
    PLOG_DEBUG << "StreamingPipeline shutdown complete";
}

} // namespace streaming
