#include <catch2/catch_test_macros.hpp>
#include "streaming/StreamingPipeline.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/fake_collaborators.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace streaming;
using namespace std::chrono_literals;
using test_utils::LineBlockParser;
using test_utils::RecordingEventSink;
using test_utils::ScriptedTranslator;

namespace {

config::PipelineConfig makeConfig(int concurrency) {
    config::PipelineConfig cfg;
    cfg.chunking.chunk_size = 64;
    cfg.chunking.max_context_length = 64;
    cfg.streaming.max_concurrent_chunks = concurrency;
    cfg.streaming.max_queue_size = 2;
    cfg.streaming.thread_pool_size = 4;
    cfg.streaming.min_file_size_for_streaming = 1;
    cfg.streaming.progress_callback_interval = 10ms;
    return cfg;
}

// One line per chunk: every line is longer than half the chunk size.
config::PipelineConfig lineConfig(int concurrency) {
    auto cfg = makeConfig(concurrency);
    cfg.chunking.chunk_size = 24;
    return cfg;
}

std::size_t countOf(const std::string& haystack, const std::string& needle) {
    std::size_t n = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1))
        ++n;
    return n;
}

std::vector<std::size_t> indicesOf(const std::vector<ChunkResult>& results) {
    std::vector<std::size_t> out;
    for (const auto& r : results)
        out.push_back(r.index);
    return out;
}

} // namespace

TEST_CASE("Pipeline requires parser and translator", "[streaming][pipeline]") {
    LineBlockParser parser;
    ScriptedTranslator translator;
    REQUIRE_THROWS_AS(StreamingPipeline(makeConfig(1), PipelineCapabilities{nullptr, &translator}),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(StreamingPipeline(makeConfig(1), PipelineCapabilities{&parser, nullptr}),
                      std::invalid_argument);
}

TEST_CASE("shouldStream honours size threshold and switch", "[streaming][pipeline]") {
    LineBlockParser parser;
    ScriptedTranslator translator;
    auto cfg = makeConfig(1);
    cfg.streaming.min_file_size_for_streaming = 10;

    StreamingPipeline pipeline(cfg, {&parser, &translator});
    REQUIRE_FALSE(pipeline.shouldStream("short"));
    REQUIRE(pipeline.shouldStream("long enough input"));

    cfg.streaming.enable_streaming = false;
    StreamingPipeline disabled(cfg, {&parser, &translator});
    REQUIRE_FALSE(disabled.shouldStream("long enough input"));
}

TEST_CASE("Sequential streaming processes chunks in order", "[streaming][pipeline]") {
    LineBlockParser parser;
    ScriptedTranslator translator;
    RecordingEventSink events;
    StreamingPipeline pipeline(makeConfig(1), {&parser, &translator, &events});

    const std::string input = test_utils::makePseudoProgram(12);
    std::vector<std::size_t> delivered;
    auto results = pipeline.stream(input, [&delivered](const ChunkResult& r) { delivered.push_back(r.index); });

    REQUIRE(results.size() > 1);
    for (std::size_t i = 0; i < results.size(); ++i) {
        REQUIRE(results[i].index == i);
        REQUIRE(results[i].success);
    }
    REQUIRE(delivered == indicesOf(results));

    auto progress = pipeline.progress();
    REQUIRE(progress.total_chunks == results.size());
    REQUIRE(progress.processed_chunks == results.size());
    REQUIRE(progress.bytes_processed == input.size());
    REQUIRE(progress.total_bytes == input.size());
    REQUIRE(progress.isComplete());
    REQUIRE(progress.errors.empty());
    REQUIRE(pipeline.peakOutstanding() == 1);

    const std::string code = pipeline.assembleStreamedCode();
    for (int i = 0; i < 12; ++i) {
        REQUIRE(countOf(code, "def step_" + std::to_string(i) + "():") == 1);
        REQUIRE(countOf(code, "counter_" + std::to_string(i) + " = ") == 1);
    }
}

TEST_CASE("Context is carried between chunks", "[streaming][pipeline]") {
    LineBlockParser parser;
    ScriptedTranslator translator;

    SECTION("Previous translation is injected and passed as translation context") {
        auto cfg = makeConfig(1);
        cfg.streaming.context_window_size = 16;
        StreamingPipeline pipeline(cfg, {&parser, &translator});
        auto results = pipeline.stream(test_utils::makePseudoProgram(8));
        REQUIRE(results.size() > 1);
        REQUIRE(parser.contextInjections() > 0);

        bool saw_context = false;
        for (const auto& ctx : translator.contexts()) {
            REQUIRE(ctx.contains("chunk_index"));
            REQUIRE(ctx.contains("after"));
            REQUIRE(ctx["code"] == ctx["before"]);
            const auto before = ctx["before"].get<std::string>();
            REQUIRE(before.size() <= 16);
            if (ctx["chunk_index"].get<std::size_t>() == 0)
                REQUIRE(before.empty());
            else if (!before.empty())
                saw_context = true;
        }
        REQUIRE(saw_context);
        REQUIRE(pipeline.memoryUsage().context_window_bytes > 0);
    }

    SECTION("Injection can be switched off") {
        auto cfg = makeConfig(1);
        cfg.streaming.maintain_context_window = false;
        StreamingPipeline pipeline(cfg, {&parser, &translator});
        pipeline.stream(test_utils::makePseudoProgram(8));
        REQUIRE(parser.contextInjections() == 0);
    }
}

TEST_CASE("Parallel streaming assembles the same program as sequential", "[streaming][pipeline]") {
    const std::string input = test_utils::makePseudoProgram(30);

    LineBlockParser seq_parser;
    ScriptedTranslator seq_translator;
    StreamingPipeline sequential(makeConfig(1), {&seq_parser, &seq_translator});
    auto seq_results = sequential.stream(input);
    const std::string expected = sequential.assembleStreamedCode();

    LineBlockParser par_parser;
    ScriptedTranslator par_translator;
    par_translator.jitter = 15ms;
    PipelineCapabilities caps{&par_parser, &par_translator};
    caps.collaborators_thread_safe = true;
    StreamingPipeline parallel(makeConfig(4), caps);
    auto par_results = parallel.stream(input);

    REQUIRE(par_results.size() == seq_results.size());
    auto indices = indicesOf(par_results);
    std::sort(indices.begin(), indices.end());
    for (std::size_t i = 0; i < indices.size(); ++i)
        REQUIRE(indices[i] == i);

    REQUIRE(parallel.assembleStreamedCode() == expected);
    REQUIRE(parallel.progress().isComplete());
}

TEST_CASE("Parallel streaming bounds outstanding work", "[streaming][pipeline][backpressure]") {
    LineBlockParser parser;
    ScriptedTranslator translator;
    translator.delay = 3ms;
    translator.jitter = 5ms;
    PipelineCapabilities caps{&parser, &translator};
    caps.collaborators_thread_safe = true;

    const std::string input = test_utils::makePseudoProgram(40);

    SECTION("With backpressure the bound is concurrency plus queue") {
        auto cfg = makeConfig(2);
        cfg.streaming.max_queue_size = 1;
        StreamingPipeline pipeline(cfg, caps);

        std::size_t worst = 0;
        auto results = pipeline.stream(input, [&](const ChunkResult&) {
            worst = std::max(worst, pipeline.memoryUsage().outstanding);
        });
        REQUIRE(results.size() > 3);
        REQUIRE(worst <= 3);
        REQUIRE(pipeline.peakOutstanding() <= 3);
        REQUIRE(pipeline.peakOutstanding() >= 2);
        REQUIRE(pipeline.memoryUsage().outstanding == 0);
    }

    SECTION("Without backpressure the bound is the concurrency") {
        auto cfg = makeConfig(2);
        cfg.streaming.max_queue_size = 5;
        cfg.streaming.enable_backpressure = false;
        StreamingPipeline pipeline(cfg, caps);
        pipeline.stream(input);
        REQUIRE(pipeline.peakOutstanding() <= 2);
    }
}

TEST_CASE("Collaborators are serialized unless declared thread-safe", "[streaming][pipeline]") {
    LineBlockParser parser;
    ScriptedTranslator translator;
    translator.delay = 2ms;
    StreamingPipeline pipeline(makeConfig(4), {&parser, &translator});

    auto results = pipeline.stream(test_utils::makePseudoProgram(20));
    REQUIRE_FALSE(results.empty());
    REQUIRE(translator.maxConcurrentCalls() == 1);
    REQUIRE(parser.maxConcurrentCalls() == 1);
}

TEST_CASE("Chunk failures are contained", "[streaming][pipeline]") {
    utils::ErrorReporter::ClearErrors();
    LineBlockParser parser;
    ScriptedTranslator translator;
    StreamingPipeline pipeline(lineConfig(1), {&parser, &translator});

    const std::string input = "PSEUDO: alpha\n"
                              "!!THROW here\n"
                              "!!PARSE_ERROR\n"
                              "PSEUDO: fail me\n"
                              "PSEUDO: throw me\n"
                              "PSEUDO: omega\n";
    auto results = pipeline.stream(input);
    REQUIRE(results.size() == 6);

    REQUIRE(results[0].success);

    REQUIRE_FALSE(results[1].success);
    REQUIRE(results[1].error == std::optional<std::string>("parser exploded"));

    REQUIRE_FALSE(results[2].success);
    REQUIRE(results[2].error.value_or("").rfind("Parse error: ", 0) == 0);

    REQUIRE(results[3].success);
    REQUIRE(results[3].warnings == std::vector<std::string>{"Translation error: Translation failed: model refused"});
    REQUIRE(results[3].translated_blocks.size() == 1);
    REQUIRE(results[3].translated_blocks[0].type == model::BlockType::NaturalLanguage);

    REQUIRE(results[4].success);
    REQUIRE(results[4].warnings == std::vector<std::string>{"Translation error: translator exploded"});

    REQUIRE(results[5].success);

    auto progress = pipeline.progress();
    REQUIRE(progress.processed_chunks == 6);
    REQUIRE(progress.errors.size() == 2);
    REQUIRE(progress.warnings.size() == 2);
    REQUIRE(utils::ErrorReporter::HasPendingErrors());

    const std::string code = pipeline.assembleStreamedCode();
    REQUIRE(code.find("def alpha():") != std::string::npos);
    REQUIRE(code.find("def omega():") != std::string::npos);
    REQUIRE(code.find("fail me") == std::string::npos);
    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("Slow chunks time out and the stream continues", "[streaming][pipeline][timeout]") {
    LineBlockParser parser;
    ScriptedTranslator translator;
    const std::string input = "PSEUDO: slow one\nPSEUDO: fast two\n";

    SECTION("Sequential") {
        translator.slowDelay = 150ms;
        auto cfg = lineConfig(1);
        cfg.streaming.chunk_timeout = 50ms;
        StreamingPipeline pipeline(cfg, {&parser, &translator});

        auto results = pipeline.stream(input);
        REQUIRE(results.size() == 2);
        REQUIRE_FALSE(results[0].success);
        REQUIRE(results[0].error == std::optional<std::string>("Chunk 0 timed out after 50 ms"));
        REQUIRE(results[1].success);

        const std::string code = pipeline.assembleStreamedCode();
        REQUIRE(code.find("slow_one") == std::string::npos);
        REQUIRE(code.find("def fast_two():") != std::string::npos);
    }

    SECTION("Parallel collector stops waiting at the deadline") {
        translator.slowDelay = 600ms;
        auto cfg = lineConfig(2);
        cfg.streaming.chunk_timeout = 100ms;
        PipelineCapabilities caps{&parser, &translator};
        caps.collaborators_thread_safe = true;
        StreamingPipeline pipeline(cfg, caps);

        const auto start = std::chrono::steady_clock::now();
        auto results = pipeline.stream(input);
        const auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(elapsed < 450ms);
        REQUIRE(results.size() == 2);
        for (const auto& r : results) {
            if (r.index == 0) {
                REQUIRE_FALSE(r.success);
                REQUIRE(r.error == std::optional<std::string>("Chunk 0 timed out after 100 ms"));
            } else {
                REQUIRE(r.success);
            }
        }

        // The late result is discarded, never buffered.
        std::this_thread::sleep_for(700ms);
        REQUIRE(pipeline.assembleStreamedCode().find("slow_one") == std::string::npos);
        REQUIRE(pipeline.progress().processed_chunks == 2);
    }
}

TEST_CASE("Cancellation stops submissions without waiting", "[streaming][pipeline][cancel]") {
    LineBlockParser parser;
    ScriptedTranslator translator;
    translator.slowDelay = 400ms;
    RecordingEventSink events;

    std::string input = "PSEUDO: quick zero\n";
    for (int i = 1; i < 12; ++i)
        input += "PSEUDO: slow " + std::to_string(i) + "\n";

    SECTION("Parallel") {
        auto cfg = lineConfig(2);
        cfg.streaming.max_queue_size = 0;
        PipelineCapabilities caps{&parser, &translator, &events};
        caps.collaborators_thread_safe = true;
        StreamingPipeline pipeline(cfg, caps);

        const auto start = std::chrono::steady_clock::now();
        auto results = pipeline.stream(input, [&pipeline](const ChunkResult&) { pipeline.cancel(); });
        const auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(pipeline.cancelled());
        REQUIRE(elapsed < 300ms);
        REQUIRE(results.size() < 12);
        REQUIRE_FALSE(pipeline.progress().isComplete());
        REQUIRE(events.completions() == std::vector<std::size_t>{results.size()});
        REQUIRE(pipeline.memoryUsage().outstanding == 0);
    }

    SECTION("Sequential") {
        translator.slowDelay = 10ms;
        PipelineCapabilities caps{&parser, &translator, &events};
        StreamingPipeline pipeline(lineConfig(1), caps);
        auto results = pipeline.stream(input, [&pipeline](const ChunkResult&) { pipeline.cancel(); });
        REQUIRE(results.size() == 1);
        REQUIRE(events.completions() == std::vector<std::size_t>{1});

        // A new stream clears the cancellation.
        auto again = pipeline.stream("PSEUDO: quick again\n");
        REQUIRE(again.size() == 1);
        REQUIRE_FALSE(pipeline.cancelled());
    }

    SECTION("Cancel from another thread while a stream starts") {
        translator.slowDelay = 0ms;
        PipelineCapabilities caps{&parser, &translator, &events};
        StreamingPipeline pipeline(makeConfig(2), caps);
        const std::string program = test_utils::makePseudoProgram(5);

        std::atomic<bool> stop{false};
        std::thread canceller([&] {
            while (!stop.load())
                pipeline.cancel();
        });
        auto interrupted = pipeline.stream(program);
        stop.store(true);
        canceller.join();

        REQUIRE(pipeline.memoryUsage().outstanding == 0);

        auto full = pipeline.stream(program);
        REQUIRE_FALSE(pipeline.cancelled());
        REQUIRE(interrupted.size() <= full.size());
        REQUIRE(std::all_of(full.begin(), full.end(), [](const ChunkResult& r) { return r.success; }));
    }
}

TEST_CASE("Pipeline events", "[streaming][pipeline][events]") {
    LineBlockParser parser;
    ScriptedTranslator translator;
    RecordingEventSink events;

    SECTION("Every collected chunk is reported once") {
        StreamingPipeline pipeline(makeConfig(1), {&parser, &translator, &events});
        auto results = pipeline.stream(test_utils::makePseudoProgram(10));

        auto chunks = events.chunks();
        REQUIRE(chunks.size() == results.size());
        for (std::size_t i = 0; i < chunks.size(); ++i) {
            REQUIRE(chunks[i].index == results[i].index);
            REQUIRE(chunks[i].success == results[i].success);
        }
        REQUIRE(events.completions() == std::vector<std::size_t>{results.size()});
    }

    SECTION("Adaptive sizing announces growth") {
        auto cfg = makeConfig(1);
        cfg.chunking.adaptive_chunking_enabled = true;
        cfg.chunking.chunk_size = 32;
        cfg.chunking.min_chunk_size = 16;
        cfg.chunking.max_context_length = 64;
        StreamingPipeline pipeline(cfg, {&parser, &translator, &events});
        pipeline.stream(test_utils::makePseudoProgram(20));

        auto resizes = events.resizes();
        REQUIRE_FALSE(resizes.empty());
        REQUIRE(resizes.front().direction == "increase");
        REQUIRE(resizes.front().next > resizes.front().previous);
    }

    SECTION("A throwing sink does not disturb the stream") {
        events.throwOnEvents = true;
        StreamingPipeline pipeline(makeConfig(2), {&parser, &translator, &events});
        auto results = pipeline.stream(test_utils::makePseudoProgram(10));
        REQUIRE_FALSE(results.empty());
        for (const auto& r : results)
            REQUIRE(r.success);
        REQUIRE(events.completions().size() == 1);
    }

    SECTION("Non-standard exceptions from sinks and result callbacks are contained") {
        events.throwNonStandard = true;
        StreamingPipeline pipeline(makeConfig(2), {&parser, &translator, &events});
        std::size_t seen = 0;
        auto results = pipeline.stream(test_utils::makePseudoProgram(10), [&seen](const ChunkResult&) {
            ++seen;
            throw 1;
        });
        REQUIRE_FALSE(results.empty());
        REQUIRE(seen == results.size());
        for (const auto& r : results)
            REQUIRE(r.success);
        REQUIRE(events.completions().size() == 1);
    }
}

TEST_CASE("Progress callbacks receive snapshots", "[streaming][pipeline][progress]") {
    LineBlockParser parser;
    ScriptedTranslator translator;
    translator.delay = 3ms;
    StreamingPipeline pipeline(makeConfig(1), {&parser, &translator});

    std::atomic<int> calls{0};
    StreamingProgress last;
    std::mutex m;
    pipeline.addProgressCallback([&](const StreamingProgress& p) {
        ++calls;
        std::lock_guard<std::mutex> lock(m);
        last = p;
    });
    pipeline.addProgressCallback([](const StreamingProgress&) { throw std::runtime_error("ignored"); });

    auto results = pipeline.stream(test_utils::makePseudoProgram(20));
    REQUIRE(calls.load() >= 1);
    std::lock_guard<std::mutex> lock(m);
    REQUIRE(last.isComplete());
    REQUIRE(last.processed_chunks == results.size());
    REQUIRE(last.progressPercentage() == 100.0);
}

TEST_CASE("translate() handles small and large inputs", "[streaming][pipeline]") {
    LineBlockParser parser;
    ScriptedTranslator translator;
    auto cfg = makeConfig(1);
    cfg.streaming.min_file_size_for_streaming = 200;
    StreamingPipeline pipeline(cfg, {&parser, &translator});

    SECTION("Small input runs as a single chunk") {
        const std::string code = pipeline.translate("PSEUDO: greet user\nname = 'x'\n");
        REQUIRE(code.find("def greet_user():") != std::string::npos);
        REQUIRE(code.find("name = 'x'") != std::string::npos);
        REQUIRE(pipeline.progress().total_chunks == 1);
    }

    SECTION("Large input is streamed") {
        const std::string input = test_utils::makePseudoProgram(20);
        REQUIRE(pipeline.shouldStream(input));
        const std::string code = pipeline.translate(input);
        REQUIRE(code.find("def step_19():") != std::string::npos);
        REQUIRE(pipeline.progress().total_chunks > 1);
    }

    SECTION("Empty input yields empty output") {
        REQUIRE(pipeline.translate("").empty());
    }
}

TEST_CASE("reset and shutdown", "[streaming][pipeline]") {
    LineBlockParser parser;
    ScriptedTranslator translator;
    StreamingPipeline pipeline(makeConfig(2), {&parser, &translator});

    pipeline.stream(test_utils::makePseudoProgram(6));
    REQUIRE(pipeline.memoryUsage().buffer_bytes > 0);

    pipeline.reset();
    auto usage = pipeline.memoryUsage();
    REQUIRE(usage.buffer_bytes == 0);
    REQUIRE(usage.context_window_bytes == 0);
    REQUIRE(pipeline.progress().processed_chunks == 0);
    REQUIRE(pipeline.assembleStreamedCode().empty());

    pipeline.shutdown();
    REQUIRE(translator.shutdownCalls() == 1);
    pipeline.shutdown();
    REQUIRE(translator.shutdownCalls() == 1);

    utils::ErrorReporter::ClearErrors();
    REQUIRE(pipeline.stream(test_utils::makePseudoProgram(2)).empty());
    utils::ErrorReporter::ClearErrors();
}
