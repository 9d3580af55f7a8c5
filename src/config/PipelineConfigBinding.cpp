#include "PipelineConfigBinding.hpp"

#include "ConfigManager.hpp"
#include "../translate/TranslatorHelpers.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cstdint>

namespace config
{

namespace
{

template <typename T>
void clampLogged(const char* key, T& value, T lo, T hi)
{
    const T clamped = std::min(hi, std::max(lo, value));
    if (clamped != value)
    {
        PLOG_WARNING << "Config value " << key << "=" << value << " out of range [" << lo << ", " << hi
                     << "], using " << clamped;
        value = clamped;
    }
}

void clampMs(const char* key, std::chrono::milliseconds& value, std::int64_t lo, std::int64_t hi)
{
    auto count = static_cast<std::int64_t>(value.count());
    clampLogged(key, count, lo, hi);
    value = std::chrono::milliseconds(count);
}

// TOML integers are signed; negative sizes clamp to zero before the cast.
std::size_t toSize(std::int64_t v)
{
    return v < 0 ? 0 : static_cast<std::size_t>(v);
}

void loadStreaming(const toml::table& t, StreamConfig& s)
{
    if (auto v = t["enable_streaming"].value<bool>())
        s.enable_streaming = *v;
    if (auto v = t["min_file_size_for_streaming"].value<std::int64_t>())
        s.min_file_size_for_streaming = toSize(*v);
    if (auto v = t["max_concurrent_chunks"].value<int>())
        s.max_concurrent_chunks = *v;
    if (auto v = t["max_queue_size"].value<int>())
        s.max_queue_size = *v;
    if (auto v = t["chunk_timeout_ms"].value<std::int64_t>())
        s.chunk_timeout = std::chrono::milliseconds(*v);
    if (auto v = t["progress_callback_interval_ms"].value<std::int64_t>())
        s.progress_callback_interval = std::chrono::milliseconds(*v);
    if (auto v = t["maintain_context_window"].value<bool>())
        s.maintain_context_window = *v;
    if (auto v = t["context_window_size"].value<std::int64_t>())
        s.context_window_size = toSize(*v);
    if (auto v = t["enable_backpressure"].value<bool>())
        s.enable_backpressure = *v;
    if (auto v = t["thread_pool_size"].value<int>())
        s.thread_pool_size = *v;
}

toml::table saveStreaming(const StreamConfig& s)
{
    toml::table t;
    t.insert("enable_streaming", s.enable_streaming);
    t.insert("min_file_size_for_streaming", static_cast<std::int64_t>(s.min_file_size_for_streaming));
    t.insert("max_concurrent_chunks", s.max_concurrent_chunks);
    t.insert("max_queue_size", s.max_queue_size);
    t.insert("chunk_timeout_ms", static_cast<std::int64_t>(s.chunk_timeout.count()));
    t.insert("progress_callback_interval_ms", static_cast<std::int64_t>(s.progress_callback_interval.count()));
    t.insert("maintain_context_window", s.maintain_context_window);
    t.insert("context_window_size", static_cast<std::int64_t>(s.context_window_size));
    t.insert("enable_backpressure", s.enable_backpressure);
    t.insert("thread_pool_size", s.thread_pool_size);
    return t;
}

void loadChunking(const toml::table& t, ChunkingConfig& c)
{
    if (auto v = t["chunk_size"].value<std::int64_t>())
        c.chunk_size = toSize(*v);
    if (auto v = t["max_context_length"].value<std::int64_t>())
        c.max_context_length = toSize(*v);
    if (auto v = t["adaptive_chunking_enabled"].value<bool>())
        c.adaptive_chunking_enabled = *v;
    if (auto v = t["growth_factor"].value<double>())
        c.growth_factor = *v;
    if (auto v = t["shrink_factor"].value<double>())
        c.shrink_factor = *v;
    if (auto v = t["min_chunk_size"].value<std::int64_t>())
        c.min_chunk_size = toSize(*v);
    if (auto v = t["target_chunk_duration_ms"].value<std::int64_t>())
        c.target_chunk_duration = std::chrono::milliseconds(*v);
}

toml::table saveChunking(const ChunkingConfig& c)
{
    toml::table t;
    t.insert("chunk_size", static_cast<std::int64_t>(c.chunk_size));
    t.insert("max_context_length", static_cast<std::int64_t>(c.max_context_length));
    t.insert("adaptive_chunking_enabled", c.adaptive_chunking_enabled);
    t.insert("growth_factor", c.growth_factor);
    t.insert("shrink_factor", c.shrink_factor);
    t.insert("min_chunk_size", static_cast<std::int64_t>(c.min_chunk_size));
    t.insert("target_chunk_duration_ms", static_cast<std::int64_t>(c.target_chunk_duration.count()));
    return t;
}

void loadAssembler(const toml::table& t, AssemblerConfig& a)
{
    if (auto v = t["indent_size"].value<int>())
        a.indent_size = *v;
    if (auto v = t["max_line_length"].value<std::int64_t>())
        a.max_line_length = toSize(*v);
    if (auto v = t["preserve_comments"].value<bool>())
        a.preserve_comments = *v;
    if (auto v = t["preserve_docstrings"].value<bool>())
        a.preserve_docstrings = *v;
    if (auto v = t["auto_import_common"].value<bool>())
        a.auto_import_common = *v;
}

toml::table saveAssembler(const AssemblerConfig& a)
{
    toml::table t;
    t.insert("indent_size", a.indent_size);
    t.insert("max_line_length", static_cast<std::int64_t>(a.max_line_length));
    t.insert("preserve_comments", a.preserve_comments);
    t.insert("preserve_docstrings", a.preserve_docstrings);
    t.insert("auto_import_common", a.auto_import_common);
    return t;
}

} // namespace

void sanitizePipelineConfig(PipelineConfig& cfg)
{
    auto& s = cfg.streaming;
    clampLogged("streaming.max_concurrent_chunks", s.max_concurrent_chunks, 1, 64);
    clampLogged("streaming.max_queue_size", s.max_queue_size, 0, 1024);
    clampLogged("streaming.thread_pool_size", s.thread_pool_size, 1, 64);
    clampMs("streaming.chunk_timeout_ms", s.chunk_timeout, 1, 3600000);
    clampMs("streaming.progress_callback_interval_ms", s.progress_callback_interval, 10, 60000);

    auto& c = cfg.chunking;
    clampLogged<std::size_t>("chunking.max_context_length", c.max_context_length, 1, 1 << 24);
    clampLogged<std::size_t>("chunking.chunk_size", c.chunk_size, 1, c.max_context_length * 2);
    clampLogged<std::size_t>("chunking.min_chunk_size", c.min_chunk_size, 1, c.max_context_length * 2);
    clampLogged("chunking.growth_factor", c.growth_factor, 1.0, 4.0);
    clampLogged("chunking.shrink_factor", c.shrink_factor, 0.05, 0.95);
    clampMs("chunking.target_chunk_duration_ms", c.target_chunk_duration, 1, 3600000);

    auto& a = cfg.assembler;
    clampLogged("assembler.indent_size", a.indent_size, 1, 8);
    clampLogged<std::size_t>("assembler.max_line_length", a.max_line_length, 20, 1000);

    clampLogged<std::size_t>("translation.max_input_length", cfg.max_input_length, 1,
                             translate::helpers::LengthLimits::MODEL_INPUT_HARD_MAX);
    if (cfg.target_language.empty())
    {
        PLOG_WARNING << "Config value translation.target_language is empty, using python";
        cfg.target_language = "python";
    }
}

bool bindPipelineConfig(ConfigManager& manager, PipelineConfig& cfg)
{
    bool ok = true;

    {
        TableCallbacks cb;
        cb.load = [&cfg](const toml::table& section) {
            loadStreaming(section, cfg.streaming);
            sanitizePipelineConfig(cfg);
        };
        cb.save = [&cfg]() -> toml::table { return saveStreaming(cfg.streaming); };
        ok &= manager.registerTable("streaming", std::move(cb),
                                    { "enable_streaming", "min_file_size_for_streaming", "max_concurrent_chunks",
                                      "max_queue_size", "chunk_timeout_ms", "progress_callback_interval_ms",
                                      "maintain_context_window", "context_window_size", "enable_backpressure",
                                      "thread_pool_size" });
    }

    {
        TableCallbacks cb;
        cb.load = [&cfg](const toml::table& section) {
            loadChunking(section, cfg.chunking);
            sanitizePipelineConfig(cfg);
        };
        cb.save = [&cfg]() -> toml::table { return saveChunking(cfg.chunking); };
        ok &= manager.registerTable("chunking", std::move(cb),
                                    { "chunk_size", "max_context_length", "adaptive_chunking_enabled",
                                      "growth_factor", "shrink_factor", "min_chunk_size",
                                      "target_chunk_duration_ms" });
    }

    {
        TableCallbacks cb;
        cb.load = [&cfg](const toml::table& section) {
            loadAssembler(section, cfg.assembler);
            sanitizePipelineConfig(cfg);
        };
        cb.save = [&cfg]() -> toml::table { return saveAssembler(cfg.assembler); };
        ok &= manager.registerTable("assembler", std::move(cb),
                                    { "indent_size", "max_line_length", "preserve_comments", "preserve_docstrings",
                                      "auto_import_common" });
    }

    {
        TableCallbacks cb;
        cb.load = [&cfg](const toml::table& section) {
            if (auto v = section["target_language"].value<std::string>())
                cfg.target_language = *v;
            if (auto v = section["max_input_length"].value<std::int64_t>())
                cfg.max_input_length = toSize(*v);
            sanitizePipelineConfig(cfg);
        };
        cb.save = [&cfg]() -> toml::table {
            toml::table t;
            t.insert("target_language", cfg.target_language);
            t.insert("max_input_length", static_cast<std::int64_t>(cfg.max_input_length));
            return t;
        };
        ok &= manager.registerTable("translation", std::move(cb), { "target_language", "max_input_length" });
    }

    return ok;
}

} // namespace config
