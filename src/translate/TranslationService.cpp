#include "TranslationService.hpp"

#include "TranslationRequestBuilder.hpp"
#include "../assembly/SourceScanner.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cctype>
#include <exception>

namespace translate
{

namespace
{

std::string lowercase(const std::string& s)
{
    std::string out;
    out.reserve(s.size());
    for (char c : s)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    return out;
}

bool isPython(const std::string& target_language)
{
    const auto lower = lowercase(target_language);
    return lower.empty() || lower == "python" || lower == "py";
}

double secondsSince(std::chrono::steady_clock::time_point start)
{
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // namespace

TranslationService::TranslationService(IModelBackend* backend, std::size_t max_input_length,
                                       std::string prompt_template)
    : backend_(backend)
    , max_input_length_(max_input_length == 0 ? helpers::LengthLimits::MODEL_INPUT_MAX : max_input_length)
    , prompt_template_(std::move(prompt_template))
{
    PLOG_DEBUG << "TranslationService initialized with backend " << (backend_ ? backend_->name() : "<none>");
}

TranslationService::~TranslationService()
{
    shutdown();
}

bool TranslationService::isReady() const
{
    return backend_ != nullptr && running_.load(std::memory_order_relaxed);
}

void TranslationService::shutdown()
{
    if (running_.exchange(false))
        PLOG_DEBUG << "TranslationService shutdown complete";
}

TranslationOutcome TranslationService::translate(const std::string& text, const std::string& target_language,
                                                 const nlohmann::json& context)
{
    const auto start = std::chrono::steady_clock::now();

    nlohmann::json ctx = context.is_object() ? context : nlohmann::json::object();
    ctx["translation_id"] = next_id_.fetch_add(1, std::memory_order_relaxed);
    ctx["approach"] = "llm_first";
    ctx["input_length"] = text.size();

    if (!isReady())
        return fail("Translation service is not ready", ctx, target_language, text.size(), start);

    auto length_check = helpers::check_text_length(text, max_input_length_, backend_->name());
    if (!length_check.ok)
        return fail("Input validation failed: " + length_check.error_message, ctx, target_language, text.size(),
                    start);

    auto request = build_translation_request(text, target_language, ctx, prompt_template_);
    PLOG_DEBUG << "Starting LLM translation for ID: " << ctx["translation_id"].get<std::uint64_t>();

    std::optional<std::string> raw;
    try
    {
        raw = backend_->generate(request.prompt, request.target_language, request.context);
    }
    catch (const std::exception& ex)
    {
        return fail(std::string("LLM translation failed: ") + ex.what(), ctx, target_language, text.size(), start);
    }

    if (!raw)
        return fail("Model returned empty or invalid result", ctx, target_language, text.size(), start);

    std::string code = postProcess(*raw, request.target_language);
    if (code.empty())
        return fail("Model returned empty or invalid result", ctx, target_language, text.size(), start);

    TranslationOutcome outcome;
    outcome.success = true;
    outcome.code = std::move(code);
    outcome.warnings = validateGeneratedCode(outcome.code, request.target_language);
    outcome.metadata = makeMetadata(ctx, request.target_language, text.size(), start, true);

    {
        std::lock_guard<std::mutex> lock(stats_mtx_);
        ++successful_;
        total_processing_seconds_ += secondsSince(start);
    }
    return outcome;
}

TranslationOutcome TranslationService::fail(std::string error, const nlohmann::json& context,
                                            const std::string& target_language, std::size_t input_length,
                                            std::chrono::steady_clock::time_point start)
{
    {
        std::lock_guard<std::mutex> lock(stats_mtx_);
        ++failed_;
    }
    PLOG_WARNING << "LLM translation failed: " << error;
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Translation, "Translation failed", error);

    TranslationOutcome outcome;
    outcome.success = false;
    outcome.errors.push_back(std::move(error));
    outcome.metadata = makeMetadata(context, target_language, input_length, start, false);
    return outcome;
}

nlohmann::json TranslationService::makeMetadata(const nlohmann::json& context, const std::string& target_language,
                                                std::size_t input_length,
                                                std::chrono::steady_clock::time_point start, bool success) const
{
    const auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::steady_clock::now() - start)
                                 .count();
    return nlohmann::json{
        { "translation_id", context.value("translation_id", std::uint64_t{ 0 }) },
        { "approach", "llm_first" },
        { "duration_ms", duration_ms },
        { "target_language", target_language.empty() ? std::string("python") : target_language },
        { "input_length", input_length },
        { "success", success },
        { "service", "TranslationService" },
    };
}

std::string TranslationService::postProcess(const std::string& raw_code, const std::string& target_language)
{
    std::string code = helpers::strip_code_fences(raw_code);
    if (isPython(target_language))
        code = helpers::expand_tabs(code, 4);
    return code;
}

std::vector<std::string> TranslationService::validateGeneratedCode(const std::string& code,
                                                                   const std::string& target_language)
{
    std::vector<std::string> warnings;

    if (code.find_first_not_of(" \t\r\n") == std::string::npos)
    {
        warnings.emplace_back("Generated code is empty");
        return warnings;
    }

    if (isPython(target_language))
    {
        std::string error;
        if (!assembly::SourceScanner::check(code, &error))
            warnings.push_back("Python syntax error: " + error);
    }

    if (std::count(code.begin(), code.end(), '\n') < 1)
        warnings.emplace_back("Generated code seems too short");

    if (code.find("TODO") != std::string::npos || code.find("FIXME") != std::string::npos)
        warnings.emplace_back("Generated code contains TODO/FIXME comments");

    return warnings;
}

TranslationStatistics TranslationService::statistics() const
{
    std::lock_guard<std::mutex> lock(stats_mtx_);
    TranslationStatistics stats;
    stats.successful = successful_;
    stats.failed = failed_;
    stats.total = successful_ + failed_;
    stats.success_rate_percent =
        stats.total > 0 ? static_cast<double>(successful_) / static_cast<double>(stats.total) * 100.0 : 0.0;
    stats.average_processing_seconds =
        successful_ > 0 ? total_processing_seconds_ / static_cast<double>(successful_) : 0.0;
    stats.total_processing_seconds = total_processing_seconds_;
    return stats;
}

void TranslationService::resetStatistics()
{
    std::lock_guard<std::mutex> lock(stats_mtx_);
    successful_ = 0;
    failed_ = 0;
    total_processing_seconds_ = 0.0;
    PLOG_DEBUG << "LLM translation statistics reset";
}

} // namespace translate
