#pragma once

#include "IModelBackend.hpp"
#include "ITranslator.hpp"
#include "TranslatorHelpers.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace translate
{

struct TranslationStatistics
{
    std::uint64_t successful = 0;
    std::uint64_t failed = 0;
    std::uint64_t total = 0;
    double success_rate_percent = 0.0;
    double average_processing_seconds = 0.0; // over successful translations
    double total_processing_seconds = 0.0;
};

/**
 * @brief LLM-first translator over an injected model backend
 *
 * Validates the input length, renders the fixed prompt, asks the backend for
 * code, strips Markdown fences, expands tabs and checks the generated code.
 * Problems with otherwise usable output (syntax errors, very short code,
 * TODO markers) become warnings; only missing output is a failure.
 *
 * Thread-safe as long as the backend is.
 */
class TranslationService : public ITranslator
{
public:
    explicit TranslationService(IModelBackend* backend,
                                std::size_t max_input_length = helpers::LengthLimits::MODEL_INPUT_MAX,
                                std::string prompt_template = {});
    ~TranslationService() override;

    bool isReady() const override;
    TranslationOutcome translate(const std::string& text, const std::string& target_language,
                                 const nlohmann::json& context) override;
    void shutdown() override;

    TranslationStatistics statistics() const;
    void resetStatistics();

    static std::string postProcess(const std::string& raw_code, const std::string& target_language);
    static std::vector<std::string> validateGeneratedCode(const std::string& code,
                                                          const std::string& target_language);

private:
    TranslationOutcome fail(std::string error, const nlohmann::json& context, const std::string& target_language,
                            std::size_t input_length, std::chrono::steady_clock::time_point start);
    nlohmann::json makeMetadata(const nlohmann::json& context, const std::string& target_language,
                                std::size_t input_length, std::chrono::steady_clock::time_point start,
                                bool success) const;

    IModelBackend* backend_;
    std::size_t max_input_length_;
    std::string prompt_template_;

    std::atomic<bool> running_{ true };
    std::atomic<std::uint64_t> next_id_{ 1 };

    mutable std::mutex stats_mtx_;
    std::uint64_t successful_ = 0;
    std::uint64_t failed_ = 0;
    double total_processing_seconds_ = 0.0;
};

} // namespace translate
