#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <string>

namespace translate {

struct TranslationRequest
{
    std::string input_text;
    std::string target_language;
    std::string prompt;
    nlohmann::json context = nlohmann::json::object();
    std::chrono::system_clock::time_point requested_at{};
};

// Fixed prompt used when no template is configured. Placeholders:
// {language} display name of the target language, {source_text} the input.
const std::string& default_prompt_template();

// "python" -> "Python", "cpp" -> "C++"; unknown names are title-cased.
std::string language_display_name(const std::string& lang);

void replace_all(std::string& target, const std::string& placeholder, const std::string& value);

// Build a TranslationRequest for one natural-language segment. An empty
// prompt_template selects default_prompt_template().
TranslationRequest build_translation_request(const std::string& text,
                                             const std::string& target_language,
                                             nlohmann::json context,
                                             const std::string& prompt_template = {});

} // namespace translate
