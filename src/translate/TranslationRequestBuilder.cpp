#include "TranslationRequestBuilder.hpp"

#include <cctype>

namespace translate
{

const std::string& default_prompt_template()
{
    static const std::string tmpl = R"(Translate the following pseudocode to {language}:

Pseudocode:
{source_text}

Requirements:
- Generate clean, readable {language} code
- Include appropriate comments for clarity
- Follow {language} naming conventions
- Ensure proper syntax and structure
- Handle edge cases appropriately

{language} Code:)";
    return tmpl;
}

std::string language_display_name(const std::string& lang)
{
    std::string lower;
    lower.reserve(lang.size());
    for (char c : lang)
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (lower.empty())
        return "target language";
    if (lower == "python" || lower == "py")
        return "Python";
    if (lower == "javascript" || lower == "js")
        return "JavaScript";
    if (lower == "typescript" || lower == "ts")
        return "TypeScript";
    if (lower == "cpp" || lower == "c++")
        return "C++";
    if (lower == "csharp" || lower == "c#")
        return "C#";

    std::string title = lower;
    bool start = true;
    for (char& c : title)
    {
        if (start)
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        start = !std::isalnum(static_cast<unsigned char>(c));
    }
    return title;
}

void replace_all(std::string& target, const std::string& placeholder, const std::string& value)
{
    if (placeholder.empty())
        return;
    size_t pos = 0;
    while ((pos = target.find(placeholder, pos)) != std::string::npos)
    {
        target.replace(pos, placeholder.length(), value);
        pos += value.length();
    }
}

TranslationRequest build_translation_request(const std::string& text, const std::string& target_language,
                                             nlohmann::json context, const std::string& prompt_template)
{
    TranslationRequest req;
    req.input_text = text;
    req.target_language = target_language.empty() ? "python" : target_language;
    req.context = context.is_object() ? std::move(context) : nlohmann::json::object();

    req.prompt = prompt_template.empty() ? default_prompt_template() : prompt_template;
    // Language first: the source text may itself contain "{language}".
    replace_all(req.prompt, "{language}", language_display_name(req.target_language));
    replace_all(req.prompt, "{source_text}", text);

    req.requested_at = std::chrono::system_clock::now();
    return req;
}

} // namespace translate
