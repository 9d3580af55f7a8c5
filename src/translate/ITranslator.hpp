#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace translate
{

struct TranslationOutcome
{
    bool success = false;
    std::string code;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    nlohmann::json metadata = nlohmann::json::object();
};

// Turns one natural-language segment into target-language code. Failures are
// reported through TranslationOutcome::success, not exceptions; callers still
// contain anything that escapes.
class ITranslator
{
public:
    virtual ~ITranslator() = default;
    virtual bool isReady() const = 0;
    virtual TranslationOutcome translate(const std::string& text, const std::string& target_language,
                                         const nlohmann::json& context) = 0;
    virtual void shutdown() = 0;
};

} // namespace translate
