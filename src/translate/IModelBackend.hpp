#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace translate
{

// The language model behind TranslationService. Returns std::nullopt when the
// model produced nothing usable; may throw on transport failures.
class IModelBackend
{
public:
    virtual ~IModelBackend() = default;
    virtual const char* name() const = 0;
    virtual std::optional<std::string> generate(const std::string& prompt, const std::string& target_language,
                                                const nlohmann::json& context) = 0;
};

} // namespace translate
