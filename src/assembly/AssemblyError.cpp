#include "AssemblyError.hpp"

#include <sstream>

namespace assembly
{

namespace
{

std::string composeMessage(const std::string& message, const std::string& cause)
{
    return cause.empty() ? message : message + ": " + cause;
}

} // namespace

AssemblyError::AssemblyError(const std::string& message, std::string stage, std::vector<BlockRef> blocks,
                             std::string cause)
    : std::runtime_error(composeMessage(message, cause))
    , stage_(std::move(stage))
    , blocks_(std::move(blocks))
    , cause_(std::move(cause))
{
}

void AssemblyError::addSuggestion(std::string suggestion)
{
    suggestions_.push_back(std::move(suggestion));
}

std::string AssemblyError::describe() const
{
    std::ostringstream oss;
    oss << what() << "\n  stage: " << stage_;
    for (const auto& b : blocks_)
    {
        oss << "\n  block: " << model::blockTypeName(b.type) << " lines " << b.line_numbers.first << "-"
            << b.line_numbers.second;
    }
    for (const auto& s : suggestions_)
        oss << "\n  suggestion: " << s;
    return oss.str();
}

std::vector<BlockRef> AssemblyError::refsFor(const std::vector<model::CodeBlock>& blocks)
{
    std::vector<BlockRef> refs;
    refs.reserve(blocks.size());
    for (const auto& b : blocks)
        refs.push_back({ b.type, b.line_numbers });
    return refs;
}

} // namespace assembly
