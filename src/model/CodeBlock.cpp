#include "CodeBlock.hpp"

namespace model
{

const char* blockTypeName(BlockType type)
{
    switch (type)
    {
    case BlockType::NaturalLanguage:
        return "natural_language";
    case BlockType::TargetCode:
        return "target_code";
    case BlockType::Mixed:
        return "mixed";
    }
    return "unknown";
}

CodeBlock CodeBlock::withTranslation(std::string code) const
{
    CodeBlock out;
    out.type = BlockType::TargetCode;
    out.content = std::move(code);
    out.line_numbers = line_numbers;
    out.metadata = metadata.is_object() ? metadata : nlohmann::json::object();
    out.metadata["translated"] = true;
    out.context = context;
    return out;
}

std::string CodeBlock::describe() const
{
    return std::string(blockTypeName(type)) + " lines " + std::to_string(line_numbers.first) + "-" +
           std::to_string(line_numbers.second);
}

} // namespace model
