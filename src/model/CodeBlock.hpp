#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace model
{

enum class BlockType
{
    NaturalLanguage = 0,
    TargetCode = 1,
    Mixed = 2
};

const char* blockTypeName(BlockType type);

// Typed unit of parsed source content. Blocks are treated as immutable once
// created: translation produces a new block through withTranslation().
struct CodeBlock
{
    BlockType type = BlockType::NaturalLanguage;
    std::string content;
    std::pair<int, int> line_numbers{ 0, 0 };
    nlohmann::json metadata = nlohmann::json::object();
    std::string context;

    bool isCode() const { return type == BlockType::TargetCode || type == BlockType::Mixed; }

    CodeBlock withTranslation(std::string code) const;

    std::string describe() const;
};

} // namespace model
