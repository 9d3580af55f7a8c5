#pragma once

#include "../model/CodeBlock.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace assembly
{

struct BlockRef
{
    model::BlockType type = model::BlockType::TargetCode;
    std::pair<int, int> line_numbers{ 0, 0 };
};

// Terminal failure of one assemble() call. No partial output accompanies it.
class AssemblyError : public std::runtime_error
{
public:
    AssemblyError(const std::string& message, std::string stage, std::vector<BlockRef> blocks = {},
                  std::string cause = {});

    const std::string& stage() const noexcept { return stage_; }
    const std::vector<BlockRef>& blocks() const noexcept { return blocks_; }
    const std::vector<std::string>& suggestions() const noexcept { return suggestions_; }
    const std::string& cause() const noexcept { return cause_; }

    void addSuggestion(std::string suggestion);

    // Multi-line report: message, stage, implicated blocks and suggestions.
    std::string describe() const;

    static std::vector<BlockRef> refsFor(const std::vector<model::CodeBlock>& blocks);

private:
    std::string stage_;
    std::vector<BlockRef> blocks_;
    std::vector<std::string> suggestions_;
    std::string cause_;
};

} // namespace assembly
