#pragma once

#include "../model/CodeBlock.hpp"

#include <string>
#include <vector>

namespace parsing
{

struct ParseResult
{
    std::vector<model::CodeBlock> blocks;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
    bool success = true;
};

// Classifies raw chunk text (optionally prefixed with carried-over context)
// into typed blocks. Implementations live outside this library.
class IBlockParser
{
public:
    virtual ~IBlockParser() = default;
    virtual ParseResult parse(const std::string& text) = 0;
};

} // namespace parsing
