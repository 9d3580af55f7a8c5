#pragma once

#include "../config/PipelineConfig.hpp"
#include "../model/CodeBlock.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace assembly
{

/**
 * @brief Structural merge of per-chunk code fragments into one program
 *
 * assemble() keeps only code blocks, pulls the module docstring and every
 * import out, sorts the remaining top-level statements into globals,
 * functions, classes and main code, merges same-named definitions (the last
 * body wins, the first position is kept) and runs the result through
 * CodeFormatter. Output is deterministic for a given block sequence.
 *
 * Any stage failure throws AssemblyError. Empty input, or input without code
 * blocks, yields an empty string.
 *
 * Not thread-safe: the scan cache belongs to the instance.
 */
class CodeAssembler
{
public:
    explicit CodeAssembler(config::AssemblerConfig config = {});
    ~CodeAssembler();

    CodeAssembler(const CodeAssembler&) = delete;
    CodeAssembler& operator=(const CodeAssembler&) = delete;

    std::string assemble(const std::vector<model::CodeBlock>& blocks);

    const config::AssemblerConfig& config() const { return config_; }

    std::uint64_t scanCacheHits() const;
    std::uint64_t scanCacheMisses() const;

private:
    struct Impl;

    config::AssemblerConfig config_;
    std::unique_ptr<Impl> impl_;
};

} // namespace assembly
