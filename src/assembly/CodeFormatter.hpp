#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace assembly
{

/**
 * @brief Final post-processing of an assembled program
 *
 * Steps, in order: normalize line endings, collapse runs of four or more
 * newlines to three, re-derive indentation from the block structure,
 * strip trailing whitespace, separate adjacent top-level definitions with a
 * blank line and end with exactly one newline.
 *
 * String literal and bracket continuation lines are never re-indented on
 * their own: string contents stay verbatim, bracket continuations move by the
 * same amount as the line that opened them.
 */
class CodeFormatter
{
public:
    explicit CodeFormatter(int indent_size = 4, std::size_t max_line_length = 88);

    std::string format(const std::string& code) const;

    std::string reindent(const std::string& code) const;

    static std::string normalizeNewlines(const std::string& code);
    static std::string collapseBlankRuns(const std::string& code);
    static std::string stripTrailingWhitespace(const std::string& code);
    static std::string spaceDefinitions(const std::string& code);
    static std::string ensureSingleTrailingNewline(const std::string& code);

    // 1-based line numbers longer than max_line_length
    std::vector<int> longLines(const std::string& code) const;

    int indentSize() const { return indent_size_; }

private:
    int indent_size_;
    std::size_t max_line_length_;
};

} // namespace assembly
