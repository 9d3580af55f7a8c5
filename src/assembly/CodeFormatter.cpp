#include "CodeFormatter.hpp"

#include "SourceScanner.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cctype>
#include <string_view>

namespace assembly
{

namespace
{

constexpr std::string_view kDedentKeywords[] = { "else:", "elif ", "except:", "except ", "finally:", "case " };

// Compound headers that may legally be followed by a clause at the same level
// when written as one-liners (`if x: a()` / `else: b()`).
constexpr std::string_view kOneLinerHeads[] = { "if ", "elif ", "else:", "for ", "while ",
                                                "try:", "except", "with ", "async ", "case " };

std::string_view lstrip(std::string_view s)
{
    std::size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\f'))
        ++i;
    return s.substr(i);
}

std::string_view rstrip(std::string_view s)
{
    std::size_t e = s.size();
    while (e > 0 && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return s.substr(0, e);
}

bool startsWithAny(std::string_view s, const std::string_view* first, const std::string_view* last)
{
    return std::any_of(first, last, [s](std::string_view p) { return s.substr(0, p.size()) == p; });
}

bool isDefinitionStart(std::string_view line)
{
    return line.substr(0, 4) == "def " || line.substr(0, 6) == "class " || line.substr(0, 10) == "async def " ||
           line.substr(0, 1) == "@";
}

std::string joinLines(const std::vector<std::string>& lines)
{
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        if (i > 0)
            out.push_back('\n');
        out += lines[i];
    }
    return out;
}

} // namespace

CodeFormatter::CodeFormatter(int indent_size, std::size_t max_line_length)
    : indent_size_(indent_size)
    , max_line_length_(max_line_length)
{
}

std::string CodeFormatter::format(const std::string& code) const
{
    if (code.empty())
        return code;

    std::string out = collapseBlankRuns(normalizeNewlines(code));
    out = reindent(out);
    out = stripTrailingWhitespace(out);
    out = spaceDefinitions(out);
    out = collapseBlankRuns(out);
    out = ensureSingleTrailingNewline(out);

    auto long_lines = longLines(out);
    if (!long_lines.empty())
    {
        PLOG_DEBUG << long_lines.size() << " line(s) exceed " << max_line_length_
                   << " characters, first at line " << long_lines.front();
    }
    return out;
}

std::string CodeFormatter::normalizeNewlines(const std::string& code)
{
    std::string out;
    out.reserve(code.size());
    for (std::size_t i = 0; i < code.size(); ++i)
    {
        if (code[i] == '\r')
        {
            if (i + 1 < code.size() && code[i + 1] == '\n')
                ++i;
            out.push_back('\n');
        }
        else
        {
            out.push_back(code[i]);
        }
    }
    return out;
}

std::string CodeFormatter::collapseBlankRuns(const std::string& code)
{
    std::string out;
    out.reserve(code.size());
    int run = 0;
    for (char c : code)
    {
        if (c == '\n')
        {
            if (++run > 3)
                continue;
        }
        else
        {
            run = 0;
        }
        out.push_back(c);
    }
    return out;
}

std::string CodeFormatter::reindent(const std::string& code) const
{
    const std::vector<std::string> lines = SourceScanner::splitLines(code);
    const std::vector<LineInfo> info = SourceScanner::lineStructure(code);

    std::vector<std::string> out;
    out.reserve(lines.size());

    std::vector<int> stack{ 0 }; // source indent columns, one per level
    bool expect_body = false;
    bool prev_opened = false;
    std::string_view prev_code;
    int shift = 0;

    for (std::size_t k = 0; k < lines.size(); ++k)
    {
        const std::string& line = lines[k];
        const LineInfo inf = k < info.size() ? info[k] : LineInfo{};

        if (!inf.starts_logical)
        {
            if (inf.in_string)
            {
                out.push_back(line);
                continue;
            }
            int moved = std::max(0, SourceScanner::indentWidth(line) + shift);
            out.push_back(std::string(static_cast<std::size_t>(moved), ' ') + std::string(lstrip(line)));
            continue;
        }

        std::string_view stripped = lstrip(line);
        if (rstrip(stripped).empty())
        {
            out.emplace_back();
            continue;
        }

        const int old = SourceScanner::indentWidth(line);

        if (inf.comment_only)
        {
            std::size_t level = stack.size() - 1;
            if (expect_body && old > stack.back())
                ++level;
            else
            {
                while (level > 0 && old < stack[level])
                    --level;
            }
            out.push_back(std::string(level * static_cast<std::size_t>(indent_size_), ' ') + std::string(stripped));
            continue;
        }

        bool dedented = false;
        if (expect_body)
        {
            stack.push_back(old > stack.back() ? old : stack.back() + 1);
            expect_body = false;
        }
        else if (old < stack.back())
        {
            while (stack.size() > 1 && old < stack.back())
                stack.pop_back();
            dedented = true;
        }

        // Clause headers left at their body's indentation still belong one
        // level up. `case` is a soft keyword, so only lines ending in ':' count.
        if (inf.opens_block && !dedented && !prev_opened && stack.size() > 1 &&
            startsWithAny(stripped, std::begin(kDedentKeywords), std::end(kDedentKeywords)) &&
            !startsWithAny(prev_code, std::begin(kOneLinerHeads), std::end(kOneLinerHeads)))
        {
            stack.pop_back();
        }

        const int indent = static_cast<int>(stack.size() - 1) * indent_size_;
        shift = indent - old;
        out.push_back(std::string(static_cast<std::size_t>(indent), ' ') + std::string(stripped));

        expect_body = inf.opens_block;
        prev_opened = inf.opens_block;
        prev_code = stripped;
    }

    return joinLines(out);
}

std::string CodeFormatter::stripTrailingWhitespace(const std::string& code)
{
    auto lines = SourceScanner::splitLines(code);
    for (auto& l : lines)
        l = std::string(rstrip(l));
    return joinLines(lines);
}

std::string CodeFormatter::spaceDefinitions(const std::string& code)
{
    const std::vector<std::string> lines = SourceScanner::splitLines(code);
    const std::vector<LineInfo> info = SourceScanner::lineStructure(code);

    auto startsTopLevelDefinition = [&](std::size_t k) {
        // A run of top-level comments directly above a definition belongs to it.
        for (std::size_t j = k; j < lines.size(); ++j)
        {
            const LineInfo inf = j < info.size() ? info[j] : LineInfo{};
            if (!inf.starts_logical || lines[j].empty() || std::isspace(static_cast<unsigned char>(lines[j][0])))
                return false;
            if (!inf.comment_only)
                return isDefinitionStart(lines[j]);
        }
        return false;
    };

    std::vector<std::string> out;
    out.reserve(lines.size());
    bool in_definition = false;
    bool prev_decorator = false;
    bool prev_top_comment = false;

    for (std::size_t k = 0; k < lines.size(); ++k)
    {
        const std::string& line = lines[k];
        const LineInfo inf = k < info.size() ? info[k] : LineInfo{};
        const bool top_level = inf.starts_logical && !line.empty() && !std::isspace(static_cast<unsigned char>(line[0]));

        if (top_level)
        {
            if (in_definition && !prev_decorator && !prev_top_comment && !out.empty() && !out.back().empty() &&
                startsTopLevelDefinition(k))
            {
                out.emplace_back();
            }
            if (!inf.comment_only)
            {
                in_definition = isDefinitionStart(line);
                prev_decorator = line[0] == '@';
            }
        }
        prev_top_comment = top_level && inf.comment_only;
        out.push_back(line);
    }
    return joinLines(out);
}

std::string CodeFormatter::ensureSingleTrailingNewline(const std::string& code)
{
    std::size_t end = code.size();
    while (end > 0 && code[end - 1] == '\n')
        --end;
    if (end == 0)
        return {};
    return code.substr(0, end) + "\n";
}

std::vector<int> CodeFormatter::longLines(const std::string& code) const
{
    std::vector<int> result;
    const auto lines = SourceScanner::splitLines(code);
    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        if (lines[i].size() > max_line_length_)
            result.push_back(static_cast<int>(i) + 1);
    }
    return result;
}

} // namespace assembly
