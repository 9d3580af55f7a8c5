#pragma once

#include <string>
#include <vector>

namespace assembly
{

enum class StatementKind
{
    Import,
    Function,
    Class,
    Assignment,
    Docstring,
    Other
};

// One top-level statement of a code block, including its body, decorators and
// (optionally) the comment lines directly above it.
struct Statement
{
    StatementKind kind = StatementKind::Other;
    std::string text;
    std::string name;   // def/class name or first assignment target
    int first_line = 0; // 1-based, inclusive
    int last_line = 0;
};

// `import a.b as c`      -> { "a.b", "",  "c", false }
// `from .x import y as z` -> { ".x",  "y", "z", true  }
struct ImportEntry
{
    std::string module;
    std::string name;
    std::string alias;
    bool from_import = false;
};

struct ScanResult
{
    bool ok = true;
    std::string error;
    int error_line = 0;
    std::vector<Statement> statements;
    std::vector<ImportEntry> imports; // every import, at any nesting depth
};

// Per physical line layout, used by the formatter to re-derive indentation
// without touching string literals or bracket continuations.
struct LineInfo
{
    bool starts_logical = true; // false inside strings, brackets and after a backslash
    bool in_string = false;     // line begins inside a multi-line string literal
    bool opens_block = false;   // logical line starting here ends with ':'
    bool comment_only = false;
    bool blank = false;
};

/**
 * @brief Structural scanner for Python source
 *
 * Not a full parser: it tokenizes strings, comments, brackets and indentation
 * well enough to split a block into top-level statements, find imports and
 * reject text that Python would refuse (unterminated strings, unbalanced
 * brackets, unexpected indentation, compound headers without a body).
 */
class SourceScanner
{
public:
    static ScanResult scan(const std::string& source, bool attach_comments = true);

    static bool check(const std::string& source, std::string* error = nullptr);

    // Best effort: malformed input still yields one entry per physical line.
    static std::vector<LineInfo> lineStructure(const std::string& source);

    static std::vector<std::string> splitLines(const std::string& source);

    // Leading whitespace width; tabs advance to the next multiple of 8.
    static int indentWidth(const std::string& line);
};

} // namespace assembly
