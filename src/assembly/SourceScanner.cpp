#include "SourceScanner.hpp"

#include <algorithm>
#include <cctype>
#include <string_view>
#include <unordered_set>

namespace assembly
{

namespace
{

struct LogicalLine
{
    int first = 0; // physical index, 0-based
    int last = 0;
    int indent = 0;
    std::string code; // comments removed, string literals collapsed to ""
    bool has_comment = false;
    bool blank = false;
    bool comment_only = false;
    bool string_only = false;
    bool opens_block = false;
};

struct Lexed
{
    std::vector<std::string> physical;
    std::vector<LogicalLine> logical;
    std::vector<LineInfo> lines;
    std::string error;
    int error_line = 0; // 1-based, 0 when clean
};

bool isIdentChar(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool isSpace(char c)
{
    return c == ' ' || c == '\t' || c == '\f';
}

std::string trim(std::string_view s)
{
    std::size_t b = 0;
    std::size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])))
        ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        --e;
    return std::string(s.substr(b, e - b));
}

int measureIndent(const std::string& line)
{
    int col = 0;
    for (char c : line)
    {
        if (c == ' ')
            ++col;
        else if (c == '\t')
            col = (col / 8 + 1) * 8;
        else if (c == '\f')
            col = 0;
        else
            break;
    }
    return col;
}

bool startsWithWord(std::string_view code, std::string_view word)
{
    if (code.size() < word.size() || code.compare(0, word.size(), word) != 0)
        return false;
    return code.size() == word.size() || !isIdentChar(code[word.size()]);
}

bool isStringPrefix(std::string_view code)
{
    // Trailing identifier run right before a quote: r"", b'', f"", rb"", ...
    std::size_t n = 0;
    while (n < code.size() && isIdentChar(code[code.size() - 1 - n]))
        ++n;
    if (n == 0 || n > 2)
        return false;
    if (code.size() > n && isIdentChar(code[code.size() - 1 - n]))
        return false;
    for (std::size_t i = code.size() - n; i < code.size(); ++i)
    {
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(code[i])));
        if (c != 'r' && c != 'b' && c != 'f' && c != 'u')
            return false;
    }
    return true;
}

void setError(Lexed& lx, int physical_index, const std::string& message)
{
    if (lx.error_line != 0)
        return;
    lx.error_line = physical_index + 1;
    lx.error = message;
}

void finalizeLogical(LogicalLine& ll)
{
    std::string t = trim(ll.code);
    ll.blank = t.empty() && !ll.has_comment;
    ll.comment_only = t.empty() && ll.has_comment;
    if (!t.empty())
    {
        ll.opens_block = t.back() == ':';
        std::string rest;
        for (std::size_t i = 0; i < t.size(); ++i)
        {
            if (t.compare(i, 2, "\"\"") == 0)
            {
                ++i;
                continue;
            }
            if (!isSpace(t[i]))
                rest.push_back(t[i]);
        }
        ll.string_only = rest.empty();
    }
    ll.code = std::move(t);
}

Lexed lex(const std::string& source)
{
    Lexed lx;
    lx.physical = SourceScanner::splitLines(source);

    bool in_string = false;
    bool triple = false;
    char quote = '\0';
    int string_start = 0;
    std::vector<std::pair<char, int>> brackets;
    bool backslash = false;

    LogicalLine cur;
    bool open = false;

    for (int k = 0; k < static_cast<int>(lx.physical.size()); ++k)
    {
        const std::string& line = lx.physical[static_cast<std::size_t>(k)];

        LineInfo info;
        info.in_string = in_string;
        info.starts_logical = !(in_string || !brackets.empty() || backslash);
        backslash = false;

        std::size_t i = 0;
        if (info.starts_logical)
        {
            cur = LogicalLine{};
            cur.first = k;
            cur.indent = measureIndent(line);
            open = true;
            while (i < line.size() && isSpace(line[i]))
                ++i;
        }

        bool escaped_newline = false;
        for (; i < line.size(); ++i)
        {
            char c = line[i];
            if (in_string)
            {
                if (c == '\\')
                {
                    if (i + 1 == line.size())
                        escaped_newline = true;
                    ++i;
                    continue;
                }
                if (c == quote)
                {
                    if (!triple)
                        in_string = false;
                    else if (i + 2 < line.size() && line[i + 1] == quote && line[i + 2] == quote)
                    {
                        in_string = false;
                        i += 2;
                    }
                }
                continue;
            }

            if (c == '#')
            {
                cur.has_comment = true;
                break;
            }
            if (c == '\'' || c == '"')
            {
                if (isStringPrefix(cur.code))
                {
                    while (!cur.code.empty() && isIdentChar(cur.code.back()))
                        cur.code.pop_back();
                }
                triple = i + 2 < line.size() && line[i + 1] == c && line[i + 2] == c;
                in_string = true;
                quote = c;
                string_start = k;
                cur.code += "\"\"";
                if (triple)
                    i += 2;
                continue;
            }
            if (c == '(' || c == '[' || c == '{')
            {
                brackets.emplace_back(c, k);
                cur.code.push_back(c);
                continue;
            }
            if (c == ')' || c == ']' || c == '}')
            {
                char expected = c == ')' ? '(' : (c == ']' ? '[' : '{');
                if (brackets.empty())
                    setError(lx, k, std::string("unmatched '") + c + "'");
                else if (brackets.back().first != expected)
                    setError(lx, k, std::string("closing parenthesis '") + c + "' does not match opening parenthesis '" +
                                        brackets.back().first + "'");
                else
                    brackets.pop_back();
                cur.code.push_back(c);
                continue;
            }
            if (c == '\\')
            {
                std::size_t j = i + 1;
                while (j < line.size() && isSpace(line[j]))
                    ++j;
                if (j == line.size())
                {
                    backslash = true;
                    break;
                }
                setError(lx, k, "unexpected character after line continuation character");
            }
            cur.code.push_back(c);
        }

        if (in_string && !triple && !escaped_newline)
        {
            setError(lx, k, "unterminated string literal");
            in_string = false;
        }

        bool continues = in_string || !brackets.empty() || backslash;
        if (continues)
        {
            cur.code.push_back(' ');
        }
        else if (open)
        {
            cur.last = k;
            finalizeLogical(cur);
            lx.logical.push_back(std::move(cur));
            open = false;
        }
        lx.lines.push_back(info);
    }

    if (in_string)
        setError(lx, string_start, "unterminated triple-quoted string literal");
    else if (!brackets.empty())
        setError(lx, brackets.back().second, std::string("'") + brackets.back().first + "' was never closed");
    else if (backslash)
        setError(lx, static_cast<int>(lx.physical.size()) - 1, "unexpected EOF after line continuation");

    if (open)
    {
        cur.last = static_cast<int>(lx.physical.size()) - 1;
        finalizeLogical(cur);
        lx.logical.push_back(std::move(cur));
    }

    for (const auto& ll : lx.logical)
    {
        auto& info = lx.lines[static_cast<std::size_t>(ll.first)];
        info.opens_block = ll.opens_block;
        info.comment_only = ll.comment_only;
        info.blank = ll.blank;
    }
    return lx;
}

// Python refuses these before running anything, so the assembler must too.
void checkIndentation(Lexed& lx)
{
    if (lx.error_line != 0)
        return;

    std::vector<int> stack{ 0 };
    bool expect_body = false;
    int header_line = 0;
    for (const auto& ll : lx.logical)
    {
        if (ll.blank || ll.comment_only)
            continue;
        if (expect_body)
        {
            if (ll.indent <= stack.back())
            {
                setError(lx, ll.first, "expected an indented block after line " + std::to_string(header_line + 1));
                return;
            }
            stack.push_back(ll.indent);
        }
        else if (ll.indent > stack.back())
        {
            setError(lx, ll.first, "unexpected indent");
            return;
        }
        else if (ll.indent < stack.back())
        {
            while (stack.size() > 1 && ll.indent < stack.back())
                stack.pop_back();
            if (ll.indent != stack.back())
            {
                setError(lx, ll.first, "unindent does not match any outer indentation level");
                return;
            }
        }
        expect_body = ll.opens_block;
        header_line = ll.last;
    }
    if (expect_body)
        setError(lx, header_line, "expected an indented block after line " + std::to_string(header_line + 1));
}

std::vector<std::string> splitTopLevel(std::string_view code, char sep)
{
    std::vector<std::string> parts;
    int depth = 0;
    std::size_t start = 0;
    for (std::size_t i = 0; i < code.size(); ++i)
    {
        char c = code[i];
        if (c == '(' || c == '[' || c == '{')
            ++depth;
        else if (c == ')' || c == ']' || c == '}')
            --depth;
        else if (c == sep && depth == 0)
        {
            parts.push_back(trim(code.substr(start, i - start)));
            start = i + 1;
        }
    }
    parts.push_back(trim(code.substr(start)));
    return parts;
}

std::vector<std::string> words(std::string_view s)
{
    std::vector<std::string> out;
    std::size_t i = 0;
    while (i < s.size())
    {
        while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i])))
            ++i;
        std::size_t b = i;
        while (i < s.size() && !std::isspace(static_cast<unsigned char>(s[i])))
            ++i;
        if (i > b)
            out.emplace_back(s.substr(b, i - b));
    }
    return out;
}

void parseImportStatement(const std::string& statement, std::vector<ImportEntry>& out)
{
    if (startsWithWord(statement, "import"))
    {
        for (const auto& part : splitTopLevel(std::string_view(statement).substr(6), ','))
        {
            auto w = words(part);
            if (w.empty())
                continue;
            ImportEntry e;
            e.module = w[0];
            if (w.size() >= 3 && w[1] == "as")
                e.alias = w[2];
            out.push_back(std::move(e));
        }
        return;
    }

    if (!startsWithWord(statement, "from"))
        return;
    std::string rest = trim(std::string_view(statement).substr(4));
    // "from .import x" is legal, so split on the keyword rather than on spaces
    std::size_t pos = std::string::npos;
    for (std::size_t i = 0; i + 6 <= rest.size(); ++i)
    {
        if (rest.compare(i, 6, "import") == 0 && (i == 0 || !isIdentChar(rest[i - 1])) &&
            (i + 6 == rest.size() || !isIdentChar(rest[i + 6])))
        {
            pos = i;
            break;
        }
    }
    if (pos == std::string::npos)
        return;
    std::string module = trim(std::string_view(rest).substr(0, pos));
    module.erase(std::remove_if(module.begin(), module.end(), [](char c) { return isSpace(c); }), module.end());
    std::string names = trim(std::string_view(rest).substr(pos + 6));
    if (!names.empty() && names.front() == '(')
        names.erase(names.begin());
    if (!names.empty() && names.back() == ')')
        names.pop_back();

    for (const auto& part : splitTopLevel(names, ','))
    {
        auto w = words(part);
        if (w.empty())
            continue;
        ImportEntry e;
        e.module = module;
        e.name = w[0];
        e.from_import = true;
        if (w.size() >= 3 && w[1] == "as")
            e.alias = w[2];
        out.push_back(std::move(e));
    }
}

bool isImportStatement(const std::string& code)
{
    return startsWithWord(code, "import") || startsWithWord(code, "from");
}

void collectImports(const std::string& code, std::vector<ImportEntry>& out)
{
    for (const auto& part : splitTopLevel(code, ';'))
    {
        if (isImportStatement(part))
            parseImportStatement(part, out);
    }
}

std::string identifierAfter(std::string_view code, std::string_view keyword)
{
    std::size_t pos = code.find(keyword);
    if (pos == std::string_view::npos)
        return {};
    pos += keyword.size();
    while (pos < code.size() && isSpace(code[pos]))
        ++pos;
    std::size_t end = pos;
    while (end < code.size() && isIdentChar(code[end]))
        ++end;
    return std::string(code.substr(pos, end - pos));
}

const std::unordered_set<std::string>& leadingKeywords()
{
    static const std::unordered_set<std::string> kw = {
        "if",     "elif",   "else",   "for",    "while",    "with",  "try",   "except", "finally", "return",
        "del",    "assert", "raise",  "pass",   "break",    "continue", "global", "nonlocal", "lambda", "yield",
        "await",  "async",  "match",  "case",   "import",   "from",  "def",   "class",  "not",
    };
    return kw;
}

// Returns the assignment target, or empty when the statement is not a plain
// or annotated assignment.
std::string assignmentTarget(const std::string& code)
{
    std::size_t n = 0;
    while (n < code.size() && isIdentChar(code[n]))
        ++n;
    if (leadingKeywords().count(code.substr(0, n)) != 0)
        return {};

    int depth = 0;
    for (std::size_t i = 0; i < code.size(); ++i)
    {
        char c = code[i];
        if (c == '(' || c == '[' || c == '{')
        {
            ++depth;
            continue;
        }
        if (c == ')' || c == ']' || c == '}')
        {
            --depth;
            continue;
        }
        if (depth != 0 || c != '=')
            continue;
        if (i + 1 < code.size() && code[i + 1] == '=')
        {
            ++i;
            continue;
        }
        char prev = i > 0 ? code[i - 1] : '\0';
        if (prev == '!' || prev == '<' || prev == '>' || prev == '=')
            continue;
        if (std::string_view("+-*/%&|^@:").find(prev) != std::string_view::npos)
            return {};
        std::string target = trim(std::string_view(code).substr(0, i));
        std::size_t colon = target.find(':');
        if (colon != std::string::npos)
            target = trim(std::string_view(target).substr(0, colon));
        return target;
    }

    // Bare annotation: `total: int`
    if (n > 0 && !code.empty() && code.back() != ':')
    {
        std::size_t j = n;
        while (j < code.size() && (isIdentChar(code[j]) || code[j] == '.'))
            ++j;
        while (j < code.size() && isSpace(code[j]))
            ++j;
        if (j < code.size() && code[j] == ':' && j + 1 < code.size())
            return trim(std::string_view(code).substr(0, j));
    }
    return {};
}

bool isClauseContinuation(const std::string& code)
{
    return startsWithWord(code, "else") || startsWithWord(code, "elif") || startsWithWord(code, "except") ||
           startsWithWord(code, "finally");
}

bool isDefinition(const std::string& code)
{
    return startsWithWord(code, "def") || startsWithWord(code, "class") ||
           (startsWithWord(code, "async") && startsWithWord(trim(std::string_view(code).substr(5)), "def"));
}

void classifyDefinition(const std::string& code, Statement& st)
{
    if (startsWithWord(code, "class"))
    {
        st.kind = StatementKind::Class;
        st.name = identifierAfter(code, "class");
    }
    else
    {
        st.kind = StatementKind::Function;
        st.name = identifierAfter(code, "def");
    }
}

std::string joinLines(const std::vector<std::string>& lines, int first, int last)
{
    std::string out;
    for (int i = first; i <= last; ++i)
    {
        if (i > first)
            out.push_back('\n');
        out += lines[static_cast<std::size_t>(i)];
    }
    return out;
}

} // namespace

std::vector<std::string> SourceScanner::splitLines(const std::string& source)
{
    std::vector<std::string> lines;
    std::string current;
    for (std::size_t i = 0; i < source.size(); ++i)
    {
        char c = source[i];
        if (c == '\r')
        {
            if (i + 1 < source.size() && source[i + 1] == '\n')
                ++i;
            lines.push_back(std::move(current));
            current.clear();
        }
        else if (c == '\n')
        {
            lines.push_back(std::move(current));
            current.clear();
        }
        else
        {
            current.push_back(c);
        }
    }
    if (!current.empty())
        lines.push_back(std::move(current));
    return lines;
}

ScanResult SourceScanner::scan(const std::string& source, bool attach_comments)
{
    ScanResult result;
    Lexed lx = lex(source);
    checkIndentation(lx);
    if (lx.error_line != 0)
    {
        result.ok = false;
        result.error = lx.error;
        result.error_line = lx.error_line;
        return result;
    }

    for (const auto& ll : lx.logical)
    {
        if (!ll.blank && !ll.comment_only)
            collectImports(ll.code, result.imports);
    }

    Statement current;
    int cur_first = -1;
    int cur_last = -1;
    bool awaiting_definition = false;
    std::vector<std::pair<int, int>> pending_comments;

    auto flush = [&]() {
        if (cur_first < 0)
            return;
        current.first_line = cur_first + 1;
        current.last_line = cur_last + 1;
        current.text = joinLines(lx.physical, cur_first, cur_last);
        result.statements.push_back(std::move(current));
        current = Statement{};
        cur_first = -1;
    };

    for (const auto& ll : lx.logical)
    {
        if (ll.blank)
            continue;
        if (ll.comment_only)
        {
            pending_comments.emplace_back(ll.first, ll.last);
            continue;
        }

        bool continues = cur_first >= 0 &&
                         (ll.indent > 0 || isClauseContinuation(ll.code) ||
                          (awaiting_definition && (ll.code.front() == '@' || isDefinition(ll.code))));
        if (continues)
        {
            cur_last = ll.last;
            pending_comments.clear();
            if (awaiting_definition && isDefinition(ll.code))
            {
                classifyDefinition(ll.code, current);
                awaiting_definition = false;
            }
            continue;
        }

        flush();
        awaiting_definition = false;
        cur_first = (attach_comments && !pending_comments.empty()) ? pending_comments.front().first : ll.first;
        cur_last = ll.last;
        pending_comments.clear();

        const std::string& code = ll.code;
        if (code.front() == '@')
        {
            awaiting_definition = true;
        }
        else if (isDefinition(code))
        {
            classifyDefinition(code, current);
        }
        else if (isImportStatement(code))
        {
            current.kind = StatementKind::Import;
        }
        else if (ll.string_only && result.statements.empty())
        {
            current.kind = StatementKind::Docstring;
        }
        else
        {
            std::string target = assignmentTarget(code);
            if (!target.empty())
            {
                current.kind = StatementKind::Assignment;
                current.name = std::move(target);
            }
        }
    }
    flush();

    if (attach_comments && !pending_comments.empty())
    {
        cur_first = pending_comments.front().first;
        cur_last = pending_comments.back().second;
        flush();
    }
    return result;
}

int SourceScanner::indentWidth(const std::string& line)
{
    return measureIndent(line);
}

bool SourceScanner::check(const std::string& source, std::string* error)
{
    Lexed lx = lex(source);
    checkIndentation(lx);
    if (lx.error_line == 0)
        return true;
    if (error)
        *error = "line " + std::to_string(lx.error_line) + ": " + lx.error;
    return false;
}

std::vector<LineInfo> SourceScanner::lineStructure(const std::string& source)
{
    return lex(source).lines;
}

} // namespace assembly
