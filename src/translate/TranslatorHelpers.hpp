#pragma once
#include <string>
#include <cstddef>

namespace translate
{
namespace helpers
{

// Input limits for a single model request (in bytes)
struct LengthLimits
{
    static constexpr std::size_t MODEL_INPUT_MAX = 10000;
    static constexpr std::size_t MODEL_INPUT_HARD_MAX = 100000;
};

// Check if text length is within limits
struct LengthCheckResult
{
    bool ok;
    std::string error_message;
    std::size_t byte_size;
};

inline LengthCheckResult check_text_length(const std::string& text, std::size_t max_length, const char* backend_name)
{
    LengthCheckResult result;
    result.byte_size = text.size();

    bool all_space = true;
    for (char c : text)
    {
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r')
        {
            all_space = false;
            break;
        }
    }
    if (all_space)
    {
        result.ok = false;
        result.error_message = "Empty text";
        return result;
    }

    if (result.byte_size > max_length)
    {
        result.ok = false;
        result.error_message = std::string(backend_name) + " text too long: " + std::to_string(result.byte_size) +
                               " bytes (limit: " + std::to_string(max_length) + " bytes). " +
                               "Consider splitting into smaller chunks.";
        return result;
    }

    result.ok = true;
    return result;
}

// Drops a surrounding Markdown fence (```python ... ```) that models like to
// wrap code in, then trims surrounding whitespace.
inline std::string strip_code_fences(const std::string& raw)
{
    auto trim = [](const std::string& s) {
        std::size_t b = s.find_first_not_of(" \t\r\n");
        if (b == std::string::npos)
            return std::string();
        std::size_t e = s.find_last_not_of(" \t\r\n");
        return s.substr(b, e - b + 1);
    };

    std::string code = trim(raw);
    if (code.compare(0, 3, "```") != 0)
        return code;

    std::size_t first_nl = code.find('\n');
    if (first_nl == std::string::npos)
        return std::string();
    code.erase(0, first_nl + 1);

    std::size_t last_nl = code.find_last_of('\n');
    std::string last_line = last_nl == std::string::npos ? code : code.substr(last_nl + 1);
    if (trim(last_line) == "```")
        code.erase(last_nl == std::string::npos ? 0 : last_nl);
    return trim(code);
}

// Replaces tabs with spaces up to the next multiple of tab_size, per line.
inline std::string expand_tabs(const std::string& code, std::size_t tab_size = 4)
{
    std::string out;
    out.reserve(code.size());
    std::size_t column = 0;
    for (char c : code)
    {
        if (c == '\t')
        {
            std::size_t pad = tab_size == 0 ? 0 : tab_size - (column % tab_size);
            out.append(pad, ' ');
            column += pad;
        }
        else
        {
            out.push_back(c);
            column = (c == '\n' || c == '\r') ? 0 : column + 1;
        }
    }
    return out;
}

} // namespace helpers
} // namespace translate
