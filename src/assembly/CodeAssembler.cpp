#include "CodeAssembler.hpp"

#include "AssemblyError.hpp"
#include "CodeFormatter.hpp"
#include "ImportOrganizer.hpp"
#include "SourceScanner.hpp"

#include "../processing/Diagnostics.hpp"
#include "../processing/StageRunner.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LRUCache.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <initializer_list>
#include <optional>
#include <regex>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace assembly
{

namespace
{

constexpr const char* kSectionJoin = "\n\n\n";
constexpr const char* kConstantsHeader = "# Constants";
constexpr const char* kVariablesHeader = "# Global variables";

struct Sections
{
    std::optional<std::string> module_docstring;
    std::vector<std::pair<std::string, std::string>> functions; // name, source
    std::vector<std::pair<std::string, std::string>> classes;
    std::vector<std::string> globals;
    std::vector<std::string> main;
};

struct Stitched
{
    std::string functions;
    std::string classes;
    std::string globals;
    std::string main;
};

template <typename T>
bool containsText(const std::vector<T>& list, const std::string& text)
{
    return std::any_of(list.begin(), list.end(), [&](const T& item) {
        if constexpr (std::is_same_v<T, std::string>)
            return item == text;
        else
            return item.second == text;
    });
}

std::string trimmed(const std::string& s)
{
    std::size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return {};
    std::size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string joinWith(const std::vector<std::string>& parts, const char* sep)
{
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i)
    {
        if (i > 0)
            out += sep;
        out += parts[i];
    }
    return out;
}

// Last body wins, first position kept. Nameless fragments get a synthetic key
// numbered by the current count of unique entries.
std::string mergeByName(const std::vector<std::pair<std::string, std::string>>& defs, const char* prefix)
{
    std::vector<std::string> order;
    std::unordered_map<std::string, std::string> bodies;
    for (const auto& [name, source] : defs)
    {
        std::string key = name.empty() ? std::string(prefix) + std::to_string(order.size()) : name;
        auto it = bodies.find(key);
        if (it != bodies.end())
        {
            PLOG_DEBUG << "Replacing duplicate definition: " << key;
            it->second = source;
            continue;
        }
        order.push_back(key);
        bodies.emplace(key, source);
    }

    std::vector<std::string> parts;
    parts.reserve(order.size());
    for (const auto& key : order)
        parts.push_back(bodies[key]);
    return joinWith(parts, "\n\n");
}

std::string organizeGlobals(const std::vector<std::string>& globals)
{
    static const std::regex constant_pattern(R"(^[A-Z_][A-Z0-9_]*\s*(:[^=]*)?=)");

    std::vector<std::string> constants;
    std::vector<std::string> variables;
    for (const auto& g : globals)
    {
        std::string s = trimmed(g);
        if (std::regex_search(s, constant_pattern))
            constants.push_back(std::move(s));
        else
            variables.push_back(std::move(s));
    }

    std::vector<std::string> lines;
    if (!constants.empty())
    {
        lines.emplace_back(kConstantsHeader);
        lines.insert(lines.end(), constants.begin(), constants.end());
    }
    if (!variables.empty())
    {
        if (!constants.empty())
            lines.emplace_back();
        lines.emplace_back(kVariablesHeader);
        lines.insert(lines.end(), variables.begin(), variables.end());
    }
    return joinWith(lines, "\n");
}

bool hasMainGuard(const std::string& code)
{
    static const std::regex guard(R"(if\s+__name__\s*==\s*['"]__main__['"])");
    return std::regex_search(code, guard);
}

bool needsMainGuard(const std::string& code)
{
    static const std::regex entry_call(R"(\b(main|run|execute|start)\s*\()");
    static const std::regex exit_call(R"(\b(sys\.exit|quit|exit)\s*\()");
    static const std::regex bare_call(R"(^\s*[A-Za-z_][A-Za-z0-9_]*\s*\()");

    if (code.find("print(") != std::string::npos || code.find("input(") != std::string::npos)
        return true;
    if (std::regex_search(code, entry_call) || std::regex_search(code, exit_call))
        return true;
    for (const auto& line : SourceScanner::splitLines(code))
    {
        if (std::regex_search(line, bare_call))
            return true;
    }
    return false;
}

std::string organizeMain(const std::vector<std::string>& main_parts, int indent_size)
{
    if (main_parts.empty())
        return {};

    std::string code = joinWith(main_parts, "\n\n");
    if (hasMainGuard(code) || !needsMainGuard(code))
        return code;

    const auto lines = SourceScanner::splitLines(code);
    const auto info = SourceScanner::lineStructure(code);
    const std::string pad(static_cast<std::size_t>(indent_size), ' ');

    std::string out = "if __name__ == \"__main__\":";
    for (std::size_t k = 0; k < lines.size(); ++k)
    {
        out.push_back('\n');
        const bool inside_string = k < info.size() && info[k].in_string;
        if (!inside_string && lines[k].find_first_not_of(" \t") != std::string::npos)
            out += pad;
        out += lines[k];
    }
    return out;
}

void logStage(const processing::StageResult<std::string>& stage)
{
    if (!processing::Diagnostics::IsVerbose())
        return;
    if (stage.succeeded)
    {
        PLOG_INFO_(processing::Diagnostics::kLogInstance)
            << "[CodeAssembler] stage=" << stage.stage_name << " status=ok duration=" << stage.duration.count()
            << "us output=" << processing::Diagnostics::Preview(stage.result);
    }
    else
    {
        PLOG_ERROR_(processing::Diagnostics::kLogInstance)
            << "[CodeAssembler] stage=" << stage.stage_name << " status=error duration=" << stage.duration.count()
            << "us reason=" << stage.error.value_or("unknown");
    }
}

} // anonymous namespace

struct CodeAssembler::Impl
{
    LRUCache<std::string, ScanResult> scan_cache{ 256 };

    ScanResult scan(const std::string& content, bool attach_comments)
    {
        std::string key = (attach_comments ? "c:" : "n:") + content;
        ScanResult result;
        if (!scan_cache.get(key, result))
        {
            result = SourceScanner::scan(content, attach_comments);
            scan_cache.put(key, result);
        }
        return result;
    }
};

CodeAssembler::CodeAssembler(config::AssemblerConfig config)
    : config_(config)
    , impl_(std::make_unique<Impl>())
{
}

CodeAssembler::~CodeAssembler() = default;

std::uint64_t CodeAssembler::scanCacheHits() const
{
    return impl_->scan_cache.hits();
}

std::uint64_t CodeAssembler::scanCacheMisses() const
{
    return impl_->scan_cache.misses();
}

std::string CodeAssembler::assemble(const std::vector<model::CodeBlock>& blocks)
{
    PROFILE_SCOPE_CUSTOM("CodeAssembler::assemble");

    if (blocks.empty())
        return {};

    PLOG_INFO << "Assembling " << blocks.size() << " code blocks";

    std::vector<model::CodeBlock> code_blocks;
    for (const auto& b : blocks)
    {
        if (b.isCode())
            code_blocks.push_back(b);
    }
    if (code_blocks.empty())
    {
        PLOG_WARNING << "No code blocks found in input";
        return {};
    }

    if (config_.indent_size < 1 || config_.indent_size > 8)
    {
        AssemblyError error("Invalid assembler configuration", "configuration", AssemblyError::refsFor(blocks),
                            "indent_size must be between 1 and 8, got " + std::to_string(config_.indent_size));
        error.addSuggestion("Set [assembler].indent_size to a value between 1 and 8");
        throw error;
    }

    PLOG_DEBUG << "Found " << code_blocks.size() << " code blocks out of " << blocks.size() << " total";

    auto fail = [&](const processing::StageResult<std::string>& stage, const char* message,
                    std::initializer_list<const char*> suggestions) {
        AssemblyError error(message, stage.stage_name, AssemblyError::refsFor(blocks), stage.error.value_or(""));
        for (const char* s : suggestions)
            error.addSuggestion(s);
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Assembly, message, error.describe());
        throw error;
    };

    auto imports_stage = processing::run_stage<std::string>("imports", [&]() {
        ImportOrganizer organizer;
        for (const auto& block : code_blocks)
        {
            const ScanResult scan = impl_->scan(block.content, config_.preserve_comments);
            if (!scan.ok)
            {
                PLOG_WARNING << "Could not parse imports from block: " << block.describe();
                continue;
            }
            organizer.addAll(scan.imports);
        }
        if (config_.auto_import_common)
        {
            std::vector<std::string> contents;
            contents.reserve(code_blocks.size());
            for (const auto& block : code_blocks)
                contents.push_back(block.content);
            organizer.injectCommonImports(joinWith(contents, "\n"));
        }
        return organizer.render();
    });
    logStage(imports_stage);
    if (!imports_stage.succeeded)
        fail(imports_stage, "Failed to collect imports", { "Check import statements for syntax errors" });

    Sections sections;
    auto sections_stage = processing::run_stage<std::string>("sections", [&]() {
        for (const auto& block : code_blocks)
        {
            const ScanResult scan = impl_->scan(block.content, config_.preserve_comments);
            if (!scan.ok)
            {
                PLOG_WARNING << "Could not parse block " << block.describe() << ": line " << scan.error_line << ": "
                             << scan.error;
                utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Parsing, "Code block kept verbatim",
                                                    block.describe() + ": " + scan.error);
                sections.main.push_back(block.content);
                continue;
            }

            for (std::size_t i = 0; i < scan.statements.size(); ++i)
            {
                const Statement& st = scan.statements[i];
                switch (st.kind)
                {
                case StatementKind::Import:
                    break;
                case StatementKind::Docstring:
                    if (sections.module_docstring)
                    {
                        if (!containsText(sections.main, st.text))
                            sections.main.push_back(st.text);
                    }
                    else if (config_.preserve_docstrings)
                    {
                        sections.module_docstring = st.text;
                    }
                    break;
                case StatementKind::Function:
                    if (!containsText(sections.functions, st.text))
                        sections.functions.emplace_back(st.name, st.text);
                    break;
                case StatementKind::Class:
                    if (!containsText(sections.classes, st.text))
                        sections.classes.emplace_back(st.name, st.text);
                    break;
                case StatementKind::Assignment:
                    if (!containsText(sections.globals, st.text))
                        sections.globals.push_back(st.text);
                    break;
                case StatementKind::Other:
                    if (!containsText(sections.main, st.text))
                        sections.main.push_back(st.text);
                    break;
                }
            }
        }
        return std::string();
    });
    logStage(sections_stage);
    if (!sections_stage.succeeded)
        fail(sections_stage, "Failed to organize code sections",
             { "Check code block structure", "Ensure valid Python syntax in all blocks" });

    auto stitch_stage = processing::run_stage<std::string>("stitching", [&]() {
        Stitched s;
        s.functions = mergeByName(sections.functions, "func_");
        s.classes = mergeByName(sections.classes, "class_");
        s.globals = organizeGlobals(sections.globals);
        s.main = organizeMain(sections.main, config_.indent_size);

        std::vector<std::string> parts;
        if (sections.module_docstring && !sections.module_docstring->empty())
            parts.push_back(*sections.module_docstring);
        for (const std::string* part : { &imports_stage.result, &s.globals, &s.functions, &s.classes, &s.main })
        {
            if (!part->empty())
                parts.push_back(*part);
        }
        return joinWith(parts, kSectionJoin);
    });
    logStage(stitch_stage);
    if (!stitch_stage.succeeded)
        fail(stitch_stage, "Failed to stitch code sections",
             { "Check for naming conflicts", "Ensure function/class definitions are valid" });

    auto post_stage = processing::run_stage<std::string>("postprocess", [&]() {
        CodeFormatter formatter(config_.indent_size, config_.max_line_length);
        return formatter.format(stitch_stage.result);
    });
    logStage(post_stage);
    if (!post_stage.succeeded)
        fail(post_stage, "Consistency or cleanup failed", { "Check for severe indentation errors" });

    PLOG_INFO << "Code assembly complete";
    return post_stage.result;
}

} // namespace assembly
