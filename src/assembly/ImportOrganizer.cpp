#include "ImportOrganizer.hpp"

#include "../processing/Diagnostics.hpp"

#include <plog/Log.h>

#include <regex>
#include <unordered_set>

namespace assembly
{

namespace
{

const std::unordered_set<std::string>& standardLibrary()
{
    static const std::unordered_set<std::string> modules = {
        "abc",        "argparse",  "array",       "ast",       "asyncio",   "base64",     "bisect",
        "builtins",   "calendar",  "collections", "configparser", "contextlib", "copy",   "csv",
        "dataclasses", "datetime", "decimal",     "difflib",   "enum",      "functools",  "glob",
        "gzip",       "hashlib",   "heapq",       "html",      "http",      "io",         "itertools",
        "json",       "logging",   "math",        "multiprocessing", "operator", "os",   "pathlib",
        "pickle",     "platform",  "random",      "re",        "shutil",    "socket",     "sqlite3",
        "statistics", "string",    "subprocess",  "sys",       "tempfile",  "threading",  "time",
        "typing",     "urllib",    "uuid",        "warnings",  "weakref",   "xml",        "zipfile",
    };
    return modules;
}

std::string withAlias(const std::string& name, const std::string& alias)
{
    return alias.empty() ? name : name + " as " + alias;
}

} // namespace

const char* importGroupName(ImportGroup group)
{
    switch (group)
    {
    case ImportGroup::Standard:
        return "standard";
    case ImportGroup::ThirdParty:
        return "third_party";
    case ImportGroup::Local:
        return "local";
    }
    return "unknown";
}

const std::vector<std::pair<std::string, std::vector<std::string>>>& ImportOrganizer::commonImports()
{
    static const std::vector<std::pair<std::string, std::vector<std::string>>> table = {
        { "math", { "sin", "cos", "sqrt", "pi", "tan", "log", "exp" } },
        { "os", { "path", "getcwd", "listdir", "mkdir", "remove" } },
        { "sys", { "argv", "exit", "path", "platform" } },
        { "datetime", { "datetime", "date", "time", "timedelta" } },
        { "json", { "dumps", "loads", "dump", "load" } },
        { "re", { "match", "search", "findall", "sub", "compile" } },
        { "typing", { "List", "Dict", "Tuple", "Optional", "Union", "Any" } },
    };
    return table;
}

ImportGroup ImportOrganizer::classify(const std::string& module)
{
    std::string top = module.substr(0, module.find('.'));
    if (standardLibrary().count(top) != 0)
        return ImportGroup::Standard;
    if (module.empty() || module.front() == '.')
        return ImportGroup::Local;
    return ImportGroup::ThirdParty;
}

void ImportOrganizer::add(const ImportEntry& entry)
{
    Group& g = group(classify(entry.module));
    if (entry.from_import)
    {
        g.from[entry.module].insert(withAlias(entry.name, entry.alias));
        return;
    }
    g.plain.insert("import " + withAlias(entry.module, entry.alias));
    plain_modules_.insert(entry.module);
}

void ImportOrganizer::addAll(const std::vector<ImportEntry>& entries)
{
    for (const auto& e : entries)
        add(e);
}

bool ImportOrganizer::isImported(const std::string& module, const std::string& name) const
{
    if (plain_modules_.count(module) != 0)
        return true;
    for (const auto& g : groups_)
    {
        auto it = g.from.find(module);
        if (it != g.from.end() && it->second.count(name) != 0)
            return true;
    }
    return false;
}

int ImportOrganizer::injectCommonImports(const std::string& code)
{
    int added = 0;
    for (const auto& [module, names] : commonImports())
    {
        for (const auto& name : names)
        {
            const std::regex usage("\\b" + name + "\\s*\\(");
            if (!std::regex_search(code, usage) || isImported(module, name))
                continue;
            group(ImportGroup::Standard).from[module].insert(name);
            ++added;
            if (processing::Diagnostics::IsVerbose())
            {
                PLOG_DEBUG_(processing::Diagnostics::kLogInstance)
                    << "Auto-adding import: from " << module << " import " << name;
            }
        }
    }
    return added;
}

bool ImportOrganizer::empty() const
{
    for (const auto& g : groups_)
    {
        if (!g.plain.empty() || !g.from.empty())
            return false;
    }
    return true;
}

std::string ImportOrganizer::render() const
{
    std::string out;
    for (const auto& g : groups_)
    {
        std::vector<std::string> lines(g.plain.begin(), g.plain.end());
        for (const auto& [module, names] : g.from)
        {
            std::string line = "from " + module + " import ";
            bool first = true;
            for (const auto& n : names)
            {
                if (!first)
                    line += ", ";
                line += n;
                first = false;
            }
            lines.push_back(std::move(line));
        }
        if (lines.empty())
            continue;
        if (!out.empty())
            out += "\n\n";
        for (std::size_t i = 0; i < lines.size(); ++i)
        {
            if (i > 0)
                out.push_back('\n');
            out += lines[i];
        }
    }
    return out;
}

} // namespace assembly
