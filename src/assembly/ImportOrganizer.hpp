#pragma once

#include "SourceScanner.hpp"

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace assembly
{

enum class ImportGroup
{
    Standard = 0,
    ThirdParty = 1,
    Local = 2
};

const char* importGroupName(ImportGroup group);

// Collects imports from every block and renders one grouped import section:
// standard library, third party and local groups separated by a blank line,
// plain imports sorted and deduplicated, `from` imports merged per module.
class ImportOrganizer
{
public:
    void add(const ImportEntry& entry);
    void addAll(const std::vector<ImportEntry>& entries);

    // Injects `from <module> import <name>` for well known call-like usages
    // (`sqrt(`, `dumps(`, ...) that nothing imports yet. Returns the number of
    // names added.
    int injectCommonImports(const std::string& code);

    bool isImported(const std::string& module, const std::string& name) const;

    bool empty() const;
    std::string render() const;

    static ImportGroup classify(const std::string& module);

    // module -> names whose call sites trigger auto import
    static const std::vector<std::pair<std::string, std::vector<std::string>>>& commonImports();

private:
    struct Group
    {
        std::set<std::string> plain;                           // rendered `import x [as y]`
        std::map<std::string, std::set<std::string>> from;      // module -> `name [as alias]`
    };

    Group& group(ImportGroup g) { return groups_[static_cast<int>(g)]; }
    const Group& group(ImportGroup g) const { return groups_[static_cast<int>(g)]; }

    Group groups_[3];
    std::set<std::string> plain_modules_;
};

} // namespace assembly
