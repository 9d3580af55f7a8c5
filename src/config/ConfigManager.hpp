#pragma once

#include <string>
#include <string_view>
#include <functional>
#include <memory>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
    std::function<toml::table()> save;
};

// Owns one TOML file. Each registered handler owns a set of keys under a
// dotted table path; load() feeds it its section (an empty table when the
// section is missing) and save() writes back only the keys it owns.
class ConfigManager
{
public:
    explicit ConfigManager(std::string path = "pseudoflow.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // A missing file leaves every handler at its defaults and succeeds.
    bool load();
    bool loadFromString(std::string_view document);
    bool reloadIfChanged();
    bool save();

    const toml::table& root() const;
    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    bool parseAndApply(std::string_view document, const std::string& source_name);
    void applyHandlers();

    toml::table* resolveTablePath(toml::table& root, const std::string& path);
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;

    std::string config_path_;
    std::string last_error_;
    long long last_mtime_ = 0;

    struct HandlerEntry
    {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
