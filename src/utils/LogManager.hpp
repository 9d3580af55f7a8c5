#pragma once

#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    // Reads [global].append_logs and [app.debug].logging_level from config_path.
    // A missing file keeps the defaults; a malformed one is reported and ignored.
    static bool Initialize(const std::string& config_path = "pseudoflow.toml",
                           const std::string& log_directory = "logs");

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    static bool IsInitialized();
    static bool IsAppendMode();
    static plog::Severity GetDefaultLogLevel();
    static const std::string& LogDirectory();

private:
    LogManager() = default;

    static void ReadConfig(const std::string& config_path);
    static void PrepareLogDirectory();

    static bool s_initialized;
    static bool s_append_logs;
    static plog::Severity s_default_level;
    static std::string s_log_directory;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
