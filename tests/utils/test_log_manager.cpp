#include <catch2/catch_test_macros.hpp>
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace fs = std::filesystem;
using utils::LogManager;

namespace {

std::string readFile(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

void writeFile(const fs::path& path, const std::string& content) {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs << content;
}

} // namespace

// plog loggers are process-wide singletons, so the whole lifecycle lives in
// one test case and each instance is registered at most once.
TEST_CASE("LogManager lifecycle", "[utils][log]") {
    const fs::path base = fs::temp_directory_path() /
                          ("pseudoflow_logs_" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(base);
    LogManager::Shutdown();
    utils::ErrorReporter::ClearErrors();

    LogManager::LoggerConfig logger;
    logger.name = "pseudoflow";
    logger.filepath = (base / "logs" / "pseudoflow.log").string();

    REQUIRE_FALSE(LogManager::RegisterLogger<0>(logger));
    REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Initialization);

    const fs::path bad_config = base / "broken.toml";
    writeFile(bad_config, "[global\nappend_logs = ");
    REQUIRE(LogManager::Initialize(bad_config.string(), (base / "logs").string()));
    REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Configuration);
    REQUIRE(LogManager::GetDefaultLogLevel() == plog::info);
    LogManager::Shutdown();
    REQUIRE_FALSE(LogManager::IsInitialized());

    const fs::path config = base / "pseudoflow.toml";
    writeFile(config, "[global]\nappend_logs = false\n\n[app.debug]\nlogging_level = 5\n");

    REQUIRE(LogManager::Initialize(config.string(), (base / "logs").string()));
    REQUIRE(LogManager::IsInitialized());
    REQUIRE_FALSE(LogManager::IsAppendMode());
    REQUIRE(LogManager::GetDefaultLogLevel() == plog::debug);
    REQUIRE(LogManager::LogDirectory() == (base / "logs").string());
    REQUIRE(fs::is_directory(base / "logs"));

    // Already initialized: the second call is a no-op.
    REQUIRE(LogManager::Initialize(bad_config.string(), (base / "other").string()));
    REQUIRE(LogManager::LogDirectory() == (base / "logs").string());

    writeFile(logger.filepath, "stale line from a previous run\n");
    REQUIRE(LogManager::RegisterLogger<0>(logger));
    PLOG_DEBUG << "log manager test line";

    const std::string contents = readFile(logger.filepath);
    REQUIRE(contents.find("stale line") == std::string::npos);
    REQUIRE(contents.find("log manager test line") != std::string::npos);

    LogManager::Shutdown();
    REQUIRE_FALSE(LogManager::IsInitialized());
    PLOG_ERROR << "after shutdown";
    REQUIRE(readFile(logger.filepath).find("after shutdown") == std::string::npos);

    utils::ErrorReporter::ClearErrors();
    std::error_code ec;
    fs::remove_all(base, ec);
}
