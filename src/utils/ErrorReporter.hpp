#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <chrono>

namespace utils {

enum class ErrorCategory
{
    Initialization,   // Logger setup, worker pool startup
    Configuration,    // TOML parsing, invalid config values
    Parsing,          // Parser collaborator failures
    Translation,      // Translator / model backend failures
    Streaming,        // Chunk processing failures and timeouts
    Assembly,         // Assembler stage failures
    Unknown
};

enum class ErrorSeverity
{
    Info,    // Informational, no action needed
    Warning, // Degraded functionality, but continues
    Error,   // Operation failed, but the run can continue
    Fatal    // Critical error, the run should stop
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // Short, actionable message
    std::string technical_details; // Technical details for logs/bug reports
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);
};

/**
 * @brief Thread-safe error reporter
 *
 * Collects non-fatal failures from the streaming pipeline, the translator and
 * the assembler. Every report is logged through plog and queued so that a
 * caller can inspect what degraded during a run.
 *
 * Usage:
 *   ErrorReporter::ReportWarning(ErrorCategory::Translation,
 *                                "Block kept untranslated",
 *                                "chunk 3: model returned empty result");
 *
 *   if (ErrorReporter::HasPendingErrors()) {
 *       auto errors = ErrorReporter::GetPendingErrors();
 *   }
 */
class ErrorReporter
{
public:
    /**
     * @brief Report an error to the system
     * @param category Error category
     * @param severity Error severity
     * @param user_message Short message
     * @param technical_details Technical details for debugging
     */
    static void ReportError(ErrorCategory category, ErrorSeverity severity,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportError(ErrorCategory category,
                           const std::string& user_message,
                           const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category,
                             const std::string& user_message,
                             const std::string& technical_details = "");

    static bool HasPendingErrors();

    /**
     * @brief Get all pending errors and clear the queue
     * @return Vector of error reports, oldest first
     */
    static std::vector<ErrorReport> GetPendingErrors();

    /**
     * @brief Get the last queued error (default report when the queue is empty)
     */
    static ErrorReport GetLastError();

    static void ClearErrors();

    /**
     * @brief Reports already handed out by GetPendingErrors(), bounded
     */
    static std::vector<ErrorReport> GetHistorySnapshot();

    static std::string CategoryToString(ErrorCategory category);
    static std::string SeverityToString(ErrorSeverity severity);
    static std::string GetTimestamp();

private:
    static void AppendToHistoryLocked(const ErrorReport& report);

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static std::vector<ErrorReport> s_error_history;
    static constexpr size_t MAX_QUEUE_SIZE = 100;
    static constexpr size_t MAX_HISTORY_SIZE = 500;
};

} // namespace utils
