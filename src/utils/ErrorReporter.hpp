#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Configuration,   // notecard.toml, logging setup
    PatternRegistry, // Registration, safety screen, regex compilation
    Parsing,         // Strategy failures inside the recognition pipeline
    Import,          // Custom pattern import/export
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // The call still produced a value
    Error,   // The caller receives an error value
    Fatal
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string summary; // One line, safe to show to the user
    std::string details; // Pattern id, regex error text, input preview
    std::chrono::system_clock::time_point raised_at{};
};

// Running totals; unlike the queue these are never truncated
struct ErrorTally
{
    std::size_t warnings = 0;
    std::size_t errors = 0; // Error and Fatal
    std::array<std::size_t, 5> by_category{};

    [[nodiscard]] std::size_t count(ErrorCategory category) const
    {
        return by_category[static_cast<std::size_t>(category)];
    }
};

/**
 * @brief Process-wide sink for problems the recognizer recovers from.
 *
 * Components never throw for a rejected pattern, a failed strategy or a bad
 * config value; they report here and carry on. Every report goes to the main
 * plog logger and into a bounded queue the CLI drains into its JSON output
 * when --verbose is given.
 *
 *   ErrorReporter::ReportWarning(ErrorCategory::PatternRegistry,
 *                                "Custom pattern rejected", "(a+)+: nested quantifier");
 */
class ErrorReporter
{
public:
    static void Report(ErrorCategory category, ErrorSeverity severity, const std::string& summary,
                       const std::string& details = "");

    static void ReportInfo(ErrorCategory category, const std::string& summary, const std::string& details = "");
    static void ReportWarning(ErrorCategory category, const std::string& summary, const std::string& details = "");
    static void ReportError(ErrorCategory category, const std::string& summary, const std::string& details = "");

    [[nodiscard]] static bool HasPendingErrors();

    // Drains the queue, oldest first
    [[nodiscard]] static std::vector<ErrorReport> GetPendingErrors();
    // Copy of the queue, left in place
    [[nodiscard]] static std::vector<ErrorReport> PeekPendingErrors();
    [[nodiscard]] static std::optional<ErrorReport> GetLastError();
    [[nodiscard]] static ErrorTally GetTally();

    // Empties the queue and resets the tally
    static void ClearErrors();

    [[nodiscard]] static const char* CategoryToString(ErrorCategory category);
    [[nodiscard]] static const char* SeverityToString(ErrorSeverity severity);
    [[nodiscard]] static std::string FormatTimestamp(std::chrono::system_clock::time_point when);

    static constexpr std::size_t kMaxQueueSize = 100;

private:
    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_queue;
    static ErrorTally s_tally;
};

} // namespace utils
