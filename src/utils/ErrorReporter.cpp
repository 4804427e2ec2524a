#include "ErrorReporter.hpp"

#include <ctime>
#include <iomanip>
#include <iterator>
#include <sstream>

#include <plog/Log.h>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::deque<ErrorReport> ErrorReporter::s_queue;
ErrorTally ErrorReporter::s_tally;

namespace
{

plog::Severity toPlogSeverity(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return plog::info;
    case ErrorSeverity::Warning:
        return plog::warning;
    case ErrorSeverity::Error:
        return plog::error;
    case ErrorSeverity::Fatal:
        return plog::fatal;
    }
    return plog::error;
}

} // namespace

void ErrorReporter::Report(ErrorCategory category, ErrorSeverity severity, const std::string& summary,
                           const std::string& details)
{
    PLOG(toPlogSeverity(severity)) << "[" << CategoryToString(category) << "] " << summary
                                   << (details.empty() ? "" : " | ") << details;

    ErrorReport report;
    report.category = category;
    report.severity = severity;
    report.summary = summary;
    report.details = details;
    report.raised_at = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(s_mutex);
    if (severity == ErrorSeverity::Warning)
        ++s_tally.warnings;
    else if (severity == ErrorSeverity::Error || severity == ErrorSeverity::Fatal)
        ++s_tally.errors;
    ++s_tally.by_category[static_cast<std::size_t>(category)];

    s_queue.push_back(std::move(report));
    if (s_queue.size() > kMaxQueueSize)
        s_queue.pop_front();
}

void ErrorReporter::ReportInfo(ErrorCategory category, const std::string& summary, const std::string& details)
{
    Report(category, ErrorSeverity::Info, summary, details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& summary, const std::string& details)
{
    Report(category, ErrorSeverity::Warning, summary, details);
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& summary, const std::string& details)
{
    Report(category, ErrorSeverity::Error, summary, details);
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_queue.empty();
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> drained(std::make_move_iterator(s_queue.begin()), std::make_move_iterator(s_queue.end()));
    s_queue.clear();
    return drained;
}

std::vector<ErrorReport> ErrorReporter::PeekPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return { s_queue.begin(), s_queue.end() };
}

std::optional<ErrorReport> ErrorReporter::GetLastError()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_queue.empty())
        return std::nullopt;
    return s_queue.back();
}

ErrorTally ErrorReporter::GetTally()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_tally;
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_queue.clear();
    s_tally = ErrorTally{};
}

const char* ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Configuration:
        return "configuration";
    case ErrorCategory::PatternRegistry:
        return "pattern-registry";
    case ErrorCategory::Parsing:
        return "parsing";
    case ErrorCategory::Import:
        return "import";
    case ErrorCategory::Unknown:
        break;
    }
    return "unknown";
}

const char* ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return "info";
    case ErrorSeverity::Warning:
        return "warning";
    case ErrorSeverity::Error:
        return "error";
    case ErrorSeverity::Fatal:
        return "fatal";
    }
    return "unknown";
}

std::string ErrorReporter::FormatTimestamp(std::chrono::system_clock::time_point when)
{
    const auto time_t_when = std::chrono::system_clock::to_time_t(when);

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_when);
#else
    localtime_r(&time_t_when, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace utils
