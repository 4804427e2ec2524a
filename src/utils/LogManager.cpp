#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "Profile.hpp"
#include "../processing/Diagnostics.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

namespace utils
{

bool LogManager::s_initialized = false;
LogSettings LogManager::s_settings;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const LogSettings& settings)
{
    if (s_initialized)
        return true;

    s_settings = settings;
    if (!PrepareDirectory())
        return false;

    if (!OpenLogger<0>("notecard", s_settings.level, s_settings.console))
        return false;

    // Traces are written at info/debug; verbose mode lets the debug lines through
    const plog::Severity trace_level = s_settings.verbose ? plog::debug : s_settings.level;
    if (!OpenLogger<processing::Diagnostics::kLogInstance>("recognition", trace_level, false))
        return false;

#if NOTECARD_PROFILING_LEVEL >= 1
    if (!OpenLogger<profiling::kProfilingLogInstance>("profiling", plog::debug, false))
        return false;
#endif

    s_initialized = true;
    ReplayPendingReports();
    PLOG_INFO << "Logging to " << s_settings.directory << " (level " << plog::severityToString(s_settings.level)
              << (s_settings.append ? ", append" : ", truncate") << ")";
    return true;
}

template<int InstanceId>
bool LogManager::OpenLogger(std::string_view name, plog::Severity level, bool console)
{
    const std::string path = LogPath(name);
    try
    {
        if (!s_settings.append)
            std::ofstream(path, std::ios::trunc).close();

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            path.c_str(), s_settings.max_file_size, static_cast<int>(s_settings.backup_count));
        plog::init<InstanceId>(level, file_appender.get());
        s_appenders.push_back(std::move(file_appender));

        if (console)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            if (auto logger = plog::get<InstanceId>())
            {
                logger->addAppender(console_appender.get());
                s_appenders.push_back(std::move(console_appender));
            }
        }
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Configuration, "Cannot open log file", path + ": " + ex.what());
        return false;
    }
}

bool LogManager::IsInitialized() { return s_initialized; }

const LogSettings& LogManager::Settings() { return s_settings; }

std::string LogManager::LogPath(std::string_view name)
{
    std::filesystem::path path(s_settings.directory);
    path /= std::string(name) + ".log";
    return path.string();
}

bool LogManager::PrepareDirectory()
{
    if (s_settings.directory.empty())
        s_settings.directory = ".";

    std::error_code ec;
    std::filesystem::create_directories(s_settings.directory, ec);
    if (ec)
    {
        ErrorReporter::ReportError(ErrorCategory::Configuration, "Unable to prepare log directory",
                                   s_settings.directory + ": " + ec.message());
        return false;
    }
    return true;
}

void LogManager::ReplayPendingReports()
{
    for (const auto& report : ErrorReporter::PeekPendingErrors())
    {
        PLOG_INFO << "Earlier report (" << ErrorReporter::FormatTimestamp(report.raised_at) << ", "
                  << ErrorReporter::SeverityToString(report.severity) << ") ["
                  << ErrorReporter::CategoryToString(report.category) << "] " << report.summary
                  << (report.details.empty() ? "" : " | ") << report.details;
    }
}

} // namespace utils
