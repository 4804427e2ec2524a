#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// Resolved [logging] settings; the CLI fills this from config::ParserConfig
struct LogSettings
{
    std::string directory = "logs";
    bool append = true;
    plog::Severity level = plog::info;
    bool console = false; // Mirror the main log to stderr
    bool verbose = false; // Recognition traces at debug level
    std::size_t max_file_size = 5 * 1024 * 1024;
    std::size_t backup_count = 2;
};

/**
 * @brief Owns the plog appenders for the notecard process.
 *
 * Initialize() opens one rolling file per logger:
 *   - instance 0, notecard.log: ErrorReporter output and CLI progress
 *   - instance processing::Diagnostics::kLogInstance, recognition.log: stage traces
 *   - instance profiling::kProfilingLogInstance, profiling.log (profiling builds only)
 *
 * Reports raised before Initialize() (config parse problems) are not lost: they
 * sit in the ErrorReporter queue and are replayed into notecard.log.
 */
class LogManager
{
public:
    static bool Initialize(const LogSettings& settings);

    [[nodiscard]] static bool IsInitialized();
    [[nodiscard]] static const LogSettings& Settings();

    // <directory>/<name>.log
    [[nodiscard]] static std::string LogPath(std::string_view name);

private:
    LogManager() = default;

    template<int InstanceId>
    static bool OpenLogger(std::string_view name, plog::Severity level, bool console);

    static bool PrepareDirectory();
    static void ReplayPendingReports();

    static bool s_initialized;
    static LogSettings s_settings;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
