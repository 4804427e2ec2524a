#pragma once

#include "TextProcessingTypes.hpp"
#include "Diagnostics.hpp"

#include <chrono>
#include <exception>
#include <string>
#include <utility>

#include <plog/Log.h>

#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

namespace processing {

/**
 * @brief Runs one recognition stage and wraps the outcome in a StageResult<T>.
 *
 * std::regex can throw regex_error (error_complexity, error_stack) while
 * matching, and a user-supplied strategy may throw anything at all. Every
 * exception becomes a failed stage carrying ex.what() (or "unknown exception"
 * for types not derived from std::exception), so the pipeline and the
 * dual-mode parser always return a result.
 *
 * Failures are always traced; successes only in verbose mode, at debug level,
 * since the caller usually logs a richer line of its own.
 */
template<typename T, typename Fn>
text_processing::StageResult<T> run_stage(const std::string& stage_name, Fn&& fn)
{
    PROFILE_SCOPE_CUSTOM(stage_name);

    using namespace std::chrono;
    const auto start = steady_clock::now();
    auto elapsed = [&start]() { return duration_cast<microseconds>(steady_clock::now() - start); };

    try
    {
        T res = std::forward<Fn>(fn)();
        const auto dur = elapsed();
        if (Diagnostics::IsVerbose())
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance)
                << TraceLine("Stage").add("stage", stage_name).add("status", "ok").duration(dur).str();
        }
        return text_processing::StageResult<T>::success(std::move(res), dur, stage_name);
    }
    catch (const std::exception& ex)
    {
        const auto dur = elapsed();
        PLOG_ERROR_(Diagnostics::kLogInstance)
            << TraceLine("Stage").add("stage", stage_name).add("status", "error").duration(dur).add("reason", ex.what()).str();
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Parsing, "Recognition stage failed",
                                            stage_name + ": " + ex.what());
        return text_processing::StageResult<T>::failure(ex.what(), dur, stage_name);
    }
    catch (...)
    {
        const auto dur = elapsed();
        PLOG_ERROR_(Diagnostics::kLogInstance) << TraceLine("Stage")
                                                      .add("stage", stage_name)
                                                      .add("status", "error")
                                                      .duration(dur)
                                                      .add("reason", "unknown exception")
                                                      .str();
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Parsing, "Recognition stage failed",
                                            stage_name + ": unknown exception");
        return text_processing::StageResult<T>::failure("unknown exception", dur, stage_name);
    }
}

} // namespace processing
