#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

// NOTECARD_PROFILING_LEVEL comes from CMake:
//   0 = off, every macro below compiles to nothing
//   1 = scope timers on the profiling logger plus a per-scope summary
//   2 = level 1 plus Tracy zones

#ifndef NOTECARD_PROFILING_LEVEL
#define NOTECARD_PROFILING_LEVEL 0
#endif

#if NOTECARD_PROFILING_LEVEL >= 2
#include <tracy/Tracy.hpp>
#endif

#if NOTECARD_PROFILING_LEVEL >= 1
#include <plog/Log.h>
#endif

namespace profiling
{

#if NOTECARD_PROFILING_LEVEL >= 1
constexpr int kProfilingLogInstance = 2;

namespace detail
{

struct ScopeStats
{
    std::size_t calls = 0;
    std::chrono::microseconds total{ 0 };
    std::chrono::microseconds worst{ 0 };
};

// Totals per scope name for the whole process; stage names repeat once per note
class Summary
{
public:
    static void record(const std::string& name, std::chrono::microseconds elapsed)
    {
        std::lock_guard<std::mutex> lock(mutex());
        ScopeStats& s = table()[name];
        ++s.calls;
        s.total += elapsed;
        if (elapsed > s.worst)
            s.worst = elapsed;
    }

    static void log()
    {
        std::lock_guard<std::mutex> lock(mutex());
        for (const auto& [name, s] : table())
        {
            PLOG_INFO_(kProfilingLogInstance) << "[PROFILE] summary " << name << " calls=" << s.calls
                                              << " total=" << s.total.count() << "us"
                                              << " avg=" << s.total.count() / static_cast<long long>(s.calls) << "us"
                                              << " worst=" << s.worst.count() << "us";
        }
    }

private:
    static std::mutex& mutex()
    {
        static std::mutex m;
        return m;
    }

    static std::map<std::string, ScopeStats>& table()
    {
        static std::map<std::string, ScopeStats> t;
        return t;
    }
};

// Logs the elapsed time of one scope and adds it to the summary
class ScopeTimer
{
public:
    explicit ScopeTimer(std::string_view name)
        : name_(name)
        , start_(std::chrono::steady_clock::now())
    {
    }

    ~ScopeTimer() noexcept
    {
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_);
        PLOG_DEBUG_(kProfilingLogInstance) << "[PROFILE] " << name_ << " " << elapsed.count() << "us";
        try
        {
            Summary::record(name_, elapsed);
        }
        catch (const std::exception&)
        {
            // Allocation failure while growing the table; the debug line above still has the timing
        }
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

private:
    std::string name_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace detail
#endif

#if NOTECARD_PROFILING_LEVEL >= 2
namespace detail
{

inline std::uint16_t tracyLength(std::string_view name) noexcept
{
    return name.size() > 0xFFFF ? static_cast<std::uint16_t>(0xFFFF) : static_cast<std::uint16_t>(name.size());
}

} // namespace detail
#endif

} // namespace profiling

#if NOTECARD_PROFILING_LEVEL == 0
#define PROFILE_SCOPE_FUNCTION() ((void)0)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ((void)sizeof(nameExpr))
#define PROFILE_THREAD_NAME(nameExpr) ((void)0)
#define PROFILE_LOG_SUMMARY() ((void)0)

#elif NOTECARD_PROFILING_LEVEL == 1
#define PROFILE_SCOPE_FUNCTION() ::profiling::detail::ScopeTimer __profiling_timer(__FUNCTION__)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ::profiling::detail::ScopeTimer __profiling_timer(nameExpr)
#define PROFILE_THREAD_NAME(nameExpr) ((void)0)
#define PROFILE_LOG_SUMMARY() ::profiling::detail::Summary::log()

#elif NOTECARD_PROFILING_LEVEL >= 2
#define PROFILE_SCOPE_FUNCTION() \
    ZoneScopedN(__FUNCTION__);   \
    ::profiling::detail::ScopeTimer __profiling_timer(__FUNCTION__)

#define PROFILE_SCOPE_CUSTOM(nameExpr)                                                          \
    ZoneScoped;                                                                                 \
    ::profiling::detail::ScopeTimer __profiling_timer(nameExpr);                                \
    {                                                                                           \
        const std::string_view __profiling_zone_name(nameExpr);                                 \
        ZoneName(__profiling_zone_name.data(), ::profiling::detail::tracyLength(__profiling_zone_name)); \
    }

#define PROFILE_THREAD_NAME(nameExpr) tracy::SetThreadName(nameExpr)
#define PROFILE_LOG_SUMMARY() ::profiling::detail::Summary::log()

#endif
