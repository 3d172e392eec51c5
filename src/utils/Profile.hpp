#pragma once

// PROVLENS_PROFILING_LEVEL is set by CMake:
//   0 = compiled out
//   1 = scope timers written to the profiling log channel

#ifndef PROVLENS_PROFILING_LEVEL
#define PROVLENS_PROFILING_LEVEL 0
#endif

#if PROVLENS_PROFILING_LEVEL >= 1

#include <chrono>
#include <string>

#include <plog/Log.h>

namespace provlens::profiling
{

constexpr int kProfilingLogInstance = 2;

namespace detail
{

// Logs the wall time spent in the enclosing scope when it is left.
class ScopeTimer
{
public:
    explicit ScopeTimer(std::string label)
        : label_(std::move(label))
        , start_(std::chrono::steady_clock::now())
    {
    }

    ~ScopeTimer()
    {
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_);
        PLOG_DEBUG_(kProfilingLogInstance) << "[profile] " << label_ << ": " << elapsed.count() << " us";
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

private:
    std::string label_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace detail
} // namespace provlens::profiling

#define PROVLENS_PROFILE_CONCAT_INNER(a, b) a##b
#define PROVLENS_PROFILE_CONCAT(a, b) PROVLENS_PROFILE_CONCAT_INNER(a, b)
#define PROFILE_SCOPE_CUSTOM(label)                                                                                    \
    ::provlens::profiling::detail::ScopeTimer PROVLENS_PROFILE_CONCAT(provlens_scope_timer_, __LINE__)(label)
#define PROFILE_SCOPE_FUNCTION() PROFILE_SCOPE_CUSTOM(__func__)

#else

#define PROFILE_SCOPE_CUSTOM(label) ((void)sizeof(label))
#define PROFILE_SCOPE_FUNCTION() ((void)0)

#endif
