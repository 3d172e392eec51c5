#pragma once

#include "Diagnostics.hpp"
#include "PipelineTypes.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <chrono>
#include <exception>
#include <string>

#include <plog/Log.h>

namespace provlens::processing
{

// Runs fn() as a named stage. An exception thrown by the stage is logged to the diagnostics
// channel and queued as a warning under `category`; the caller receives an empty result and
// substitutes its placeholder, so public pipeline functions never throw.
template <typename T, typename Fn>
StageResult<T> run_stage(const std::string& stage_name, Fn&& fn,
                         utils::ErrorCategory category = utils::ErrorCategory::Formatting)
{
    PROFILE_SCOPE_CUSTOM(stage_name);

    StageResult<T> result;
    result.stage_name = stage_name;
    const auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start]()
    { return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start); };

    try
    {
        result.value.emplace(fn());
        result.duration = elapsed();
        if (Diagnostics::IsVerbose())
            PLOG_INFO_(Diagnostics::kLogInstance) << "stage=" << stage_name << " ok in " << result.duration.count() << "us";
    }
    catch (const std::exception& ex)
    {
        result.duration = elapsed();
        result.error = ex.what();
        PLOG_WARNING_(Diagnostics::kLogInstance)
            << "stage=" << stage_name << " failed in " << result.duration.count() << "us: " << result.error;
        utils::ErrorReporter::ReportWarning(category, "Pipeline stage failed", stage_name + ": " + result.error);
    }
    return result;
}

} // namespace provlens::processing
