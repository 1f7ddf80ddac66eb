#pragma once

#include <chrono>
#include <cstddef>

namespace tad::pipeline
{
    struct PipelineStats
    {
        std::size_t processed = 0;
        std::size_t stored = 0;
        std::size_t registered = 0;
        std::size_t resubmitted = 0;
        std::size_t errored = 0;

        std::chrono::system_clock::time_point started_at{};
    };

    void logStats(const PipelineStats & stats, std::chrono::system_clock::time_point now);
}
