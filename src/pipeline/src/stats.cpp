#include "stats.hpp"

#include <spdlog/spdlog.h>

namespace tad::pipeline
{
    void logStats(const PipelineStats & stats, const std::chrono::system_clock::time_point now)
    {
        const auto runtime = std::chrono::duration_cast<std::chrono::seconds>(now - stats.started_at);

        spdlog::info("---------------- Daemon statistics ----------------");
        spdlog::info("Runtime: {}s", runtime.count());
        spdlog::info("Processed: {}", stats.processed);
        spdlog::info("Stored: {}", stats.stored);
        spdlog::info("Registered on-chain: {}", stats.registered);
        spdlog::info("Resubmitted: {}", stats.resubmitted);
        spdlog::info("Errors: {}", stats.errored);
        spdlog::info("---------------------------------------------------");
    }
}
