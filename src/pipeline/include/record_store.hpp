#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <vector>

#include "content_record.hpp"

namespace tad::pipeline
{
    /**
     * @brief Local durable copy of every processed record, one pretty JSON file each.
     *
     * Files are named tweet_<UTC yyyymmdd_HHMMSS>_<first 8 hex of the content hash>.json.
     */
    class RecordStore
    {
    public:
        explicit RecordStore(std::filesystem::path directory);

        const std::filesystem::path & directory() const noexcept;

        std::optional<std::filesystem::path> save(const ContentRecord & record, std::chrono::system_clock::time_point now) const;

        /**
         * @brief Record files sorted by name, oldest first.
         */
        std::vector<std::filesystem::path> list() const;

        parse::Result<ContentRecord> load(const std::filesystem::path & path) const;

    private:
        std::filesystem::path _directory;
    };
}
