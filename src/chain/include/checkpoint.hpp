#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

namespace tad::chain
{
    /**
     * @brief Durable "last fully processed block height" stored as a plain-text integer.
     *
     * The stored value never decreases. Writes replace the file atomically.
     */
    class CheckpointStore
    {
    public:
        static constexpr std::uint64_t LOOKBACK = 100;

        explicit CheckpointStore(std::filesystem::path path, std::uint64_t lookback = LOOKBACK);

        const std::filesystem::path & path() const noexcept;

        std::uint64_t lookback() const noexcept;

        /**
         * @brief The persisted height, or std::nullopt when absent or unparsable.
         */
        std::optional<std::uint64_t> stored() const;

        /**
         * @brief The persisted height, falling back to current_height - lookback (floored at 0).
         *
         * Never fails: a missing or corrupt checkpoint is the cold-start case.
         */
        std::uint64_t load(std::uint64_t current_height) const;

        /**
         * @brief Persists `height`.
         *
         * @return false when the write failed or `height` is below the persisted value
         * (the file is left untouched in both cases).
         */
        bool save(std::uint64_t height);

    private:
        std::filesystem::path _path;
        std::uint64_t _lookback;
    };
}
