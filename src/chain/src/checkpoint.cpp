#include "checkpoint.hpp"

#include <charconv>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "file.hpp"
#include "utils.hpp"

namespace tad::chain
{
    CheckpointStore::CheckpointStore(std::filesystem::path path, std::uint64_t lookback)
        : _path(std::move(path)),
          _lookback(lookback)
    {
    }

    const std::filesystem::path & CheckpointStore::path() const noexcept
    {
        return _path;
    }

    std::uint64_t CheckpointStore::lookback() const noexcept
    {
        return _lookback;
    }

    std::optional<std::uint64_t> CheckpointStore::stored() const
    {
        const auto content = file::loadTextFile(_path);
        if(!content)
        {
            return std::nullopt;
        }

        const std::string text = utils::trim(*content);
        std::uint64_t height = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), height);
        if(text.empty() || ec != std::errc() || ptr != text.data() + text.size())
        {
            spdlog::warn("Checkpoint file {} is unparsable: '{}'", _path.string(), text);
            return std::nullopt;
        }

        return height;
    }

    std::uint64_t CheckpointStore::load(const std::uint64_t current_height) const
    {
        if(const auto height = stored())
        {
            spdlog::info("Resuming from checkpoint block {}", *height);
            return *height;
        }

        const std::uint64_t start = current_height > _lookback ? current_height - _lookback : 0;
        spdlog::info("No checkpoint found, starting from block {} (current: {})", start, current_height);
        return start;
    }

    bool CheckpointStore::save(const std::uint64_t height)
    {
        if(const auto previous = stored(); previous && height < *previous)
        {
            spdlog::warn("Refusing to move checkpoint backwards ({} -> {})", *previous, height);
            return false;
        }

        if(!file::writeTextFileAtomic(_path, std::to_string(height)))
        {
            spdlog::error("Failed to persist checkpoint {} to {}", height, _path.string());
            return false;
        }

        spdlog::debug("Checkpoint saved at block {}", height);
        return true;
    }
}
