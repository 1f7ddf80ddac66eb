#include "record_store.hpp"

#include <algorithm>
#include <format>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

#include "file.hpp"
#include "hex.hpp"
#include "utils.hpp"

namespace tad::pipeline
{
    RecordStore::RecordStore(std::filesystem::path directory)
        : _directory(std::move(directory))
    {
    }

    const std::filesystem::path & RecordStore::directory() const noexcept
    {
        return _directory;
    }

    std::optional<std::filesystem::path> RecordStore::save(const ContentRecord & record, const std::chrono::system_clock::time_point now) const
    {
        const auto json_res = parse::parseToJson(record, parse::use_protobuf);
        if(!json_res)
        {
            spdlog::error("Failed to serialize record {}: {}", record.content_hash(), json_res.error().message);
            return std::nullopt;
        }

        const std::string hash_hex = chain::stripHexPrefix(record.content_hash());
        const std::string name = std::format("tweet_{}_{}.json", utils::compactTimestamp(now), hash_hex.substr(0, 8));
        const auto output_path = _directory / name;

        if(!file::writeTextFileAtomic(output_path, *json_res))
        {
            spdlog::error("Failed to write record file {}", output_path.string());
            return std::nullopt;
        }
        return output_path;
    }

    std::vector<std::filesystem::path> RecordStore::list() const
    {
        std::vector<std::filesystem::path> out;

        std::error_code ec;
        if(!std::filesystem::is_directory(_directory, ec))
        {
            return out;
        }

        for(const auto & entry : std::filesystem::directory_iterator(_directory, ec))
        {
            const auto & path = entry.path();
            if(entry.is_regular_file() && path.extension() == ".json" && path.filename().string().starts_with("tweet_"))
            {
                out.push_back(path);
            }
        }

        if(ec)
        {
            spdlog::warn("Listing records in {} failed: {}", _directory.string(), ec.message());
        }

        std::ranges::sort(out);
        return out;
    }

    parse::Result<ContentRecord> RecordStore::load(const std::filesystem::path & path) const
    {
        const auto content = file::loadTextFile(path);
        if(!content)
        {
            return std::unexpected(parse::Error{parse::Error::Kind::INVALID_VALUE, std::format("cannot read {}", path.string())});
        }
        return parse::parseFromJson<ContentRecord>(*content, parse::use_protobuf);
    }
}
