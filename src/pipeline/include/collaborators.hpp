#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <optional>
#include <string>

#include "address.hpp"

namespace tad::pipeline
{
    struct CollaboratorError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,
            UNAVAILABLE,
            INVALID_RESPONSE,
            NOT_FOUND,
            REJECTED
        } kind = Kind::UNKNOWN;

        std::string message;
    };

    template<class T>
    using Outcome = std::expected<T, CollaboratorError>;

    struct FetchedContent
    {
        std::string url;
        std::string tweet_id;
        std::string body;
        std::string author;
        std::string handle;
        bool verified = false;

        std::uint64_t likes = 0;
        std::uint64_t retweets = 0;
        std::uint64_t replies = 0;

        std::chrono::system_clock::time_point captured_at{};
        std::string screenshot_url;
    };

    struct RemovalRisk
    {
        double score = 0.0;
        std::string analysis;
    };

    struct SentimentScore
    {
        std::string label;
        double controversy = 0.0;
    };

    struct EcosystemLabel
    {
        std::string token;
        double confidence = 0.0;
        std::string chain;
    };

    struct StorageReceipt
    {
        std::string data_cid;
        std::string root_cid;
        std::string car_cid;
        std::optional<std::string> deal_id;
    };

    /**
     * @brief Flattened on-chain registry row.
     */
    struct RegistryEntry
    {
        evmc::bytes32 content_hash{};
        std::string url;
        std::string tweet_id;
        std::string author;
        std::string handle;
        bool verified = false;

        std::string body;

        std::uint64_t timestamp = 0;
        std::uint64_t likes = 0;
        std::uint64_t retweets = 0;
        std::uint64_t replies = 0;
        std::uint64_t controversy_pct = 0;
        std::uint64_t removal_pct = 0;

        std::string screenshot_cid;
        std::string data_cid;
        std::string root_cid;
        std::string deal_id;
        std::string ecosystem;

        chain::Address submitter{};
    };

    class IContentFetcher
    {
    public:
        virtual ~IContentFetcher() = default;
        virtual Outcome<FetchedContent> fetch(const std::string & locator) = 0;
    };

    class IRemovalRiskScorer
    {
    public:
        virtual ~IRemovalRiskScorer() = default;

        /**
         * @return score in [0, 1]
         */
        virtual Outcome<RemovalRisk> scoreRemovalRisk(const std::string & text) = 0;
    };

    class ISentimentScorer
    {
    public:
        virtual ~ISentimentScorer() = default;
        virtual Outcome<SentimentScore> scoreSentiment(const std::string & text) = 0;
    };

    class IEcosystemClassifier
    {
    public:
        virtual ~IEcosystemClassifier() = default;
        virtual Outcome<EcosystemLabel> classify(const std::string & text) = 0;
    };

    class IStorage
    {
    public:
        virtual ~IStorage() = default;
        virtual Outcome<StorageReceipt> store(const std::filesystem::path & local_path) = 0;
    };

    class IRegistry
    {
    public:
        virtual ~IRegistry() = default;

        virtual Outcome<bool> exists(const evmc::bytes32 & content_hash) = 0;

        /**
         * @return transaction hash, or std::nullopt when the entry already existed
         */
        virtual Outcome<std::optional<std::string>> write(const RegistryEntry & entry) = 0;
    };

    class IResubmitter
    {
    public:
        virtual ~IResubmitter() = default;

        /**
         * @return transaction hash
         */
        virtual Outcome<std::string> submit(const std::string & locator, double score) = 0;
    };
}

template <>
struct std::formatter<tad::pipeline::CollaboratorError::Kind> : std::formatter<std::string>
{
    auto format(const tad::pipeline::CollaboratorError::Kind & err, format_context & ctx) const
    {
        switch(err)
        {
            case tad::pipeline::CollaboratorError::Kind::UNAVAILABLE:
                return formatter<string>::format("Unavailable", ctx);
            case tad::pipeline::CollaboratorError::Kind::INVALID_RESPONSE:
                return formatter<string>::format("Invalid response", ctx);
            case tad::pipeline::CollaboratorError::Kind::NOT_FOUND:
                return formatter<string>::format("Not found", ctx);
            case tad::pipeline::CollaboratorError::Kind::REJECTED:
                return formatter<string>::format("Rejected", ctx);
            default:
                return formatter<string>::format("Unknown", ctx);
        }
    }
};
