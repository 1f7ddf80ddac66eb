#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "content_record.pb.h"

#include "collaborators.hpp"
#include "events.hpp"
#include "parser.hpp"
#include "price_quote.hpp"

namespace tad::pipeline
{
    /**
     * @brief Outcome of the analyze stage. A missing member means that scorer failed.
     */
    struct AnalysisResult
    {
        std::optional<RemovalRisk> removal;
        std::optional<SentimentScore> sentiment;
        std::optional<EcosystemLabel> ecosystem;
        double combined_score = 0.0;
    };

    ContentRecord buildRecord(
        const chain::SubmissionEvent & event,
        const evmc::bytes32 & content_hash,
        const FetchedContent & content,
        const AnalysisResult & analysis,
        const std::optional<price::PriceQuote> & price,
        std::chrono::system_clock::time_point stored_at);

    /**
     * @brief Registry row for a stored record. Percent scores are truncated toward zero.
     */
    RegistryEntry makeRegistryEntry(
        const ContentRecord & record,
        const evmc::bytes32 & content_hash,
        const StorageReceipt & receipt,
        const chain::Address & submitter,
        std::chrono::system_clock::time_point registered_at);

    /**
     * @brief Last path segment of a gateway URL, e.g. the CID of https://gw/ipfs/<cid>.
     */
    std::string cidFromUrl(const std::string & url);
}

namespace tad::parse
{
    template<>
    Result<std::string> parseToJson(ContentRecord record, use_protobuf_t);

    template<>
    Result<ContentRecord> parseFromJson(std::string json_str, use_protobuf_t);

    /**
     * @brief Scraper output: content, user, handle, verified, likes, retweets, replies,
     * timestamp, tweet_id, screenshot. Counts may be numbers or strings like "1,204".
     */
    template<>
    Result<pipeline::FetchedContent> parseFromJson(json json_obj, use_json_t);
}
