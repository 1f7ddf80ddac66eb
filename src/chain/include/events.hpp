#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "address.hpp"
#include "hex.hpp"

namespace tad::chain
{
    /**
     * DepositProcessed(uint256 indexed ipAmount, bytes32 indexed tweetHash, address indexed depositor,
     *                  address recipient, string validation, bytes proof)
     */
    inline constexpr const char* DEPOSIT_PROCESSED_SIGNATURE = "DepositProcessed(uint256,bytes32,address,address,string,bytes)";

    struct SubmissionEvent
    {
        std::uint64_t block_number = 0;
        std::string transaction_hash;
        std::uint64_t log_index = 0;

        evmc::bytes32 content_hash{};
        Address depositor{};
        Address recipient{};
        evmc::bytes32 ip_amount{};

        std::string validation;
        Bytes proof;

        std::chrono::system_clock::time_point emitted_at{};
    };

    /**
     * @brief 0x-prefixed lower-case topic0 of DepositProcessed.
     */
    const std::string & depositProcessedTopic();

    /**
     * @brief Decodes a raw eth_getLogs entry into a SubmissionEvent.
     *
     * The emission time is the log's blockTimestamp when the node provides one,
     * otherwise `observed_at`.
     *
     * @return std::nullopt when a required field is missing or cannot be decoded.
     */
    std::optional<SubmissionEvent> decodeSubmissionEvent(const nlohmann::json & log, std::chrono::system_clock::time_point observed_at);

    /**
     * @brief Deduplication key of a ledger log entry: "<tx hash>:<log index>".
     */
    std::string eventKey(const SubmissionEvent & event);
}
