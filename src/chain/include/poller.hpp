#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "address.hpp"
#include "chain_error.hpp"
#include "events.hpp"
#include "rpc.hpp"

namespace tad::chain
{
    struct PollerConfig
    {
        std::string rpc_url;
        chain::Address deposit_address{};

        std::uint64_t max_block_span = 1000;
        std::uint64_t confirmations = 0;
    };

    enum class PollerState : std::uint8_t
    {
        IDLE = 0,
        FETCHING
    };

    struct Batch
    {
        std::vector<SubmissionEvent> events;
        std::uint64_t from_block = 0;
        std::uint64_t to_block = 0;
    };

    using WallClock = std::function<std::chrono::system_clock::time_point()>;

    class EventPoller
    {
    public:
        EventPoller(PollerConfig cfg, RpcCall rpc_call, WallClock clock = {});

        const PollerConfig & config() const noexcept;

        PollerState state() const noexcept;

        /**
         * @brief Chain head minus the configured confirmation depth (floored at 0).
         */
        Result<std::uint64_t> currentHeight() const;

        /**
         * @brief Queries DepositProcessed logs in [from_block, to_block].
         *
         * The range is clamped to `max_block_span` blocks past `from_block`.
         * An inverted range returns an empty batch without querying the node.
         * Events are ordered by block number, then log index. Undecodable logs are dropped.
         */
        Result<Batch> fetch(std::uint64_t from_block, std::uint64_t to_block);

        /**
         * @brief Same as fetch, but a query failure is logged and yields an empty list.
         */
        std::vector<SubmissionEvent> poll(std::uint64_t from_block, std::uint64_t to_block);

        /**
         * @brief One poll cycle past `checkpoint`: reads the head and fetches [checkpoint + 1, head].
         *
         * @return std::nullopt when the query failed or there is nothing new. The caller commits
         * `to_block` once every event of the batch was handed off.
         */
        std::optional<Batch> pollOnce(std::uint64_t checkpoint);

        /**
         * @brief Same as pollOnce(checkpoint) against a head the caller already read with currentHeight().
         */
        std::optional<Batch> pollOnce(std::uint64_t checkpoint, std::uint64_t head);

    private:
        PollerConfig _cfg;
        RpcClient _rpc;
        WallClock _clock;
        std::atomic<PollerState> _state;
    };

    /**
     * @brief Content locator carried by the event's validation string.
     *
     * The validation string is free-form. The first http(s) URL on twitter.com or x.com
     * (optionally www. or mobile.) found in it is returned, up to the next whitespace.
     *
     * @return std::nullopt when the string carries no such URL.
     */
    std::optional<std::string> extractReference(const SubmissionEvent & event);

    std::optional<std::string> extractReference(const std::string & validation);
}
