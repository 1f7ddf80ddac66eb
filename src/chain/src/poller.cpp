#include "poller.hpp"

#include <algorithm>
#include <format>
#include <regex>
#include <tuple>
#include <utility>

#include <spdlog/spdlog.h>


namespace tad::chain
{
    namespace
    {
        struct _FetchingScope
        {
            explicit _FetchingScope(std::atomic<PollerState> & state)
                : _state(state)
            {
                _state.store(PollerState::FETCHING);
            }

            ~_FetchingScope()
            {
                _state.store(PollerState::IDLE);
            }

            std::atomic<PollerState> & _state;
        };
    }

    EventPoller::EventPoller(PollerConfig cfg, RpcCall rpc_call, WallClock clock)
        : _cfg(std::move(cfg)),
          _rpc(_cfg.rpc_url, std::move(rpc_call)),
          _clock(std::move(clock)),
          _state(PollerState::IDLE)
    {
        if(!_clock)
        {
            _clock = [] { return std::chrono::system_clock::now(); };
        }
    }

    const PollerConfig & EventPoller::config() const noexcept
    {
        return _cfg;
    }

    PollerState EventPoller::state() const noexcept
    {
        return _state.load();
    }

    Result<std::uint64_t> EventPoller::currentHeight() const
    {
        const auto head = _rpc.blockNumber();
        if(!head)
        {
            return std::unexpected(head.error());
        }
        return *head > _cfg.confirmations ? *head - _cfg.confirmations : 0;
    }

    Result<Batch> EventPoller::fetch(const std::uint64_t from_block, std::uint64_t to_block)
    {
        if(from_block > to_block)
        {
            spdlog::debug("Empty block range [{}, {}], skipping query", from_block, to_block);
            return Batch{.events = {}, .from_block = from_block, .to_block = to_block};
        }

        if(_cfg.max_block_span > 0 && to_block - from_block > _cfg.max_block_span)
        {
            spdlog::debug("Clamping block range [{}, {}] to {} blocks", from_block, to_block, _cfg.max_block_span);
            to_block = from_block + _cfg.max_block_span;
        }

        _FetchingScope scope(_state);

        const auto logs = _rpc.getLogs(_cfg.deposit_address, from_block, to_block, depositProcessedTopic());
        if(!logs)
        {
            return std::unexpected(logs.error());
        }

        const auto observed_at = _clock();

        Batch batch{.events = {}, .from_block = from_block, .to_block = to_block};
        batch.events.reserve(logs->size());
        for(const auto & log : *logs)
        {
            auto event = decodeSubmissionEvent(log, observed_at);
            if(!event)
            {
                spdlog::warn("Dropping undecodable DepositProcessed log: {}", log.dump());
                continue;
            }
            batch.events.push_back(std::move(*event));
        }

        std::ranges::stable_sort(batch.events, [](const SubmissionEvent & lhs, const SubmissionEvent & rhs)
        {
            return std::tie(lhs.block_number, lhs.log_index) < std::tie(rhs.block_number, rhs.log_index);
        });

        if(!batch.events.empty())
        {
            spdlog::info("Found {} submission event(s) in blocks [{}, {}]", batch.events.size(), from_block, to_block);
        }
        return batch;
    }

    std::vector<SubmissionEvent> EventPoller::poll(const std::uint64_t from_block, const std::uint64_t to_block)
    {
        auto batch = fetch(from_block, to_block);
        if(!batch)
        {
            spdlog::error("Polling blocks [{}, {}] failed ({}): {}",
                from_block, to_block, std::format("{}", batch.error().kind), batch.error().message);
            return {};
        }
        return std::move(batch->events);
    }

    std::optional<Batch> EventPoller::pollOnce(const std::uint64_t checkpoint)
    {
        const auto head = currentHeight();
        if(!head)
        {
            spdlog::error("Cannot read chain head ({}): {}", std::format("{}", head.error().kind), head.error().message);
            return std::nullopt;
        }
        return pollOnce(checkpoint, *head);
    }

    std::optional<Batch> EventPoller::pollOnce(const std::uint64_t checkpoint, const std::uint64_t head)
    {
        const std::uint64_t from_block = checkpoint + 1;
        if(from_block > head)
        {
            spdlog::debug("No new blocks (checkpoint {}, head {})", checkpoint, head);
            return std::nullopt;
        }

        auto batch = fetch(from_block, head);
        if(!batch)
        {
            spdlog::error("Polling blocks [{}, {}] failed ({}): {}",
                from_block, head, std::format("{}", batch.error().kind), batch.error().message);
            return std::nullopt;
        }
        return std::move(*batch);
    }

    std::optional<std::string> extractReference(const std::string & validation)
    {
        // host must end at '/', whitespace or the end, so x.com.evil.io is not a match
        static const std::regex locator_pattern(
            R"(https?://(www\.|mobile\.)?(twitter\.com|x\.com)(/\S*)?(?=\s|$))",
            std::regex::ECMAScript | std::regex::icase);

        std::smatch match;
        if(!std::regex_search(validation, match, locator_pattern))
        {
            return std::nullopt;
        }
        return match.str(0);
    }

    std::optional<std::string> extractReference(const SubmissionEvent & event)
    {
        return extractReference(event.validation);
    }
}
