#include "orchestrator.hpp"

#include <exception>
#include <format>
#include <string_view>
#include <type_traits>
#include <utility>

#include <spdlog/spdlog.h>

#include "crypto.hpp"
#include "hex.hpp"
#include "poller.hpp"
#include "scoring.hpp"

namespace tad::pipeline
{
    namespace
    {
        // Turns a throwing collaborator into an Outcome error so one bad call cannot escape the event.
        template<class Callable>
        auto _guarded(const std::string_view stage, Callable && call) -> std::invoke_result_t<Callable>
        {
            try
            {
                return call();
            }
            catch(const std::exception & e)
            {
                return std::unexpected(CollaboratorError{
                    .kind = CollaboratorError::Kind::UNKNOWN,
                    .message = std::format("{} threw: {}", stage, e.what())
                });
            }
        }

        template<class T>
        void _logFailure(const std::string_view stage, const Outcome<T> & outcome)
        {
            spdlog::warn("{} failed ({}): {}", stage, std::format("{}", outcome.error().kind), outcome.error().message);
        }
    }

    Orchestrator::Orchestrator(Collaborators collaborators, OrchestratorConfig cfg)
        : _collaborators(collaborators),
          _cfg(std::move(cfg)),
          _records(_cfg.records_path),
          _guard(_collaborators.registry),
          _ledger(_cfg.ledger_path),
          _gate(_cfg.resubmission_threshold, _collaborators.resubmitter, &_ledger)
    {
        if(!_cfg.clock)
        {
            _cfg.clock = [] { return std::chrono::system_clock::now(); };
        }
        _stats.started_at = _cfg.clock();
    }

    const PipelineStats & Orchestrator::stats() const noexcept
    {
        return _stats;
    }

    const RecordStore & Orchestrator::records() const noexcept
    {
        return _records;
    }

    void Orchestrator::logStats() const
    {
        pipeline::logStats(_stats, _cfg.clock());
    }

    ProcessResult Orchestrator::_abort(const std::string & reason)
    {
        ++_stats.errored;
        spdlog::error("Event aborted: {}", reason);
        _maybeLogStats();
        return ProcessResult::ABORTED;
    }

    void Orchestrator::_maybeLogStats()
    {
        if(_cfg.stats_every == 0 || _stats.processed < _last_reported + _cfg.stats_every)
        {
            return;
        }
        _last_reported = _stats.processed;
        logStats();
    }

    AnalysisResult Orchestrator::_analyze(const std::string & text)
    {
        AnalysisResult analysis;

        if(_collaborators.removal_scorer != nullptr)
        {
            auto removal = _guarded("Removal-risk scoring", [&] { return _collaborators.removal_scorer->scoreRemovalRisk(text); });
            if(removal)
            {
                spdlog::info("Removal risk: {:.2f}", removal->score);
                analysis.removal = std::move(*removal);
            }
            else
            {
                _logFailure("Removal-risk scoring", removal);
            }
        }

        if(_collaborators.sentiment_scorer != nullptr)
        {
            auto sentiment = _guarded("Sentiment scoring", [&] { return _collaborators.sentiment_scorer->scoreSentiment(text); });
            if(sentiment)
            {
                spdlog::info("Sentiment: {} (controversy {:.2f})", sentiment->label, sentiment->controversy);
                analysis.sentiment = std::move(*sentiment);
            }
            else
            {
                _logFailure("Sentiment scoring", sentiment);
            }
        }

        if(_collaborators.classifier != nullptr)
        {
            auto ecosystem = _guarded("Ecosystem classification", [&] { return _collaborators.classifier->classify(text); });
            if(ecosystem)
            {
                spdlog::info("Ecosystem: {} (confidence {:.2f})", ecosystem->token, ecosystem->confidence);
                analysis.ecosystem = std::move(*ecosystem);
            }
            else
            {
                _logFailure("Ecosystem classification", ecosystem);
            }
        }

        const std::optional<double> primary = analysis.removal ? std::optional<double>(analysis.removal->score) : std::nullopt;
        const std::optional<double> secondary = analysis.sentiment ? std::optional<double>(analysis.sentiment->controversy) : std::nullopt;
        if(!primary && !secondary)
        {
            spdlog::warn("No score signal available, combined score is 0");
        }
        analysis.combined_score = combinedScore(primary, secondary);
        spdlog::info("Combined score: {:.2f}", analysis.combined_score);

        return analysis;
    }

    std::optional<price::PriceQuote> Orchestrator::_enrich(const AnalysisResult & analysis)
    {
        if(_collaborators.prices == nullptr || !analysis.ecosystem || analysis.ecosystem->token == UNKNOWN_TOKEN)
        {
            return std::nullopt;
        }

        try
        {
            return _collaborators.prices->getPrice(analysis.ecosystem->token);
        }
        catch(const std::exception & e)
        {
            spdlog::warn("Price lookup for {} threw: {}", analysis.ecosystem->token, e.what());
            return std::nullopt;
        }
    }

    bool Orchestrator::_register(const ContentRecord & record, const evmc::bytes32 & content_hash, const StorageReceipt & receipt, const chain::Address & submitter)
    {
        if(_collaborators.registry == nullptr)
        {
            spdlog::info("Registry not configured, skipping on-chain registration");
            return false;
        }

        if(_guard.exists(content_hash))
        {
            spdlog::info("Record {} is already registered, skipping write", record.content_hash());
            return true;
        }

        const RegistryEntry entry = makeRegistryEntry(record, content_hash, receipt, submitter, _cfg.clock());
        const auto written = _guarded("Registry write", [&] { return _collaborators.registry->write(entry); });
        if(!written)
        {
            ++_stats.errored;
            spdlog::error("On-chain registration failed ({}): {}", std::format("{}", written.error().kind), written.error().message);
            return false;
        }

        if(!written->has_value())
        {
            spdlog::info("Record {} already existed on-chain", record.content_hash());
            return true;
        }

        ++_stats.registered;
        spdlog::info("Registered on-chain: {}", **written);
        return false;
    }

    void Orchestrator::_resubmit(const std::string & locator, const evmc::bytes32 & content_hash, const double score, const bool already_registered)
    {
        const GateDecision decision = _gate.decide(content_hash, score, already_registered);
        if(decision != GateDecision::SUBMIT)
        {
            spdlog::debug("No resubmission for {}: {}", locator, std::format("{}", decision));
            return;
        }

        spdlog::info("Resubmitting {} (score {:.2f} >= {:.2f})", locator, score, _gate.threshold());
        const auto tx_hash = _guarded("Resubmission", [&] { return _gate.resubmit(locator, content_hash, score); });
        if(!tx_hash)
        {
            spdlog::error("Resubmission failed ({}): {}", std::format("{}", tx_hash.error().kind), tx_hash.error().message);
            return;
        }

        ++_stats.resubmitted;
        spdlog::info("Resubmission transaction: {}", *tx_hash);
    }

    ProcessResult Orchestrator::process(const chain::SubmissionEvent & event)
    {
        spdlog::info("Processing submission event (block {}, tx {}, log {})", event.block_number, event.transaction_hash, event.log_index);

        const auto locator = chain::extractReference(event);
        if(!locator)
        {
            return _abort(std::format("no content locator in validation '{}'", event.validation));
        }
        spdlog::info("Locator: {} (depositor {})", *locator, chain::addressToHex(event.depositor));

        const evmc::bytes32 content_hash = crypto::contentHash(*locator);
        if(content_hash != event.content_hash)
        {
            spdlog::debug("Event tweet hash {} differs from locator hash {}",
                chain::bytesToHex(event.content_hash.bytes, 32), chain::bytesToHex(content_hash.bytes, 32));
        }

        if(_collaborators.fetcher == nullptr)
        {
            return _abort("no content fetcher configured");
        }

        auto fetched = _guarded("Fetch", [&] { return _collaborators.fetcher->fetch(*locator); });
        if(!fetched)
        {
            return _abort(std::format("fetch of {} failed ({}): {}", *locator, std::format("{}", fetched.error().kind), fetched.error().message));
        }
        if(fetched->url.empty())
        {
            fetched->url = *locator;
        }
        ++_stats.processed;

        const AnalysisResult analysis = _analyze(fetched->body);
        const auto quote = _enrich(analysis);

        const auto now = _cfg.clock();
        const ContentRecord record = buildRecord(event, content_hash, *fetched, analysis, quote, now);

        const auto local_path = _records.save(record, now);
        if(!local_path)
        {
            return _abort("local persistence failed");
        }
        spdlog::info("Record written to {}", local_path->string());

        if(_collaborators.storage == nullptr)
        {
            return _abort("no storage collaborator configured");
        }

        const auto receipt = _guarded("Storage", [&] { return _collaborators.storage->store(*local_path); });
        if(!receipt)
        {
            return _abort(std::format("storage failed ({}): {}", std::format("{}", receipt.error().kind), receipt.error().message));
        }
        ++_stats.stored;
        spdlog::info("Stored: data CID {}, root CID {}, deal {}", receipt->data_cid, receipt->root_cid, receipt->deal_id.value_or("pending"));

        const bool already_registered = _register(record, content_hash, *receipt, event.depositor);

        _resubmit(*locator, content_hash, analysis.combined_score, already_registered);

        _maybeLogStats();
        return ProcessResult::COMPLETED;
    }
}
