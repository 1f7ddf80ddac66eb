#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "collaborators.hpp"
#include "content_record.hpp"
#include "events.hpp"
#include "record_store.hpp"
#include "registry_guard.hpp"
#include "resolver.hpp"
#include "resubmission.hpp"
#include "stats.hpp"

namespace tad::pipeline
{
    /**
     * @brief Non-owning handles to the external collaborators.
     *
     * Optional stages are skipped when their collaborator is null.
     * `fetcher` and `storage` are required for an event to complete.
     */
    struct Collaborators
    {
        IContentFetcher * fetcher = nullptr;
        IRemovalRiskScorer * removal_scorer = nullptr;
        ISentimentScorer * sentiment_scorer = nullptr;
        IEcosystemClassifier * classifier = nullptr;
        price::PriceResolver * prices = nullptr;
        IStorage * storage = nullptr;
        IRegistry * registry = nullptr;
        IResubmitter * resubmitter = nullptr;
    };

    struct OrchestratorConfig
    {
        std::filesystem::path records_path;
        std::filesystem::path ledger_path;

        double resubmission_threshold = 0.75;
        std::size_t stats_every = 10;

        std::function<std::chrono::system_clock::time_point()> clock = {};
    };

    enum class ProcessResult : std::uint8_t
    {
        COMPLETED = 0,
        ABORTED
    };

    /**
     * @brief Drives one submission event through
     * locate, fetch, analyze, enrich, persist, store, register and resubmit.
     *
     * Never throws: failures are logged and counted, and only locate, fetch, persist
     * and store abort the event.
     */
    class Orchestrator
    {
    public:
        Orchestrator(Collaborators collaborators, OrchestratorConfig cfg);

        Orchestrator(const Orchestrator &) = delete;
        Orchestrator & operator=(const Orchestrator &) = delete;

        ProcessResult process(const chain::SubmissionEvent & event);

        const PipelineStats & stats() const noexcept;

        void logStats() const;

        const RecordStore & records() const noexcept;

    private:
        AnalysisResult _analyze(const std::string & text);

        std::optional<price::PriceQuote> _enrich(const AnalysisResult & analysis);

        // true when the registry already held the entry
        bool _register(const ContentRecord & record, const evmc::bytes32 & content_hash, const StorageReceipt & receipt, const chain::Address & submitter);

        void _resubmit(const std::string & locator, const evmc::bytes32 & content_hash, double score, bool already_registered);

        ProcessResult _abort(const std::string & reason);

        void _maybeLogStats();

        Collaborators _collaborators;
        OrchestratorConfig _cfg;

        RecordStore _records;
        RegistryGuard _guard;
        ResubmissionLedger _ledger;
        ResubmissionGate _gate;

        PipelineStats _stats;
        std::size_t _last_reported = 0;
    };
}
