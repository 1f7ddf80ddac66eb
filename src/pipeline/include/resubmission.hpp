#pragma once

#include <cstdint>
#include <filesystem>
#include <format>
#include <string>

#include <absl/container/flat_hash_set.h>

#include "collaborators.hpp"

namespace tad::pipeline
{
    /**
     * @brief Durable set of content hashes that were already resubmitted.
     *
     * Stored as {"resubmitted": ["0x..", ...]} and rewritten atomically on every insert.
     */
    class ResubmissionLedger
    {
    public:
        explicit ResubmissionLedger(std::filesystem::path path);

        const std::filesystem::path & path() const noexcept;

        bool contains(const evmc::bytes32 & content_hash) const;

        /**
         * @return false when the ledger could not be persisted (the hash is still remembered in memory)
         */
        bool add(const evmc::bytes32 & content_hash);

        std::size_t size() const noexcept;

    private:
        bool _persist() const;

        std::filesystem::path _path;
        absl::flat_hash_set<std::string> _hashes;
    };

    enum class GateDecision : std::uint8_t
    {
        SUBMIT = 0,
        BELOW_THRESHOLD,
        NOT_CONFIGURED,
        ALREADY_RESUBMITTED,
        ALREADY_REGISTERED
    };

    /**
     * @brief Decides whether a scored item is re-injected as a new submission.
     *
     * Each content hash is resubmitted at most once.
     */
    class ResubmissionGate
    {
    public:
        ResubmissionGate(double threshold, IResubmitter * resubmitter, ResubmissionLedger * ledger);

        double threshold() const noexcept;

        GateDecision decide(const evmc::bytes32 & content_hash, double score, bool already_registered) const;

        /**
         * @brief Submits the locator and records the hash in the ledger on success.
         *
         * Callers consult decide() first.
         */
        Outcome<std::string> resubmit(const std::string & locator, const evmc::bytes32 & content_hash, double score);

    private:
        double _threshold;
        IResubmitter * _resubmitter;
        ResubmissionLedger * _ledger;
    };
}

template <>
struct std::formatter<tad::pipeline::GateDecision> : std::formatter<std::string>
{
    auto format(const tad::pipeline::GateDecision & decision, format_context & ctx) const
    {
        switch(decision)
        {
            case tad::pipeline::GateDecision::SUBMIT:
                return formatter<string>::format("submit", ctx);
            case tad::pipeline::GateDecision::BELOW_THRESHOLD:
                return formatter<string>::format("below threshold", ctx);
            case tad::pipeline::GateDecision::NOT_CONFIGURED:
                return formatter<string>::format("resubmission not configured", ctx);
            case tad::pipeline::GateDecision::ALREADY_RESUBMITTED:
                return formatter<string>::format("already resubmitted", ctx);
            case tad::pipeline::GateDecision::ALREADY_REGISTERED:
                return formatter<string>::format("already registered", ctx);
            default:
                return formatter<string>::format("unknown", ctx);
        }
    }
};
