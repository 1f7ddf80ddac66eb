#pragma once

#include <string>

#include "chain.hpp"
#include "collaborators.hpp"

namespace tad::adapters
{
    struct DepositSubmitterConfig
    {
        chain::Address contract_address{};
        std::uint64_t submission_fee_wei = 0;
        double gas_multiplier = 1.2;
        std::uint64_t gas_limit_fallback = 10'000'000;
    };

    /**
     * @brief Calldata of depositIP for a backend-initiated resubmission of `locator`.
     *
     * The backend is both recipient and license receiver; collection, license and
     * co-creator parameters are left empty.
     */
    chain::Bytes encodeDepositCall(const std::string & locator, const chain::Address & backend);

    class DepositSubmitter final : public pipeline::IResubmitter
    {
    public:
        DepositSubmitter(DepositSubmitterConfig cfg, const chain::ITransactionSender & sender);

        pipeline::Outcome<std::string> submit(const std::string & locator, double score) override;

    private:
        DepositSubmitterConfig _cfg;
        const chain::ITransactionSender & _sender;
    };
}
