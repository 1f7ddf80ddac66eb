#pragma once

#include <optional>
#include <string>

#include "chain.hpp"
#include "collaborators.hpp"

namespace tad::adapters
{
    struct RegistryClientConfig
    {
        chain::Address contract_address{};
        double gas_multiplier = 1.3;
        std::uint64_t gas_limit_fallback = 5'000'000;
        bool wait_for_receipt = false;
    };

    /**
     * @brief Calldata of storeTweet(identity, content, metrics, storage, submitter).
     */
    chain::Bytes encodeStoreTweet(const pipeline::RegistryEntry & entry);

    /**
     * @brief On-chain tweet registry keyed by content hash.
     */
    class RegistryClient final : public pipeline::IRegistry
    {
    public:
        RegistryClient(RegistryClientConfig cfg, const chain::RpcClient & rpc, const chain::ITransactionSender & sender);

        pipeline::Outcome<bool> exists(const evmc::bytes32 & content_hash) override;

        pipeline::Outcome<std::optional<std::string>> write(const pipeline::RegistryEntry & entry) override;

    private:
        RegistryClientConfig _cfg;
        const chain::RpcClient & _rpc;
        const chain::ITransactionSender & _sender;
    };
}
