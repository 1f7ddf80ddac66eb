#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json_fwd.hpp>

#include "chain_interface.hpp"
#include "retry.hpp"
#include "rpc.hpp"

namespace tad::chain
{
    struct SignerConfig
    {
        std::string rpc_url;
        std::string private_key_hex;

        std::uint64_t chain_id = 314; // Filecoin mainnet
        std::uint64_t fallback_max_priority_fee_wei = 2'000'000'000; // 2 gwei
        std::chrono::milliseconds receipt_poll_interval{1500};
        std::size_t max_receipt_polls = 120;
    };

    /**
     * @brief Sends EIP-1559 call transactions signed locally with secp256k1.
     */
    class TransactionSigner final : public ITransactionSender
    {
    public:
        TransactionSigner(SignerConfig cfg, RpcCall rpc_call, net::SleepFn sleep = net::sleepFor);

        const SignerConfig & config() const noexcept;

        Result<Address> senderAddress() const override;

        Result<std::string> sendTransaction(const TransactionRequest & request) const override;

        Result<TransactionReceipt> waitForReceipt(const std::string & tx_hash) const override;

    private:
        std::uint64_t _gasLimitFor(const TransactionRequest & request) const;

        SignerConfig _cfg;
        RpcClient _rpc;
        net::SleepFn _sleep;
        std::array<std::uint8_t, 32> _private_key{};
        Address _sender_address{};
        std::optional<ChainError> _init_error;
    };

    /**
     * @brief Address controlled by a 32-byte private key.
     */
    Result<Address> deriveAddress(const std::string & private_key_hex);
}
