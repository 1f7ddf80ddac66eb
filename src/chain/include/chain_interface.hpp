#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "address.hpp"
#include "chain_error.hpp"
#include "hex.hpp"

namespace tad::chain
{
    struct TransactionRequest
    {
        Address to{};
        Bytes data;
        std::uint64_t value_wei = 0;

        // explicit limit skips estimation
        std::optional<std::uint64_t> gas_limit = std::nullopt;
        double gas_multiplier = 1.0;
        std::uint64_t gas_limit_fallback = 6'000'000;
    };

    struct TransactionReceipt
    {
        std::string tx_hash;
        std::uint64_t block_number = 0;
        std::uint64_t gas_used = 0;
    };

    class ITransactionSender
    {
    public:
        virtual ~ITransactionSender() = default;

        virtual Result<Address> senderAddress() const = 0;

        /**
         * @brief Signs and broadcasts a call transaction.
         *
         * @return transaction hash
         */
        virtual Result<std::string> sendTransaction(const TransactionRequest & request) const = 0;

        /**
         * @brief Blocks until the transaction is mined. A reverted transaction is an error.
         */
        virtual Result<TransactionReceipt> waitForReceipt(const std::string & tx_hash) const = 0;
    };
}
