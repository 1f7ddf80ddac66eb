#pragma once

#include <chrono>
#include <cstdint>
#include <cstring>
#include <format>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "tweet_archive_daemon.hpp"

#ifndef TAD_TEST_BINARY_DIR
    #error "TAD_TEST_BINARY_DIR is not defined"
#endif

namespace tad::tests
{
    using json = nlohmann::json;

    inline chain::Address makeAddressFromSuffix(const char* suffix)
    {
        chain::Address address{};
        const std::size_t suffix_len = std::strlen(suffix);
        if(suffix_len <= 20)
        {
            std::memcpy(address.bytes + (20 - suffix_len), suffix, suffix_len);
        }
        return address;
    }

    inline std::string hexPrefixed(const evmc::bytes32 & value)
    {
        return std::string("0x") + evmc::hex(value);
    }

    inline std::string hexPrefixed(const chain::Address & value)
    {
        return std::string("0x") + evmc::hex(value);
    }

    inline std::string hexPrefixed(const std::vector<std::uint8_t> & value)
    {
        return std::string("0x") + evmc::hex(evmc::bytes_view{value.data(), value.size()});
    }

    inline std::vector<std::uint8_t> encodeUint256Word(std::uint64_t value)
    {
        std::vector<std::uint8_t> out(32, 0);
        for(int i = 0; i < 8; ++i)
        {
            out[31 - i] = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFu);
        }
        return out;
    }

    inline std::vector<std::uint8_t> encodeAddressWord(const chain::Address & value)
    {
        std::vector<std::uint8_t> out(32, 0);
        std::memcpy(out.data() + 12, value.bytes, 20);
        return out;
    }

    inline std::vector<std::uint8_t> encodeStringTail(const std::string & value)
    {
        std::vector<std::uint8_t> out = encodeUint256Word(value.size());
        out.insert(out.end(), value.begin(), value.end());
        const std::size_t pad = (32 - (value.size() % 32)) % 32;
        out.insert(out.end(), pad, 0);
        return out;
    }

    inline std::string topicForEvent(const std::string & signature)
    {
        return hexPrefixed(crypto::constructEventTopic(signature));
    }

    inline std::string topicForAddress(const chain::Address & address)
    {
        evmc::bytes32 topic_word{};
        std::memcpy(topic_word.bytes + 12, address.bytes, 20);
        return hexPrefixed(topic_word);
    }

    inline std::string topicForUint(std::uint64_t value)
    {
        return hexPrefixed(encodeUint256Word(value));
    }

    inline std::filesystem::path buildPath()
    {
        return std::filesystem::path(TAD_TEST_BINARY_DIR);
    }

    inline std::filesystem::path makeStoragePath(const std::string & group, const std::string & test_name)
    {
        const std::string unique_suffix = std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
        const auto storage_path = buildPath() / "tests" / group / (test_name + "_" + unique_suffix);

        std::error_code ec;
        std::filesystem::remove_all(storage_path, ec);
        ec.clear();
        std::filesystem::create_directories(storage_path, ec);
        EXPECT_FALSE(ec);

        return storage_path;
    }

    /**
     * @brief Raw eth_getLogs entry of a DepositProcessed event.
     */
    inline json makeDepositLog(std::uint64_t block_number,
                               std::uint64_t log_index,
                               const std::string & validation,
                               const chain::Address & depositor,
                               const chain::Address & recipient,
                               const std::vector<std::uint8_t> & proof = {})
    {
        const auto validation_tail = encodeStringTail(validation);
        const auto proof_tail = encodeStringTail(std::string(proof.begin(), proof.end()));

        std::vector<std::uint8_t> data;
        const auto recipient_word = encodeAddressWord(recipient);
        const auto validation_offset = encodeUint256Word(96);
        const auto proof_offset = encodeUint256Word(96 + validation_tail.size());

        data.insert(data.end(), recipient_word.begin(), recipient_word.end());
        data.insert(data.end(), validation_offset.begin(), validation_offset.end());
        data.insert(data.end(), proof_offset.begin(), proof_offset.end());
        data.insert(data.end(), validation_tail.begin(), validation_tail.end());
        data.insert(data.end(), proof_tail.begin(), proof_tail.end());

        return json{
            {"blockNumber", chain::toHexQuantity(block_number)},
            {"logIndex", chain::toHexQuantity(log_index)},
            {"transactionHash", hexPrefixed(crypto::keccak256(std::to_string(block_number) + ":" + std::to_string(log_index)))},
            {"topics", json::array({
                topicForEvent(chain::DEPOSIT_PROCESSED_SIGNATURE),
                topicForUint(1),
                hexPrefixed(crypto::contentHash(validation)),
                topicForAddress(depositor)
            })},
            {"data", hexPrefixed(data)}
        };
    }

    /**
     * @brief In-memory JSON-RPC node answering eth_blockNumber, eth_getLogs and eth_call.
     */
    struct MockRpcNode
    {
        std::string block_number_hex = "0x0";
        json logs = json::array();
        std::string eth_call_result = "0x";

        bool fail_block_number = false;
        bool fail_get_logs = false;
        bool fail_eth_call = false;

        std::size_t block_number_calls = 0;
        std::size_t get_logs_calls = 0;
        std::size_t eth_call_calls = 0;

        std::optional<std::uint64_t> last_from_block;
        std::optional<std::uint64_t> last_to_block;
        std::string last_call_data;

        std::optional<json> call(const std::string &, const json & request)
        {
            const std::string method = request.value("method", "");
            if(method == "eth_blockNumber")
            {
                ++block_number_calls;
                if(fail_block_number)
                {
                    return std::nullopt;
                }
                return json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", block_number_hex}};
            }

            if(method == "eth_getLogs")
            {
                ++get_logs_calls;
                if(fail_get_logs)
                {
                    return json{{"jsonrpc", "2.0"}, {"id", 1}, {"error", {{"code", -32000}, {"message", "range too large"}}}};
                }

                const json & filter = request["params"][0];
                last_from_block = chain::parseHexQuantity(filter.value("fromBlock", ""));
                last_to_block = chain::parseHexQuantity(filter.value("toBlock", ""));
                return json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", logs}};
            }

            if(method == "eth_call")
            {
                ++eth_call_calls;
                if(fail_eth_call)
                {
                    return std::nullopt;
                }
                last_call_data = request["params"][0].value("data", "");
                return json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", eth_call_result}};
            }

            return std::nullopt;
        }

        chain::RpcCall asRpcCall()
        {
            return [this](const std::string & url, const json & request) { return call(url, request); };
        }
    };

    /**
     * @brief Records transactions instead of signing them.
     */
    class FakeTransactionSender final : public chain::ITransactionSender
    {
    public:
        chain::Address sender = makeAddressFromSuffix("backend");
        bool fail_send = false;
        bool revert_receipt = false;

        mutable std::vector<chain::TransactionRequest> sent;
        mutable std::size_t receipt_waits = 0;

        chain::Result<chain::Address> senderAddress() const override
        {
            return sender;
        }

        chain::Result<std::string> sendTransaction(const chain::TransactionRequest & request) const override
        {
            if(fail_send)
            {
                return std::unexpected(chain::ChainError{
                    .kind = chain::ChainError::Kind::RPC_ERROR,
                    .message = "insufficient funds"
                });
            }
            sent.push_back(request);
            return std::format("0x{:064x}", sent.size());
        }

        chain::Result<chain::TransactionReceipt> waitForReceipt(const std::string & tx_hash) const override
        {
            ++receipt_waits;
            if(revert_receipt)
            {
                return std::unexpected(chain::ChainError{
                    .kind = chain::ChainError::Kind::TRANSACTION_REVERTED,
                    .message = "execution reverted"
                });
            }
            return chain::TransactionReceipt{.tx_hash = tx_hash, .block_number = 1, .gas_used = 21'000};
        }
    };
}
