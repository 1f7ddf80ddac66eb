#include "registry_client.hpp"

#include <algorithm>
#include <format>

#include <spdlog/spdlog.h>

namespace tad::adapters
{
    namespace
    {
        constexpr const char* EXISTS_SIGNATURE = "exists(bytes32)";

        constexpr const char* STORE_TWEET_SIGNATURE =
            "storeTweet("
                "(bytes32,string,string,string,string,bool),"
                "string,"
                "(uint256,uint256,uint256,uint256,uint256,uint256),"
                "(string,string,string,string,string),"
                "address)";

        pipeline::CollaboratorError _fromChain(const chain::ChainError & error, const std::string & what)
        {
            return pipeline::CollaboratorError{
                .kind = error.kind == chain::ChainError::Kind::TRANSACTION_REVERTED
                    ? pipeline::CollaboratorError::Kind::REJECTED
                    : pipeline::CollaboratorError::Kind::UNAVAILABLE,
                .message = std::format("{} ({}): {}", what, error.kind, error.message)
            };
        }
    }

    chain::Bytes encodeStoreTweet(const pipeline::RegistryEntry & entry)
    {
        namespace abi = chain::abi;

        return abi::encodeCall(STORE_TWEET_SIGNATURE, {
            abi::tuple({
                abi::bytes32(entry.content_hash),
                abi::string(entry.url),
                abi::string(entry.tweet_id),
                abi::string(entry.author),
                abi::string(entry.handle),
                abi::boolean(entry.verified)
            }),
            abi::string(entry.body),
            abi::tuple({
                abi::uint256(entry.timestamp),
                abi::uint256(entry.likes),
                abi::uint256(entry.retweets),
                abi::uint256(entry.replies),
                abi::uint256(entry.controversy_pct),
                abi::uint256(entry.removal_pct)
            }),
            abi::tuple({
                abi::string(entry.screenshot_cid),
                abi::string(entry.data_cid),
                abi::string(entry.root_cid),
                abi::string(entry.deal_id),
                abi::string(entry.ecosystem)
            }),
            abi::address(entry.submitter)
        });
    }

    RegistryClient::RegistryClient(RegistryClientConfig cfg, const chain::RpcClient & rpc, const chain::ITransactionSender & sender)
        : _cfg(std::move(cfg)),
          _rpc(rpc),
          _sender(sender)
    {
    }

    pipeline::Outcome<bool> RegistryClient::exists(const evmc::bytes32 & content_hash)
    {
        const auto output = _rpc.ethCall(_cfg.contract_address, chain::abi::encodeCall(EXISTS_SIGNATURE, {chain::abi::bytes32(content_hash)}));
        if(!output)
        {
            return std::unexpected(_fromChain(output.error(), "exists query failed"));
        }

        if(output->size() < 32)
        {
            return std::unexpected(pipeline::CollaboratorError{
                .kind = pipeline::CollaboratorError::Kind::INVALID_RESPONSE,
                .message = std::format("exists returned {} bytes", output->size())
            });
        }

        return std::any_of(output->begin(), output->begin() + 32, [](std::uint8_t byte) { return byte != 0; });
    }

    pipeline::Outcome<std::optional<std::string>> RegistryClient::write(const pipeline::RegistryEntry & entry)
    {
        const auto already = exists(entry.content_hash);
        if(already && *already)
        {
            spdlog::info("Tweet {} already stored on-chain", entry.url);
            return std::nullopt;
        }
        if(!already)
        {
            spdlog::debug("Exists check failed before write: {}", already.error().message);
        }

        const chain::TransactionRequest request{
            .to = _cfg.contract_address,
            .data = encodeStoreTweet(entry),
            .value_wei = 0,
            .gas_limit = std::nullopt,
            .gas_multiplier = _cfg.gas_multiplier,
            .gas_limit_fallback = _cfg.gas_limit_fallback
        };

        const auto tx_hash = _sender.sendTransaction(request);
        if(!tx_hash)
        {
            return std::unexpected(_fromChain(tx_hash.error(), "storeTweet failed"));
        }
        spdlog::info("storeTweet sent: {}", *tx_hash);

        if(_cfg.wait_for_receipt)
        {
            const auto receipt = _sender.waitForReceipt(*tx_hash);
            if(!receipt)
            {
                return std::unexpected(_fromChain(receipt.error(), "storeTweet not confirmed"));
            }
            spdlog::info("storeTweet mined in block {} (gas used {})", receipt->block_number, receipt->gas_used);
        }

        return std::optional<std::string>(*tx_hash);
    }
}
