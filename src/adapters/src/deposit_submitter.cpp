#include "deposit_submitter.hpp"

#include <format>

#include <spdlog/spdlog.h>

#include "crypto.hpp"

namespace tad::adapters
{
    namespace
    {
        constexpr const char* DEPOSIT_SIGNATURE =
            "depositIP("
                "address,string,bytes,address,"
                "(string,uint256,uint256,address,uint96),"
                "bytes32,"
                "(uint256,address,address,bool,uint256,bool,bool,uint256,uint256,bool,bool,bool,bool,uint256,string),"
                "(uint256,address,address,uint256,uint256,uint256),"
                "(string,address)[])";
    }

    chain::Bytes encodeDepositCall(const std::string & locator, const chain::Address & backend)
    {
        namespace abi = chain::abi;
        const chain::Address zero{};

        const abi::Value collection_config = abi::tuple({
            abi::string(""),
            abi::uint256(0),
            abi::uint256(0),
            abi::address(zero),
            abi::uint256(0)
        });

        const abi::Value license_terms = abi::tuple({
            abi::uint256(0),
            abi::address(zero),
            abi::address(zero),
            abi::boolean(false),
            abi::uint256(0),
            abi::boolean(false),
            abi::boolean(false),
            abi::uint256(0),
            abi::uint256(0),
            abi::boolean(false),
            abi::boolean(false),
            abi::boolean(false),
            abi::boolean(false),
            abi::uint256(0),
            abi::string("")
        });

        const abi::Value mint_params = abi::tuple({
            abi::uint256(0),
            abi::address(zero),
            abi::address(backend),
            abi::uint256(0),
            abi::uint256(0),
            abi::uint256(0)
        });

        return abi::encodeCall(DEPOSIT_SIGNATURE, {
            abi::address(backend),
            abi::string(locator),
            abi::bytes({}),
            abi::address(zero),
            collection_config,
            abi::bytes32(crypto::contentHash(locator)),
            license_terms,
            mint_params,
            abi::array({})
        });
    }

    DepositSubmitter::DepositSubmitter(DepositSubmitterConfig cfg, const chain::ITransactionSender & sender)
        : _cfg(std::move(cfg)),
          _sender(sender)
    {
    }

    pipeline::Outcome<std::string> DepositSubmitter::submit(const std::string & locator, const double score)
    {
        const auto backend = _sender.senderAddress();
        if(!backend)
        {
            return std::unexpected(pipeline::CollaboratorError{
                .kind = pipeline::CollaboratorError::Kind::UNAVAILABLE,
                .message = std::format("no backend account: {}", backend.error().message)
            });
        }

        spdlog::info("Resubmitting {} (score {:.2f})", locator, score);

        const chain::TransactionRequest request{
            .to = _cfg.contract_address,
            .data = encodeDepositCall(locator, *backend),
            .value_wei = _cfg.submission_fee_wei,
            .gas_limit = std::nullopt,
            .gas_multiplier = _cfg.gas_multiplier,
            .gas_limit_fallback = _cfg.gas_limit_fallback
        };

        const auto tx_hash = _sender.sendTransaction(request);
        if(!tx_hash)
        {
            return std::unexpected(pipeline::CollaboratorError{
                .kind = pipeline::CollaboratorError::Kind::UNAVAILABLE,
                .message = std::format("depositIP failed ({}): {}", tx_hash.error().kind, tx_hash.error().message)
            });
        }

        spdlog::info("depositIP sent: {}", *tx_hash);
        return *tx_hash;
    }
}
