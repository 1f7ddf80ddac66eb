#include "signer.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <format>
#include <limits>
#include <utility>

#include <nlohmann/json.hpp>
#include <secp256k1.h>
#include <secp256k1_recovery.h>

#include <spdlog/spdlog.h>

#include "crypto.hpp"
#include "rlp.hpp"

namespace tad::chain
{
    using json = nlohmann::json;

    namespace
    {
        using PrivateKey = std::array<std::uint8_t, 32>;

        Result<PrivateKey> _parsePrivateKey(const std::string & private_key_hex)
        {
            const auto bytes_res = hexToBytes(private_key_hex);
            if(!bytes_res || bytes_res->size() != 32)
            {
                return std::unexpected(ChainError{
                    .kind = ChainError::Kind::INVALID_CONFIG,
                    .message = "private key must be a 32-byte hex value"
                });
            }

            PrivateKey key{};
            std::ranges::copy(*bytes_res, key.begin());
            return key;
        }

        Result<Address> _deriveAddress(const PrivateKey & private_key)
        {
            secp256k1_context* ctx = secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
            if(ctx == nullptr)
            {
                return std::unexpected(ChainError{
                    .kind = ChainError::Kind::SIGNING_ERROR,
                    .message = "Failed to create secp256k1 context"
                });
            }

            secp256k1_pubkey pubkey{};
            if(secp256k1_ec_pubkey_create(ctx, &pubkey, private_key.data()) != 1)
            {
                secp256k1_context_destroy(ctx);
                return std::unexpected(ChainError{
                    .kind = ChainError::Kind::SIGNING_ERROR,
                    .message = "Invalid private key"
                });
            }

            std::array<std::uint8_t, 65> serialized_pubkey{};
            std::size_t pubkey_size = serialized_pubkey.size();
            if(secp256k1_ec_pubkey_serialize(ctx, serialized_pubkey.data(), &pubkey_size, &pubkey, SECP256K1_EC_UNCOMPRESSED) != 1)
            {
                secp256k1_context_destroy(ctx);
                return std::unexpected(ChainError{
                    .kind = ChainError::Kind::SIGNING_ERROR,
                    .message = "Failed to serialize public key"
                });
            }

            secp256k1_context_destroy(ctx);

            const auto hash = crypto::keccak256(serialized_pubkey.data() + 1, pubkey_size - 1);
            Address out{};
            std::memcpy(out.bytes, hash.bytes + 12, 20);
            return out;
        }

        struct _FeeQuote
        {
            std::uint64_t max_priority_fee = 0;
            std::uint64_t max_fee = 0;
        };

        Result<Bytes> _signCallTx(
            const PrivateKey & private_key,
            const std::uint64_t chain_id,
            const std::uint64_t nonce,
            const _FeeQuote & fees,
            const std::uint64_t gas_limit,
            const TransactionRequest & request)
        {
            std::vector<Bytes> fields{
                rlp::encodeUint64(chain_id),
                rlp::encodeUint64(nonce),
                rlp::encodeUint64(fees.max_priority_fee),
                rlp::encodeUint64(fees.max_fee),
                rlp::encodeUint64(gas_limit),
                rlp::encodeBytes(request.to.bytes, sizeof(request.to.bytes)),
                rlp::encodeUint64(request.value_wei),
                rlp::encodeBytes(request.data),
                rlp::encodeList({})
            };

            const Bytes unsigned_payload = rlp::encodeList(fields);

            Bytes signing_blob;
            signing_blob.reserve(1 + unsigned_payload.size());
            signing_blob.push_back(0x02);
            signing_blob.insert(signing_blob.end(), unsigned_payload.begin(), unsigned_payload.end());

            const auto sig_hash = crypto::keccak256(signing_blob.data(), signing_blob.size());

            secp256k1_context* ctx = secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
            if(ctx == nullptr)
            {
                return std::unexpected(ChainError{
                    .kind = ChainError::Kind::SIGNING_ERROR,
                    .message = "Failed to create secp256k1 context"
                });
            }

            secp256k1_ecdsa_recoverable_signature signature{};
            if(secp256k1_ecdsa_sign_recoverable(ctx, &signature, sig_hash.bytes, private_key.data(), nullptr, nullptr) != 1)
            {
                secp256k1_context_destroy(ctx);
                return std::unexpected(ChainError{
                    .kind = ChainError::Kind::SIGNING_ERROR,
                    .message = "Failed to sign transaction"
                });
            }

            std::array<std::uint8_t, 64> compact_signature{};
            int recid = 0;
            secp256k1_ecdsa_recoverable_signature_serialize_compact(ctx, compact_signature.data(), &recid, &signature);
            secp256k1_context_destroy(ctx);

            fields.push_back(rlp::encodeUint64(static_cast<std::uint64_t>(recid & 0x01)));
            fields.push_back(rlp::encodeBigInteger(compact_signature.data(), 32));
            fields.push_back(rlp::encodeBigInteger(compact_signature.data() + 32, 32));

            const Bytes signed_payload = rlp::encodeList(fields);

            Bytes raw;
            raw.reserve(1 + signed_payload.size());
            raw.push_back(0x02);
            raw.insert(raw.end(), signed_payload.begin(), signed_payload.end());
            return raw;
        }

        std::optional<std::uint64_t> _quantityResult(const Result<json> & result)
        {
            if(!result || !result->is_string())
            {
                return std::nullopt;
            }
            return parseHexQuantity(result->get<std::string>());
        }
    }

    Result<Address> deriveAddress(const std::string & private_key_hex)
    {
        const auto key = _parsePrivateKey(private_key_hex);
        if(!key)
        {
            return std::unexpected(key.error());
        }
        return _deriveAddress(*key);
    }

    TransactionSigner::TransactionSigner(SignerConfig cfg, RpcCall rpc_call, net::SleepFn sleep)
        : _cfg(std::move(cfg)),
          _rpc(_cfg.rpc_url, std::move(rpc_call)),
          _sleep(std::move(sleep))
    {
        if(_cfg.rpc_url.empty())
        {
            _init_error = ChainError{
                .kind = ChainError::Kind::INVALID_CONFIG,
                .message = "rpc_url is required"
            };
            return;
        }

        const auto key_res = _parsePrivateKey(_cfg.private_key_hex);
        if(!key_res)
        {
            _init_error = key_res.error();
            return;
        }
        _private_key = *key_res;

        const auto sender_res = _deriveAddress(_private_key);
        if(!sender_res)
        {
            _init_error = sender_res.error();
            return;
        }
        _sender_address = *sender_res;
    }

    const SignerConfig & TransactionSigner::config() const noexcept
    {
        return _cfg;
    }

    Result<Address> TransactionSigner::senderAddress() const
    {
        if(_init_error)
        {
            return std::unexpected(*_init_error);
        }
        return _sender_address;
    }

    std::uint64_t TransactionSigner::_gasLimitFor(const TransactionRequest & request) const
    {
        if(request.gas_limit)
        {
            return *request.gas_limit;
        }

        const auto estimate = _quantityResult(_rpc.call("eth_estimateGas", json::array({json{
            {"from", addressToHex(_sender_address)},
            {"to", addressToHex(request.to)},
            {"data", bytesToHex(request.data)},
            {"value", toHexQuantity(request.value_wei)}
        }})));

        if(!estimate)
        {
            spdlog::warn("Gas estimation failed, using fallback limit {}", request.gas_limit_fallback);
            return request.gas_limit_fallback;
        }

        const double scaled = std::ceil(static_cast<double>(*estimate) * request.gas_multiplier);
        if(scaled >= static_cast<double>(std::numeric_limits<std::uint64_t>::max()))
        {
            return request.gas_limit_fallback;
        }
        return static_cast<std::uint64_t>(scaled);
    }

    Result<std::string> TransactionSigner::sendTransaction(const TransactionRequest & request) const
    {
        if(_init_error)
        {
            return std::unexpected(*_init_error);
        }

        if(isZeroAddress(request.to))
        {
            return std::unexpected(ChainError{
                .kind = ChainError::Kind::INVALID_INPUT,
                .message = "transaction target must not be the zero address"
            });
        }

        const auto nonce_res = _rpc.call("eth_getTransactionCount", json::array({addressToHex(_sender_address), "pending"}));
        if(!nonce_res)
        {
            return std::unexpected(nonce_res.error());
        }
        const auto nonce = _quantityResult(nonce_res);
        if(!nonce)
        {
            return std::unexpected(ChainError{
                .kind = ChainError::Kind::RPC_MALFORMED,
                .message = "Failed to parse nonce quantity"
            });
        }

        _FeeQuote fees{.max_priority_fee = _cfg.fallback_max_priority_fee_wei, .max_fee = 0};
        if(const auto priority = _quantityResult(_rpc.call("eth_maxPriorityFeePerGas", json::array())))
        {
            fees.max_priority_fee = *priority;
        }

        std::uint64_t base_fee = 0;
        if(const auto block_res = _rpc.call("eth_getBlockByNumber", json::array({"latest", false})))
        {
            if(block_res->is_object() && block_res->contains("baseFeePerGas") && (*block_res)["baseFeePerGas"].is_string())
            {
                base_fee = parseHexQuantity((*block_res)["baseFeePerGas"].get<std::string>()).value_or(0);
            }
        }

        if(base_fee <= (std::numeric_limits<std::uint64_t>::max() - fees.max_priority_fee) / 2)
        {
            fees.max_fee = (base_fee * 2) + fees.max_priority_fee;
        }
        else
        {
            fees.max_fee = std::numeric_limits<std::uint64_t>::max();
        }

        const std::uint64_t gas_limit = _gasLimitFor(request);

        const auto raw_tx = _signCallTx(_private_key, _cfg.chain_id, *nonce, fees, gas_limit, request);
        if(!raw_tx)
        {
            return std::unexpected(raw_tx.error());
        }

        const auto send_res = _rpc.call("eth_sendRawTransaction", json::array({bytesToHex(*raw_tx)}));
        if(!send_res)
        {
            return std::unexpected(send_res.error());
        }

        if(!send_res->is_string())
        {
            return std::unexpected(ChainError{
                .kind = ChainError::Kind::RPC_MALFORMED,
                .message = "eth_sendRawTransaction returned non-string result"
            });
        }

        spdlog::debug("Sent transaction {} (nonce {}, gas {})", send_res->get<std::string>(), *nonce, gas_limit);
        return send_res->get<std::string>();
    }

    Result<TransactionReceipt> TransactionSigner::waitForReceipt(const std::string & tx_hash) const
    {
        for(std::size_t i = 0; i < _cfg.max_receipt_polls; ++i)
        {
            const auto receipt_res = _rpc.call("eth_getTransactionReceipt", json::array({tx_hash}));
            if(!receipt_res)
            {
                return std::unexpected(receipt_res.error());
            }

            if(receipt_res->is_null())
            {
                if(_sleep)
                {
                    _sleep(_cfg.receipt_poll_interval);
                }
                continue;
            }

            if(!receipt_res->is_object())
            {
                return std::unexpected(ChainError{
                    .kind = ChainError::Kind::RPC_MALFORMED,
                    .message = "eth_getTransactionReceipt returned non-object result"
                });
            }

            if(receipt_res->value("status", "0x1") == "0x0")
            {
                return std::unexpected(ChainError{
                    .kind = ChainError::Kind::TRANSACTION_REVERTED,
                    .message = std::format("Transaction reverted ({})", tx_hash)
                });
            }

            return TransactionReceipt{
                .tx_hash = tx_hash,
                .block_number = parseHexQuantity(receipt_res->value("blockNumber", "0x0")).value_or(0),
                .gas_used = parseHexQuantity(receipt_res->value("gasUsed", "0x0")).value_or(0)
            };
        }

        return std::unexpected(ChainError{
            .kind = ChainError::Kind::TIMEOUT,
            .message = std::format("Timed out while waiting for receipt ({})", tx_hash)
        });
    }
}
