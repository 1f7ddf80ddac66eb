#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <string>

namespace tad::chain
{
    struct ChainError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,
            INVALID_CONFIG,
            INVALID_INPUT,
            RPC_ERROR,
            RPC_MALFORMED,
            SIGNING_ERROR,
            TRANSACTION_REVERTED,
            TIMEOUT
        } kind = Kind::UNKNOWN;

        std::string message;
    };

    template<class T>
    using Result = std::expected<T, ChainError>;
}

template <>
struct std::formatter<tad::chain::ChainError::Kind> : std::formatter<std::string>
{
    auto format(const tad::chain::ChainError::Kind & err, format_context & ctx) const
    {
        switch(err)
        {
            case tad::chain::ChainError::Kind::INVALID_CONFIG:
                return formatter<string>::format("Invalid config", ctx);
            case tad::chain::ChainError::Kind::INVALID_INPUT:
                return formatter<string>::format("Invalid input", ctx);
            case tad::chain::ChainError::Kind::RPC_ERROR:
                return formatter<string>::format("RPC error", ctx);
            case tad::chain::ChainError::Kind::RPC_MALFORMED:
                return formatter<string>::format("Malformed RPC response", ctx);
            case tad::chain::ChainError::Kind::SIGNING_ERROR:
                return formatter<string>::format("Signing error", ctx);
            case tad::chain::ChainError::Kind::TRANSACTION_REVERTED:
                return formatter<string>::format("Transaction reverted", ctx);
            case tad::chain::ChainError::Kind::TIMEOUT:
                return formatter<string>::format("Timeout", ctx);
            default:
                return formatter<string>::format("Unknown", ctx);
        }
    }
};
