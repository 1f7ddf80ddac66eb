#include "tokens.hpp"

#include <array>

#include "utils.hpp"

namespace tad::price
{
    namespace
    {
        constexpr std::array<TokenInfo, 23> SUPPORTED_TOKENS{{
            {"BTC",   "Bitcoin",      "bitcoin"},
            {"ETH",   "Ethereum",     "ethereum"},
            {"SOL",   "Solana",       "solana"},
            {"ADA",   "Cardano",      "cardano"},
            {"DOT",   "Polkadot",     "polkadot"},
            {"AVAX",  "Avalanche",    "avalanche-2"},
            {"MATIC", "Polygon",      "matic-network"},
            {"POL",   "Polygon",      "matic-network"},
            {"LINK",  "Ethereum",     "chainlink"},
            {"UNI",   "Ethereum",     "uniswap"},
            {"ATOM",  "Cosmos",       "cosmos"},
            {"XRP",   "Ripple",       "ripple"},
            {"DOGE",  "Dogecoin",     "dogecoin"},
            {"LTC",   "Litecoin",     "litecoin"},
            {"XLM",   "Stellar",      "stellar"},
            {"ALGO",  "Algorand",     "algorand"},
            {"FIL",   "Filecoin",     "filecoin"},
            {"ARB",   "Arbitrum",     "arbitrum"},
            {"BNB",   "BNB Chain",    "binancecoin"},
            {"USDC",  "Multi-chain",  "usd-coin"},
            {"USDT",  "Multi-chain",  "tether"},
            {"XDC",   "XDC Network",  "xdce-crowd-sale"},
            {"FLR",   "Flare",        "flare-networks"}
        }};
    }

    std::span<const TokenInfo> supportedTokens()
    {
        return SUPPORTED_TOKENS;
    }

    std::optional<TokenInfo> findToken(const std::string_view symbol)
    {
        for(const TokenInfo & token : SUPPORTED_TOKENS)
        {
            if(utils::equalsIgnoreCase(token.symbol, symbol))
            {
                return token;
            }
        }
        return std::nullopt;
    }

    bool isSupported(const std::string_view symbol)
    {
        return findToken(symbol).has_value();
    }
}
