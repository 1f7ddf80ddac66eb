#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace tad::price
{
    struct TokenInfo
    {
        std::string_view symbol;
        std::string_view chain;
        std::string_view coingecko_id;
    };

    /**
     * @brief Mainnet tokens the daemon can classify and price.
     */
    std::span<const TokenInfo> supportedTokens();

    /**
     * @brief Case-insensitive lookup by ticker symbol.
     */
    std::optional<TokenInfo> findToken(std::string_view symbol);

    bool isSupported(std::string_view symbol);
}
