#pragma once

#include <chrono>
#include <string>

namespace tad::price
{
    struct PriceQuote
    {
        std::string symbol;
        double price = 0.0;
        std::string source;
        std::chrono::system_clock::time_point timestamp{};

        // false means "no price available"; price is 0 and source is "none"
        bool success = false;
    };

    struct PriceMetadata
    {
        PriceQuote quote;
        std::string chain;
        std::string coingecko_id;
    };

    inline constexpr const char* NO_SOURCE = "none";
}
