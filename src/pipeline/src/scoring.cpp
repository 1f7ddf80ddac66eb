#include "scoring.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <limits>
#include <vector>

#include "tokens.hpp"
#include "utils.hpp"

namespace tad::pipeline
{
    namespace
    {
        struct _Variations
        {
            std::string_view symbol;
            std::array<std::string_view, 3> names;
        };

        constexpr std::array<_Variations, 8> NAME_VARIATIONS{{
            {"BTC",   {"bitcoin", "btc", ""}},
            {"ETH",   {"ethereum", "eth", "ether"}},
            {"SOL",   {"solana", "sol", ""}},
            {"ADA",   {"cardano", "ada", ""}},
            {"DOT",   {"polkadot", "dot", ""}},
            {"AVAX",  {"avalanche", "avax", ""}},
            {"MATIC", {"polygon", "matic", ""}},
            {"POL",   {"polygon", "pol", ""}}
        }};

        bool _contains(const std::string & haystack, const std::string & needle)
        {
            return !needle.empty() && haystack.find(needle) != std::string::npos;
        }
    }

    double combinedScore(const std::optional<double> primary, const std::optional<double> secondary)
    {
        double score = 0.0;
        if(primary && secondary)
        {
            score = *primary * PRIMARY_WEIGHT + *secondary * SECONDARY_WEIGHT;
        }
        else if(primary)
        {
            score = *primary;
        }
        else if(secondary)
        {
            score = *secondary;
        }
        return std::clamp(score, 0.0, 1.0);
    }

    double ecosystemConfidence(const std::string_view text, const std::string_view symbol)
    {
        const auto token = price::findToken(symbol);
        if(!token)
        {
            return 0.0;
        }

        const std::string lowered = utils::toLower(std::string(text));
        const std::string sym = utils::toLower(std::string(token->symbol));

        double confidence = 0.0;
        if(_contains(lowered, "$" + sym))
        {
            confidence += 0.5;
        }
        else if(_contains(lowered, sym))
        {
            confidence += 0.3;
        }

        if(_contains(lowered, utils::toLower(std::string(token->chain))))
        {
            confidence += 0.3;
        }

        for(const _Variations & entry : NAME_VARIATIONS)
        {
            if(entry.symbol != token->symbol)
            {
                continue;
            }

            const bool matched = std::ranges::any_of(entry.names, [&lowered](const std::string_view name)
            {
                return _contains(lowered, std::string(name));
            });
            if(matched)
            {
                confidence += 0.2;
            }
            break;
        }

        return std::min(confidence, 1.0);
    }

    std::string normalizeToken(const std::string_view answer)
    {
        std::string token = utils::toUpper(utils::trim(answer));
        if(!token.empty() && token.front() == '$')
        {
            token.erase(0, 1);
        }

        if(!price::isSupported(token))
        {
            return UNKNOWN_TOKEN;
        }
        return token;
    }

    std::uint64_t normalizeCount(const std::string_view value)
    {
        std::uint64_t count = 0;
        bool any_digit = false;
        for(const char c : value)
        {
            if(!std::isdigit(static_cast<unsigned char>(c)))
            {
                continue;
            }

            any_digit = true;
            const std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
            if(count > (std::numeric_limits<std::uint64_t>::max() - digit) / 10)
            {
                return 0;
            }
            count = count * 10 + digit;
        }
        return any_digit ? count : 0;
    }
}
