#pragma once

#include <cstdint>
#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace tad::price
{
    struct SourceError
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN = 0,
            UNAVAILABLE,
            NOT_FOUND,
            REQUEST_FAILED,
            MALFORMED_RESPONSE
        } kind = Kind::UNKNOWN;

        std::string message;
    };

    template<class T>
    using SourceResult = std::expected<T, SourceError>;

    /**
     * @brief One upstream price feed. Prices are in USD.
     */
    class IPriceSource
    {
    public:
        virtual ~IPriceSource() = default;

        virtual std::string_view name() const = 0;

        /**
         * @param symbol upper-case ticker
         */
        virtual SourceResult<double> fetchPrice(const std::string & symbol) const = 0;
    };
}

template <>
struct std::formatter<tad::price::SourceError::Kind> : std::formatter<std::string>
{
    auto format(const tad::price::SourceError::Kind & err, format_context & ctx) const
    {
        switch(err)
        {
            case tad::price::SourceError::Kind::UNAVAILABLE:
                return formatter<string>::format("Unavailable", ctx);
            case tad::price::SourceError::Kind::NOT_FOUND:
                return formatter<string>::format("Not found", ctx);
            case tad::price::SourceError::Kind::REQUEST_FAILED:
                return formatter<string>::format("Request failed", ctx);
            case tad::price::SourceError::Kind::MALFORMED_RESPONSE:
                return formatter<string>::format("Malformed response", ctx);
            default:
                return formatter<string>::format("Unknown", ctx);
        }
    }
};
