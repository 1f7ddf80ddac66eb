#pragma once

#include <cstdint>
#include <string>
#include <expected>
#include <format>

namespace tad::net
{
    struct Error
    {
        enum class Kind : std::uint8_t
        {
            UNKNOWN             = 0U,

            INVALID_INPUT       = 1U,
            PROCESS_FAILED      = 2U,
            TIMEOUT             = 3U,
            HTTP_STATUS         = 4U,
            MALFORMED_RESPONSE  = 5U
        };

        Kind kind = Kind::UNKNOWN;
        std::string message = "";
        long status = 0;
    };

    template<class T>
    using Result = std::expected<T, Error>;
}

template <>
struct std::formatter<tad::net::Error::Kind> : std::formatter<std::string> {
    auto format(const tad::net::Error::Kind & err, format_context& ctx) const {
        switch(err)
        {
            case tad::net::Error::Kind::INVALID_INPUT : return formatter<string>::format("Invalid input", ctx);
            case tad::net::Error::Kind::PROCESS_FAILED : return formatter<string>::format("Process failed", ctx);
            case tad::net::Error::Kind::TIMEOUT : return formatter<string>::format("Timeout", ctx);
            case tad::net::Error::Kind::HTTP_STATUS : return formatter<string>::format("HTTP status", ctx);
            case tad::net::Error::Kind::MALFORMED_RESPONSE : return formatter<string>::format("Malformed response", ctx);

            default:  return formatter<string>::format("Unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
