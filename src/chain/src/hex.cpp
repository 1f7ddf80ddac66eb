#include "hex.hpp"

#include <charconv>
#include <format>

namespace tad::chain
{
    namespace
    {
        int _hexValue(const char c)
        {
            if(c >= '0' && c <= '9')
            {
                return c - '0';
            }
            if(c >= 'a' && c <= 'f')
            {
                return 10 + (c - 'a');
            }
            if(c >= 'A' && c <= 'F')
            {
                return 10 + (c - 'A');
            }
            return -1;
        }

        bool _hasHexPrefix(const std::string & value)
        {
            return value.rfind("0x", 0) == 0 || value.rfind("0X", 0) == 0;
        }
    }

    std::string stripHexPrefix(const std::string & value)
    {
        if(_hasHexPrefix(value))
        {
            return value.substr(2);
        }
        return value;
    }

    std::string withHexPrefix(std::string value)
    {
        if(_hasHexPrefix(value))
        {
            return value;
        }
        return std::string("0x") + value;
    }

    std::string toHexQuantity(const std::uint64_t value)
    {
        return std::format("0x{:x}", value);
    }

    std::optional<std::uint64_t> parseHexQuantity(const std::string & value)
    {
        if(value.empty())
        {
            return std::nullopt;
        }

        const bool is_hex = _hasHexPrefix(value);
        const std::string digits = is_hex ? value.substr(2) : value;
        if(digits.empty())
        {
            return is_hex ? std::optional<std::uint64_t>(0) : std::nullopt;
        }

        std::uint64_t out = 0;
        const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), out, is_hex ? 16 : 10);
        if(ec != std::errc() || ptr != digits.data() + digits.size())
        {
            return std::nullopt;
        }
        return out;
    }

    std::optional<Bytes> hexToBytes(const std::string & value)
    {
        const std::string hex = stripHexPrefix(value);
        if((hex.size() % 2) != 0)
        {
            return std::nullopt;
        }

        Bytes out;
        out.reserve(hex.size() / 2);

        for(std::size_t i = 0; i < hex.size(); i += 2)
        {
            const int hi = _hexValue(hex[i]);
            const int lo = _hexValue(hex[i + 1]);
            if(hi < 0 || lo < 0)
            {
                return std::nullopt;
            }

            out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
        }

        return out;
    }

    std::string bytesToHex(const std::uint8_t* bytes, const std::size_t size, const bool with_prefix)
    {
        static constexpr char HEX[] = "0123456789abcdef";
        std::string out;
        out.reserve(size * 2 + (with_prefix ? 2 : 0));
        if(with_prefix)
        {
            out += "0x";
        }

        for(std::size_t i = 0; i < size; ++i)
        {
            const std::uint8_t b = bytes[i];
            out.push_back(HEX[(b >> 4) & 0x0F]);
            out.push_back(HEX[b & 0x0F]);
        }

        return out;
    }

    std::string bytesToHex(const Bytes & bytes, const bool with_prefix)
    {
        return bytesToHex(bytes.data(), bytes.size(), with_prefix);
    }
}
