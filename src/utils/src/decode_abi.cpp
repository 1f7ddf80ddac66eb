#include "decode_abi.hpp"

#include <utility>

namespace tad::utils
{
    namespace
    {
        // returns [begin, length) of a length-prefixed dynamic value
        std::optional<std::pair<std::size_t, std::size_t>> _dynamicRange(const std::uint8_t* data, std::size_t data_size, std::size_t offset)
        {
            const auto length_res = utils::readWordAsSizeT(data, data_size, offset);
            if(!length_res)
            {
                return std::nullopt;
            }

            const std::size_t length = *length_res;
            if(offset + 32 > data_size || length > (data_size - (offset + 32)))
            {
                return std::nullopt;
            }

            return std::make_pair(offset + 32, length);
        }
    }

    std::optional<std::size_t> readWordAsSizeT(const std::uint8_t* data, std::size_t data_size, std::size_t offset)
    {
        if(data == nullptr || offset > data_size || data_size - offset < 32)
        {
            return std::nullopt;
        }

        std::size_t value = 0;

        constexpr std::size_t prefix = 32 - sizeof(std::size_t);
        for(std::size_t i = 0; i < prefix; ++i)
        {
            if(data[offset + i] != 0)
            {
                return std::nullopt;
            }
        }

        for(std::size_t i = prefix; i < 32; ++i)
        {
            value = (value << 8) | data[offset + i];
        }

        return value;
    }

    std::optional<std::string> decodeAbiString(const std::uint8_t* data, std::size_t data_size, std::size_t string_offset)
    {
        const auto range = _dynamicRange(data, data_size, string_offset);
        if(!range)
        {
            return std::nullopt;
        }

        return std::string(reinterpret_cast<const char*>(data + range->first), range->second);
    }

    std::optional<std::vector<std::uint8_t>> decodeAbiBytes(const std::uint8_t* data, std::size_t data_size, std::size_t bytes_offset)
    {
        const auto range = _dynamicRange(data, data_size, bytes_offset);
        if(!range)
        {
            return std::nullopt;
        }

        return std::vector<std::uint8_t>(data + range->first, data + range->first + range->second);
    }
}
