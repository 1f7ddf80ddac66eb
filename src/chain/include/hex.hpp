#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tad::chain
{
    using Bytes = std::vector<std::uint8_t>;

    std::string stripHexPrefix(const std::string & value);

    std::string withHexPrefix(std::string value);

    /**
     * @brief JSON-RPC quantity encoding, e.g. 0x1a.
     */
    std::string toHexQuantity(std::uint64_t value);

    /**
     * @brief Parses a 0x-prefixed hex quantity or a plain decimal string.
     *
     * @return std::nullopt on malformed input or overflow.
     */
    std::optional<std::uint64_t> parseHexQuantity(const std::string & value);

    /**
     * @brief Decodes hex data. An empty payload ("0x") decodes to an empty vector.
     */
    std::optional<Bytes> hexToBytes(const std::string & value);

    std::string bytesToHex(const std::uint8_t* bytes, std::size_t size, bool with_prefix = true);

    std::string bytesToHex(const Bytes & bytes, bool with_prefix = true);
}
