#pragma once

#include <cstdint>
#include <vector>

#include "hex.hpp"

namespace tad::chain::rlp
{
    Bytes minimalBigEndian(std::uint64_t value);

    Bytes encodeBytes(const std::uint8_t* bytes, std::size_t size);

    Bytes encodeBytes(const Bytes & bytes);

    Bytes encodeUint64(std::uint64_t value);

    /**
     * @brief Encodes a big-endian integer with its leading zero bytes removed.
     */
    Bytes encodeBigInteger(const std::uint8_t* bytes, std::size_t size);

    /**
     * @brief Wraps already encoded items into a list.
     */
    Bytes encodeList(const std::vector<Bytes> & encoded_items);
}
