#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "address.hpp"
#include "hex.hpp"

namespace tad::chain::abi
{
    /**
     * @brief A value tree mirroring Solidity ABI types.
     *
     * Static scalars carry their encoded head word, `data` holds string/bytes payloads
     * and `items` holds tuple components or dynamic array elements.
     */
    struct Value
    {
        enum class Type : std::uint8_t
        {
            UINT = 0,
            ADDRESS,
            BOOL,
            FIXED_BYTES,
            STRING,
            BYTES,
            TUPLE,
            ARRAY
        };

        Type type = Type::UINT;
        evmc::bytes32 word{};
        Bytes data;
        std::vector<Value> items;
    };

    Value uint256(std::uint64_t value);
    Value address(const Address & value);
    Value boolean(bool value);

    /**
     * @brief bytesN for N <= 32, left-aligned in the word. Input beyond 32 bytes is ignored.
     */
    Value fixedBytes(const std::uint8_t* data, std::size_t size);
    Value bytes32(const evmc::bytes32 & value);

    Value string(std::string value);
    Value bytes(Bytes value);

    Value tuple(std::vector<Value> items);

    /**
     * @brief Dynamic array T[] of homogeneous items.
     */
    Value array(std::vector<Value> items);

    bool isDynamic(const Value & value);

    /**
     * @brief Encodes the values as the components of one tuple (function arguments layout).
     */
    Bytes encode(const std::vector<Value> & values);

    /**
     * @brief Selector of `signature` followed by encode(values).
     */
    Bytes encodeCall(const std::string & signature, const std::vector<Value> & values);
}
