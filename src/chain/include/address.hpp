#pragma once

#include <optional>
#include <cstdint>
#include <string>
#include <vector>


#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

namespace tad::chain
{
    using Address = evmc::address;

    std::optional<chain::Address> readAddressWord(const std::uint8_t* data, std::size_t data_size, std::size_t offset = 0);
    std::optional<chain::Address> readAddressWord(const std::vector<std::uint8_t> & data, std::size_t offset = 0);

    chain::Address topicWordToAddress(const evmc::bytes32 & topic_word);

    /**
     * @brief Parses a 20-byte hex address, with or without 0x prefix.
     */
    std::optional<chain::Address> parseAddress(const std::string & value);

    /**
     * @brief Lower-case, 0x-prefixed representation.
     */
    std::string addressToHex(const chain::Address & address);

    bool isZeroAddress(const chain::Address & address);
}
