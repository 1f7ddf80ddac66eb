#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

namespace tad::crypto
{
    evmc::bytes32 keccak256(const std::uint8_t* data, std::size_t size);

    evmc::bytes32 keccak256(std::string_view text);

    std::vector<std::uint8_t> constructSelector(std::string signature);

    evmc::bytes32 constructEventTopic(std::string signature);

    std::optional<std::vector<evmc::bytes32>> decodeTopicWords(const std::vector<std::string> & topics_hex);

    /**
     * @brief Identity of an archived item: keccak256 of the UTF-8 locator.
     *
     * The same value is used as the registry key and as the tweet hash of a resubmission.
     */
    evmc::bytes32 contentHash(const std::string & locator);
}
