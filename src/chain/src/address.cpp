#include <cstring>

#include "address.hpp"
#include "hex.hpp"

namespace tad::chain
{
    std::optional<chain::Address> readAddressWord(const std::uint8_t* data, std::size_t data_size, std::size_t offset)
    {
        if(data == nullptr || offset > data_size || data_size - offset < 32)
        {
            return std::nullopt;
        }

        chain::Address addr{};
        std::memcpy(addr.bytes, data + offset + 12, 20);
        return addr;
    }

    std::optional<chain::Address> readAddressWord(const std::vector<std::uint8_t> & data, std::size_t offset)
    {
        return readAddressWord(data.data(), data.size(), offset);
    }

    chain::Address topicWordToAddress(const evmc::bytes32 & topic_word)
    {
        chain::Address addr{};
        std::memcpy(addr.bytes, topic_word.bytes + 12, 20);
        return addr;
    }

    std::optional<chain::Address> parseAddress(const std::string & value)
    {
        const auto bytes = hexToBytes(value);
        if(!bytes || bytes->size() != 20)
        {
            return std::nullopt;
        }

        chain::Address addr{};
        std::memcpy(addr.bytes, bytes->data(), 20);
        return addr;
    }

    std::string addressToHex(const chain::Address & address)
    {
        return bytesToHex(address.bytes, sizeof(address.bytes));
    }

    bool isZeroAddress(const chain::Address & address)
    {
        return address == chain::Address{};
    }
}
