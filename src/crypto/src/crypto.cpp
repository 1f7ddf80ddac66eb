#include "crypto.hpp"

#include <cstring>

#include <ethash/keccak.hpp>

namespace tad::crypto
{
    evmc::bytes32 keccak256(const std::uint8_t* data, std::size_t size)
    {
        const ethash::hash256 hash = ethash::keccak256(data, size);
        evmc::bytes32 out{};
        std::memcpy(out.bytes, hash.bytes, sizeof(out.bytes));
        return out;
    }

    evmc::bytes32 keccak256(std::string_view text)
    {
        return keccak256(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
    }

    std::vector<std::uint8_t> constructSelector(std::string signature)
    {
        const evmc::bytes32 hash = keccak256(signature);
        return std::vector<std::uint8_t>(hash.bytes, hash.bytes + 4);
    }

    evmc::bytes32 constructEventTopic(std::string signature)
    {
        return keccak256(signature);
    }

    std::optional<std::vector<evmc::bytes32>> decodeTopicWords(const std::vector<std::string> & topics_hex)
    {
        if(topics_hex.empty())
        {
            return std::nullopt;
        }

        std::vector<evmc::bytes32> topic_words;
        topic_words.reserve(topics_hex.size());
        for(const std::string & topic_hex : topics_hex)
        {
            const auto topic_word = evmc::from_hex<evmc::bytes32>(topic_hex);
            if(!topic_word)
            {
                return std::nullopt;
            }
            topic_words.push_back(*topic_word);
        }

        return topic_words;
    }

    evmc::bytes32 contentHash(const std::string & locator)
    {
        return keccak256(locator);
    }
}
