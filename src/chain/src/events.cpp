#include "events.hpp"

#include <format>

#include <nlohmann/json.hpp>

#include "crypto.hpp"
#include "decode_abi.hpp"
#include "utils.hpp"

namespace tad::chain
{
    using json = nlohmann::json;

    namespace
    {
        constexpr std::size_t DATA_HEAD_SIZE = 3 * 32;

        std::optional<std::uint64_t> _quantityField(const json & log, const char* name)
        {
            if(!log.contains(name) || !log[name].is_string())
            {
                return std::nullopt;
            }
            return parseHexQuantity(log[name].get<std::string>());
        }
    }

    const std::string & depositProcessedTopic()
    {
        static const std::string topic = bytesToHex(crypto::constructEventTopic(DEPOSIT_PROCESSED_SIGNATURE).bytes, 32);
        return topic;
    }

    std::optional<SubmissionEvent> decodeSubmissionEvent(const json & log, std::chrono::system_clock::time_point observed_at)
    {
        if(!log.is_object())
        {
            return std::nullopt;
        }

        const auto block_number = _quantityField(log, "blockNumber");
        if(!block_number)
        {
            return std::nullopt;
        }

        if(!log.contains("transactionHash") || !log["transactionHash"].is_string())
        {
            return std::nullopt;
        }

        if(!log.contains("topics") || !log["topics"].is_array() || log["topics"].size() != 4 || !log.contains("data") || !log["data"].is_string())
        {
            return std::nullopt;
        }

        std::vector<std::string> topics_hex;
        for(const auto & topic : log["topics"])
        {
            if(!topic.is_string())
            {
                return std::nullopt;
            }
            topics_hex.push_back(topic.get<std::string>());
        }

        if(utils::toLower(withHexPrefix(topics_hex.front())) != depositProcessedTopic())
        {
            return std::nullopt;
        }

        const auto topic_words = crypto::decodeTopicWords(topics_hex);
        if(!topic_words)
        {
            return std::nullopt;
        }

        const auto data = hexToBytes(log["data"].get<std::string>());
        if(!data || data->size() < DATA_HEAD_SIZE)
        {
            return std::nullopt;
        }

        const auto recipient = readAddressWord(*data, 0);
        const auto validation_offset = utils::readWordAsSizeT(data->data(), data->size(), 32);
        const auto proof_offset = utils::readWordAsSizeT(data->data(), data->size(), 64);
        if(!recipient || !validation_offset || !proof_offset)
        {
            return std::nullopt;
        }

        auto validation = utils::decodeAbiString(data->data(), data->size(), *validation_offset);
        auto proof = utils::decodeAbiBytes(data->data(), data->size(), *proof_offset);
        if(!validation || !proof)
        {
            return std::nullopt;
        }

        SubmissionEvent event;
        event.block_number = *block_number;
        event.transaction_hash = log["transactionHash"].get<std::string>();
        event.log_index = _quantityField(log, "logIndex").value_or(0);
        event.ip_amount = (*topic_words)[1];
        event.content_hash = (*topic_words)[2];
        event.depositor = topicWordToAddress((*topic_words)[3]);
        event.recipient = *recipient;
        event.validation = std::move(*validation);
        event.proof = std::move(*proof);
        event.emitted_at = observed_at;

        if(const auto block_timestamp = _quantityField(log, "blockTimestamp"))
        {
            event.emitted_at = std::chrono::system_clock::time_point(std::chrono::seconds(*block_timestamp));
        }

        return event;
    }

    std::string eventKey(const SubmissionEvent & event)
    {
        return std::format("{}:{}", event.transaction_hash, event.log_index);
    }
}
