#include "log.hpp"

#include <algorithm>
#include <string>

#include <nlohmann/json.hpp>

#include <spdlog/spdlog.h>

#include "crypto.hpp"
#include "utils.hpp"

namespace pdp::chain
{
    using json = nlohmann::json;

    namespace
    {
        std::optional<std::uint64_t> _quantityField(const json & log, const char* name, bool required)
        {
            if(!log.contains(name) || log[name].is_null())
            {
                if(required)
                {
                    return std::nullopt;
                }
                return 0;
            }

            if(log[name].is_number_unsigned())
            {
                return log[name].get<std::uint64_t>();
            }

            if(!log[name].is_string())
            {
                return std::nullopt;
            }

            return utils::parseQuantity(log[name].get<std::string>());
        }

        std::optional<evmc::bytes> _bytesField(const json & log, const char* name)
        {
            if(!log.contains(name) || log[name].is_null())
            {
                return evmc::bytes{};
            }

            if(!log[name].is_string())
            {
                return std::nullopt;
            }

            const std::string value = log[name].get<std::string>();
            if(value == "0x" || value.empty())
            {
                return evmc::bytes{};
            }
            return evmc::from_hex(value);
        }
    }

    LogPosition EventLog::position() const
    {
        return LogPosition{
            .block_number = block_number,
            .transaction_index = transaction_index,
            .log_index = log_index
        };
    }

    std::optional<EventLog> parseLog(const json & log)
    {
        if(!log.is_object())
        {
            return std::nullopt;
        }

        if(!log.contains("topics") || !log["topics"].is_array() || log["topics"].empty() || !log.contains("address") || !log["address"].is_string())
        {
            return std::nullopt;
        }

        EventLog event;

        const auto address_res = chain::parseAddress(log["address"].get<std::string>());
        if(!address_res)
        {
            return std::nullopt;
        }
        event.address = *address_res;

        std::vector<std::string> topics_hex;
        for(const auto & topic : log["topics"])
        {
            if(!topic.is_string())
            {
                return std::nullopt;
            }
            topics_hex.push_back(topic.get<std::string>());
        }

        auto topic_words = crypto::decodeTopicWords(topics_hex);
        if(!topic_words)
        {
            return std::nullopt;
        }
        event.topics = std::move(*topic_words);

        const auto data_res = _bytesField(log, "data");
        const auto input_res = _bytesField(log, "input");
        if(!data_res || !input_res)
        {
            return std::nullopt;
        }
        event.data = std::move(*data_res);
        event.transaction_input = std::move(*input_res);

        if(log.contains("transactionHash") && log["transactionHash"].is_string())
        {
            const auto hash_res = evmc::from_hex<evmc::bytes32>(log["transactionHash"].get<std::string>());
            if(!hash_res)
            {
                return std::nullopt;
            }
            event.transaction_hash = *hash_res;
        }

        const auto block_number = _quantityField(log, "blockNumber", true);
        const auto block_timestamp = _quantityField(log, "blockTimestamp", false);
        const auto transaction_index = _quantityField(log, "transactionIndex", false);
        const auto log_index = _quantityField(log, "logIndex", true);
        if(!block_number || !block_timestamp || !transaction_index || !log_index)
        {
            return std::nullopt;
        }

        event.block_number = *block_number;
        event.block_timestamp = *block_timestamp;
        event.transaction_index = *transaction_index;
        event.log_index = *log_index;

        return event;
    }

    std::vector<EventLog> parseLogs(const json & logs)
    {
        std::vector<EventLog> out;
        if(!logs.is_array())
        {
            spdlog::error("Expected an array of logs");
            return out;
        }

        out.reserve(logs.size());
        for(std::size_t i = 0; i < logs.size(); ++i)
        {
            auto event = parseLog(logs[i]);
            if(!event)
            {
                spdlog::warn("Skipping malformed log at position {}", i);
                continue;
            }
            out.push_back(std::move(*event));
        }
        return out;
    }

    void sortLogs(std::vector<EventLog> & logs)
    {
        std::ranges::stable_sort(logs, [](const EventLog & a, const EventLog & b)
        {
            return a.position() < b.position();
        });
    }
}
