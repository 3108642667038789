#include "crypto.hpp"

#include <algorithm>
#include <iterator>

namespace pdp::crypto
{
    evmc::bytes32 keccak256(evmc::bytes_view data)
    {
        const ethash::hash256 hash = ethash::keccak256(data.data(), data.size());

        evmc::bytes32 digest{};
        std::copy(std::begin(hash.bytes), std::end(hash.bytes), digest.bytes);
        return digest;
    }

    std::array<std::uint8_t, 4> constructSelector(const std::string & signature)
    {
        const evmc::bytes32 hash = keccak256(evmc::bytes_view{reinterpret_cast<const std::uint8_t*>(signature.data()), signature.size()});
        return {hash.bytes[0], hash.bytes[1], hash.bytes[2], hash.bytes[3]};
    }

    evmc::bytes32 constructEventTopic(const std::string & signature)
    {
        return keccak256(evmc::bytes_view{reinterpret_cast<const std::uint8_t*>(signature.data()), signature.size()});
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
}
