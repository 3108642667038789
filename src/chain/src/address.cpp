#include <cstring>

#include "address.hpp"
#include "bytes.hpp"
#include "utils.hpp"

namespace pdp::chain
{
    std::optional<chain::Address> readAddressWord(evmc::bytes_view data, std::size_t offset)
    {
        const auto word = utils::view(data, offset, utils::WORD_SIZE);
        if(!word)
        {
            return std::nullopt;
        }

        chain::Address addr{};
        std::memcpy(addr.bytes, word->data() + (utils::WORD_SIZE - utils::ADDRESS_SIZE), utils::ADDRESS_SIZE);
        return addr;
    }

    chain::Address topicWordToAddress(const evmc::bytes32 & topic_word)
    {
        chain::Address addr{};
        std::memcpy(addr.bytes, topic_word.bytes + 12, 20);
        return addr;
    }

    std::string toHexString(const chain::Address & address)
    {
        return utils::withHexPrefix(evmc::hex(evmc::bytes_view{address.bytes, sizeof(address.bytes)}));
    }

    std::optional<chain::Address> parseAddress(const std::string & hex)
    {
        const std::string stripped = utils::toLower(hex);
        const std::size_t digits = stripped.rfind("0x", 0) == 0 ? stripped.size() - 2 : stripped.size();
        if(digits != utils::ADDRESS_SIZE * 2)
        {
            return std::nullopt;
        }
        return evmc::from_hex<chain::Address>(stripped);
    }
}
