#pragma once

#include <optional>
#include <cstdint>
#include <string>

#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

namespace pdp::chain
{
    using Address = evmc::address;

    std::optional<chain::Address> readAddressWord(evmc::bytes_view data, std::size_t offset = 0);

    chain::Address topicWordToAddress(const evmc::bytes32 & topic_word);

    /**
     * @brief Lowercase `0x` prefixed hex form, used as entity key.
     */
    std::string toHexString(const chain::Address & address);

    std::optional<chain::Address> parseAddress(const std::string & hex);
}
