#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

#include <ethash/keccak.hpp>

namespace pdp::crypto
{
    evmc::bytes32 keccak256(evmc::bytes_view data);

    std::array<std::uint8_t, 4> constructSelector(const std::string & signature);

    evmc::bytes32 constructEventTopic(const std::string & signature);

    std::optional<std::vector<evmc::bytes32>> decodeTopicWords(const std::vector<std::string> & topics_hex);
}
