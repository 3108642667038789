#pragma once

#include <array>
#include <cstdint>
#include <optional>

#include "decode_abi.hpp"

namespace pdp::abi
{
    using Selector = std::array<std::uint8_t, 4>;

    // multisig execTransaction(address,uint256,bytes,uint8,uint256,uint256,uint256,address,address,bytes)
    inline constexpr Selector EXEC_TRANSACTION_SELECTOR{0x6a, 0x76, 0x12, 0x02};
    // addServiceProvider(address,string,string)
    inline constexpr Selector ADD_SERVICE_PROVIDER_SELECTOR{0x5f, 0x68, 0x40, 0xec};
    // multiSend(bytes)
    inline constexpr Selector MULTI_SEND_SELECTOR{0x8d, 0x80, 0xff, 0x0a};

    inline constexpr std::size_t MIN_ADD_SERVICE_PROVIDER_SIZE = 3 * utils::WORD_SIZE;

    inline constexpr std::size_t MAX_CALL_NESTING = 4;

    bool hasSelector(evmc::bytes_view call_data, const Selector & selector);

    /**
     * @brief Finds the addServiceProvider call carried by a transaction input.
     *
     * The call may be the input itself, the `data` argument of a multisig execTransaction,
     * or one of the packed transactions of a multiSend batch, nested up to MAX_CALL_NESTING levels.
     *
     * @return The call data of the first addServiceProvider call found, selector included.
     */
    std::optional<evmc::bytes_view> findAddServiceProviderCall(evmc::bytes_view transaction_input);
}
