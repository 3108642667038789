#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#ifdef interface
    #undef interface
#endif
#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#ifndef interface
    #define interface __STRUCT__
#endif

namespace pdp::utils
{
    static constexpr std::size_t WORD_SIZE = 32;
    static constexpr std::size_t ADDRESS_SIZE = 20;
    static constexpr std::size_t SELECTOR_SIZE = 4;

    /**
     * @brief Compares `length` bytes of `a` starting at `a_start` with `length` bytes of `b` starting at `b_start`.
     *
     * Never reads out of bounds. If either range does not fit into its source the result is false,
     * even for a zero length. Two in-bounds empty ranges are equal.
     */
    bool equals(evmc::bytes_view a, std::size_t a_start, evmc::bytes_view b, std::size_t b_start, std::size_t length);

    /**
     * @brief Compares the whole of `b` with the bytes of `a` starting at `a_start`.
     */
    bool equals(evmc::bytes_view a, std::size_t a_start, evmc::bytes_view b);

    /**
     * @brief Reads the 32 byte big-endian word at `offset`.
     *
     * @return The word, or zero when fewer than 32 bytes remain.
     */
    evmc::uint256be toUint256(evmc::bytes_view data, std::size_t offset);

    /**
     * @brief Reads the last 4 bytes of the 32 byte word at `offset` as two's-complement int32.
     *
     * @return The value, or zero when fewer than 32 bytes remain.
     */
    std::int32_t toI32(evmc::bytes_view data, std::size_t offset);

    /**
     * @brief Non-copying sub-range of `data`.
     *
     * @return std::nullopt if [start, start + length) is not inside `data`.
     */
    std::optional<evmc::bytes_view> view(evmc::bytes_view data, std::size_t start, std::size_t length);

    /**
     * @brief Copies a byte range into an owned byte sequence.
     */
    evmc::bytes toBytes(evmc::bytes_view data);

    std::optional<std::uint64_t> toUint64(const evmc::uint256be & word);

    std::optional<std::size_t> readWordAsSizeT(evmc::bytes_view data, std::size_t offset);

    std::optional<std::uint64_t> readUint64Word(evmc::bytes_view data, std::size_t offset);

    evmc::uint256be fromUint64(std::uint64_t value);

    bool isZero(const evmc::uint256be & word);

    /**
     * @brief Base 10 rendering of an unsigned 256 bit big-endian value.
     */
    std::string toDecimalString(const evmc::uint256be & word);
}
