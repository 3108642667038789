#pragma once

#include <cstdint>
#include <optional>

#include "bytes.hpp"

namespace pdp::challenge
{
    /**
     * @brief Big-endian value of `digest` modulo `modulus`. `modulus` must not be zero.
     */
    std::uint64_t reduceModulo(const evmc::bytes32 & digest, std::uint64_t modulus);

    /**
     * @brief Derives the leaf challenged by one proof of a data set.
     *
     * keccak256(seed left-padded to 32 bytes | data_set_id as uint256 | proof_index as uint256) mod total_leaves.
     * Seeds longer than 32 bytes are hashed as they are.
     *
     * @return std::nullopt when `total_leaves` is zero.
     */
    std::optional<std::uint64_t> generateChallengeIndex(
        evmc::bytes_view seed,
        const evmc::uint256be & data_set_id,
        const evmc::uint256be & proof_index,
        std::uint64_t total_leaves);

    std::optional<std::uint64_t> generateChallengeIndex(
        evmc::bytes_view seed,
        std::uint64_t data_set_id,
        std::uint64_t proof_index,
        std::uint64_t total_leaves);
}
