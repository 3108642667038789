#include "challenge.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "crypto.hpp"

namespace pdp::challenge
{
    std::uint64_t reduceModulo(const evmc::bytes32 & digest, std::uint64_t modulus)
    {
        unsigned __int128 remainder = 0;
        for(const std::uint8_t byte : digest.bytes)
        {
            remainder = ((remainder << 8) | byte) % modulus;
        }
        return static_cast<std::uint64_t>(remainder);
    }

    std::optional<std::uint64_t> generateChallengeIndex(
        evmc::bytes_view seed,
        const evmc::uint256be & data_set_id,
        const evmc::uint256be & proof_index,
        std::uint64_t total_leaves)
    {
        if(total_leaves == 0)
        {
            spdlog::debug("No leaves to challenge");
            return std::nullopt;
        }

        evmc::bytes preimage;
        preimage.reserve(std::max(seed.size(), utils::WORD_SIZE) + 2 * utils::WORD_SIZE);
        if(seed.size() < utils::WORD_SIZE)
        {
            preimage.append(utils::WORD_SIZE - seed.size(), std::uint8_t{0});
        }
        preimage.append(seed);
        preimage.append(data_set_id.bytes, utils::WORD_SIZE);
        preimage.append(proof_index.bytes, utils::WORD_SIZE);

        return reduceModulo(crypto::keccak256(preimage), total_leaves);
    }

    std::optional<std::uint64_t> generateChallengeIndex(
        evmc::bytes_view seed,
        std::uint64_t data_set_id,
        std::uint64_t proof_index,
        std::uint64_t total_leaves)
    {
        return generateChallengeIndex(seed, utils::fromUint64(data_set_id), utils::fromUint64(proof_index), total_leaves);
    }
}
