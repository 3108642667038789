#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "address.hpp"

namespace pdp::chain
{
    /**
     * @brief Position of a log inside the chain, used to enforce delivery order.
     */
    struct LogPosition
    {
        std::uint64_t block_number = 0;
        std::uint64_t transaction_index = 0;
        std::uint64_t log_index = 0;

        auto operator<=>(const LogPosition &) const = default;
    };

    struct EventLog
    {
        chain::Address address{};
        std::vector<evmc::bytes32> topics;
        evmc::bytes data;

        evmc::bytes32 transaction_hash{};
        // call data of the transaction that emitted the log, empty when unknown
        evmc::bytes transaction_input;

        std::uint64_t block_number = 0;
        std::uint64_t block_timestamp = 0;
        std::uint64_t transaction_index = 0;
        std::uint64_t log_index = 0;

        LogPosition position() const;
    };

    /**
     * @brief Parses one `eth_getLogs` result object.
     *
     * Accepts the optional non-standard `input` (transaction call data) and `blockTimestamp` fields.
     */
    std::optional<EventLog> parseLog(const nlohmann::json & log);

    /**
     * @brief Parses an array of log objects, skipping malformed entries.
     */
    std::vector<EventLog> parseLogs(const nlohmann::json & logs);

    /**
     * @brief Stable sort by (block, transaction index, log index).
     */
    void sortLogs(std::vector<EventLog> & logs);
}
