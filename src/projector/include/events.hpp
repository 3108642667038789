#pragma once

#include <array>
#include <cstdint>
#include <format>
#include <string>

#include "bytes.hpp"

namespace pdp::projector
{
    enum class EventKind : std::uint8_t
    {
        UNKNOWN = 0,

        DATA_SET_RAIL_CREATED,
        PIECES_ADDED,
        PIECES_REMOVED,
        NEXT_PROVING_PERIOD,
        POSSESSION_PROVEN,
        FAULT_RECORD,
        RAIL_RATE_UPDATED,
        PROVIDER_REGISTERED,
        PROVIDER_APPROVED,
        PROVIDER_REJECTED,
        PROVIDER_REMOVED
    };

    struct EventSignature
    {
        EventKind kind = EventKind::UNKNOWN;
        const char * signature = "";
        // topics after topic0
        std::size_t indexed_count = 0;
    };

    inline constexpr std::array<EventSignature, 11> EVENT_SIGNATURES{{
        {EventKind::DATA_SET_RAIL_CREATED,  "DataSetRailCreated(uint256,uint256,address,address,bytes)", 3},
        {EventKind::PIECES_ADDED,           "PiecesAdded(uint256,uint256,uint256[],bytes)", 1},
        {EventKind::PIECES_REMOVED,         "PiecesRemoved(uint256,uint256[])", 1},
        {EventKind::NEXT_PROVING_PERIOD,    "NextProvingPeriod(uint256,uint256,uint256)", 1},
        {EventKind::POSSESSION_PROVEN,      "PossessionProven(uint256,bytes)", 1},
        {EventKind::FAULT_RECORD,           "FaultRecord(uint256,uint256,uint256)", 1},
        {EventKind::RAIL_RATE_UPDATED,      "RailRateUpdated(uint256,uint256)", 1},
        {EventKind::PROVIDER_REGISTERED,    "ProviderRegistered(address,uint256)", 1},
        {EventKind::PROVIDER_APPROVED,      "ProviderApproved(address,uint256)", 1},
        {EventKind::PROVIDER_REJECTED,      "ProviderRejected(address,uint256)", 1},
        {EventKind::PROVIDER_REMOVED,       "ProviderRemoved(address,uint256)", 1}
    }};

    const EventSignature & signatureOf(EventKind kind);

    /**
     * @brief keccak256 of the event signature, as found in topics[0].
     */
    const evmc::bytes32 & eventTopic(EventKind kind);

    /**
     * @brief Maps topics[0] to a handled event, EventKind::UNKNOWN otherwise.
     */
    EventKind classifyTopic(const evmc::bytes32 & topic0);
}

template <>
struct std::formatter<pdp::projector::EventKind> : std::formatter<std::string> {
    auto format(const pdp::projector::EventKind & kind, format_context& ctx) const {
        switch(kind)
        {
            case pdp::projector::EventKind::DATA_SET_RAIL_CREATED : return formatter<string>::format("DataSetRailCreated", ctx);
            case pdp::projector::EventKind::PIECES_ADDED : return formatter<string>::format("PiecesAdded", ctx);
            case pdp::projector::EventKind::PIECES_REMOVED : return formatter<string>::format("PiecesRemoved", ctx);
            case pdp::projector::EventKind::NEXT_PROVING_PERIOD : return formatter<string>::format("NextProvingPeriod", ctx);
            case pdp::projector::EventKind::POSSESSION_PROVEN : return formatter<string>::format("PossessionProven", ctx);
            case pdp::projector::EventKind::FAULT_RECORD : return formatter<string>::format("FaultRecord", ctx);
            case pdp::projector::EventKind::RAIL_RATE_UPDATED : return formatter<string>::format("RailRateUpdated", ctx);
            case pdp::projector::EventKind::PROVIDER_REGISTERED : return formatter<string>::format("ProviderRegistered", ctx);
            case pdp::projector::EventKind::PROVIDER_APPROVED : return formatter<string>::format("ProviderApproved", ctx);
            case pdp::projector::EventKind::PROVIDER_REJECTED : return formatter<string>::format("ProviderRejected", ctx);
            case pdp::projector::EventKind::PROVIDER_REMOVED : return formatter<string>::format("ProviderRemoved", ctx);

            default:  return formatter<string>::format("Unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
