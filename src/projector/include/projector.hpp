#pragma once

#include <cstddef>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <vector>

#include "address.hpp"
#include "events.hpp"
#include "log.hpp"
#include "store.hpp"
#include "sum_tree.hpp"

#include "cursor.pb.h"
#include "dataset.pb.h"
#include "provider.pb.h"
#include "rail.pb.h"

namespace pdp::projector
{
    static constexpr const char * CURSOR_ID = "projector";

    struct ProjectorConfig
    {
        // logs from other contracts are ignored, no filtering when empty
        std::optional<chain::Address> contract_address;
        std::uint32_t challenges_per_proof = 5;
    };

    enum class ProjectionStatus : std::uint8_t
    {
        APPLIED = 0,
        // handled event without effect, e.g. an unknown rail
        SKIPPED,
        // not a handled event or not from the watched contract
        IGNORED,
        // at or before the last applied position
        STALE,
        MALFORMED,
        FAILED
    };

    struct ProjectionSummary
    {
        std::size_t applied = 0;
        std::size_t skipped = 0;
        std::size_t ignored = 0;
        std::size_t stale = 0;
        std::size_t malformed = 0;
        std::size_t failed = 0;

        void add(ProjectionStatus status);
    };

    /**
     * @brief Applies chain events to the entity store, one at a time and in delivery order.
     *
     * The position of the last applied event is persisted as a Cursor record, so a replayed
     * batch never updates the sum trees twice.
     */
    class EventProjector
    {
    public:
        EventProjector(store::IEntityStore & entity_store, sumtree::SumTree & sum_tree, ProjectorConfig cfg);

        const ProjectorConfig & config() const noexcept;

        std::optional<chain::LogPosition> lastPosition() const;

        ProjectionStatus project(const chain::EventLog & log);

        /**
         * @brief Orders `logs` by chain position and projects each of them.
         */
        ProjectionSummary projectAll(std::vector<chain::EventLog> logs);

    private:
        ProjectionStatus _dispatch(EventKind kind, const chain::EventLog & log);

        ProjectionStatus _onDataSetRailCreated(const chain::EventLog & log);
        ProjectionStatus _onPiecesAdded(const chain::EventLog & log);
        ProjectionStatus _onPiecesRemoved(const chain::EventLog & log);
        ProjectionStatus _onNextProvingPeriod(const chain::EventLog & log);
        ProjectionStatus _onPossessionProven(const chain::EventLog & log);
        ProjectionStatus _onFaultRecord(const chain::EventLog & log);
        ProjectionStatus _onRailRateUpdated(const chain::EventLog & log);
        ProjectionStatus _onProviderRegistered(const chain::EventLog & log);
        ProjectionStatus _onProviderApproved(const chain::EventLog & log);
        ProjectionStatus _onProviderRejected(const chain::EventLog & log);
        ProjectionStatus _onProviderRemoved(const chain::EventLog & log);

        bool _advanceCursor(const chain::EventLog & log);

        store::IEntityStore & _store;
        sumtree::SumTree & _sum_tree;
        ProjectorConfig _cfg;
        Cursor _cursor;
        bool _has_cursor = false;
    };

    std::string dataSetKey(std::uint64_t set_id);

    std::string railKey(std::uint64_t rail_id);

    std::string pieceKey(std::uint64_t set_id, std::uint64_t piece_id);

    /**
     * @brief "<transaction hash>-<log index>", used for records created once per log.
     */
    std::string logKey(const chain::EventLog & log);
}

template <>
struct std::formatter<pdp::projector::ProjectionStatus> : std::formatter<std::string> {
    auto format(const pdp::projector::ProjectionStatus & status, format_context& ctx) const {
        switch(status)
        {
            case pdp::projector::ProjectionStatus::APPLIED : return formatter<string>::format("applied", ctx);
            case pdp::projector::ProjectionStatus::SKIPPED : return formatter<string>::format("skipped", ctx);
            case pdp::projector::ProjectionStatus::IGNORED : return formatter<string>::format("ignored", ctx);
            case pdp::projector::ProjectionStatus::STALE : return formatter<string>::format("stale", ctx);
            case pdp::projector::ProjectionStatus::MALFORMED : return formatter<string>::format("malformed", ctx);
            case pdp::projector::ProjectionStatus::FAILED : return formatter<string>::format("failed", ctx);

            default:  return formatter<string>::format("unknown", ctx);
        }
        return formatter<string>::format("", ctx);
    }
};
