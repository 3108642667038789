#include "projector.hpp"

#include <algorithm>
#include <array>
#include <iterator>

#include <spdlog/spdlog.h>

#include "call_data.hpp"
#include "challenge.hpp"
#include "decode_abi.hpp"

namespace pdp::projector
{
    namespace
    {
        std::optional<std::uint64_t> _topicUint64(const chain::EventLog & log, std::size_t index)
        {
            if(index >= log.topics.size()) return std::nullopt;
            return utils::toUint64(log.topics[index]);
        }

        std::optional<chain::Address> _topicAddress(const chain::EventLog & log, std::size_t index)
        {
            if(index >= log.topics.size()) return std::nullopt;
            return chain::topicWordToAddress(log.topics[index]);
        }

        std::optional<evmc::bytes_view> _dynamicBytesAt(evmc::bytes_view data, std::size_t head_offset)
        {
            const auto tail_offset = utils::readWordAsSizeT(data, head_offset);
            if(!tail_offset) return std::nullopt;
            return abi::readDynamicBytes(data, *tail_offset);
        }

        std::string _toString(evmc::bytes_view content)
        {
            return std::string(reinterpret_cast<const char*>(content.data()), content.size());
        }

        std::uint64_t _saturatingSub(std::uint64_t value, std::uint64_t amount)
        {
            return value >= amount ? value - amount : 0;
        }

        void _touch(DataSet & data_set, const chain::EventLog & log)
        {
            data_set.set_updated_at(log.block_timestamp);
            data_set.set_block_number(log.block_number);
        }

        void _touch(Provider & provider, const chain::EventLog & log)
        {
            provider.set_updated_at(log.block_timestamp);
            provider.set_block_number(log.block_number);
        }

        DataSet _loadDataSet(const store::IEntityStore & entity_store, std::uint64_t set_id, const chain::EventLog & log)
        {
            auto data_set = store::load<DataSet>(entity_store, dataSetKey(set_id));
            if(data_set) return std::move(*data_set);

            DataSet created = store::create<DataSet>(dataSetKey(set_id));
            created.set_set_id(set_id);
            created.set_created_at(log.block_timestamp);
            return created;
        }

        Provider _loadProvider(const store::IEntityStore & entity_store, const chain::Address & address)
        {
            const std::string key = chain::toHexString(address);
            Provider provider = store::loadOrCreate<Provider>(entity_store, key);
            provider.set_address(key);
            return provider;
        }

        // URLs of the addServiceProvider call carried by the transaction, when it names `provider`
        void _applyServiceUrls(Provider & provider, const chain::Address & address, const chain::EventLog & log)
        {
            const auto call = abi::findAddServiceProviderCall(log.transaction_input);
            if(!call)
            {
                spdlog::debug("No addServiceProvider call in transaction {}", logKey(log));
                return;
            }

            const auto params = abi::decodeAddServiceProviderFunction(*call);
            if(params.provider != address)
            {
                spdlog::warn("addServiceProvider call in {} is for {}, not {}",
                    logKey(log), chain::toHexString(params.provider), chain::toHexString(address));
                return;
            }

            provider.set_pdp_url(params.pdp_url);
            provider.set_piece_retrieval_url(params.piece_retrieval_url);
        }
    }

    void ProjectionSummary::add(ProjectionStatus status)
    {
        switch(status)
        {
            case ProjectionStatus::APPLIED: ++applied; break;
            case ProjectionStatus::SKIPPED: ++skipped; break;
            case ProjectionStatus::IGNORED: ++ignored; break;
            case ProjectionStatus::STALE: ++stale; break;
            case ProjectionStatus::MALFORMED: ++malformed; break;
            case ProjectionStatus::FAILED: ++failed; break;
        }
    }

    std::string dataSetKey(std::uint64_t set_id)
    {
        return std::format("{}", set_id);
    }

    std::string railKey(std::uint64_t rail_id)
    {
        return std::format("{}", rail_id);
    }

    std::string pieceKey(std::uint64_t set_id, std::uint64_t piece_id)
    {
        return std::format("{}-{}", set_id, piece_id);
    }

    std::string logKey(const chain::EventLog & log)
    {
        return std::format("0x{}-{}", evmc::hex(evmc::bytes_view{log.transaction_hash.bytes, sizeof(log.transaction_hash.bytes)}), log.log_index);
    }

    EventProjector::EventProjector(store::IEntityStore & entity_store, sumtree::SumTree & sum_tree, ProjectorConfig cfg)
    : _store(entity_store),
      _sum_tree(sum_tree),
      _cfg(std::move(cfg))
    {
        if(auto cursor = store::load<Cursor>(_store, CURSOR_ID))
        {
            _cursor = std::move(*cursor);
            _has_cursor = true;
            spdlog::info("Resuming after block {} transaction {} log {}",
                _cursor.block_number(), _cursor.transaction_index(), _cursor.log_index());
        }
        else
        {
            _cursor = store::create<Cursor>(CURSOR_ID);
        }
    }

    const ProjectorConfig & EventProjector::config() const noexcept
    {
        return _cfg;
    }

    std::optional<chain::LogPosition> EventProjector::lastPosition() const
    {
        if(!_has_cursor) return std::nullopt;
        return chain::LogPosition{
            .block_number = _cursor.block_number(),
            .transaction_index = _cursor.transaction_index(),
            .log_index = _cursor.log_index()
        };
    }

    ProjectionStatus EventProjector::project(const chain::EventLog & log)
    {
        if(log.topics.empty())
        {
            spdlog::warn("Log {} has no topics", logKey(log));
            return ProjectionStatus::IGNORED;
        }

        if(_cfg.contract_address && log.address != *_cfg.contract_address)
        {
            return ProjectionStatus::IGNORED;
        }

        const EventKind kind = classifyTopic(log.topics.front());
        if(kind == EventKind::UNKNOWN)
        {
            return ProjectionStatus::IGNORED;
        }

        if(const auto last = lastPosition(); last && log.position() <= *last)
        {
            spdlog::debug(std::format("{} at block {} log {} was already applied", kind, log.block_number, log.log_index));
            return ProjectionStatus::STALE;
        }

        if(log.topics.size() < 1 + signatureOf(kind).indexed_count)
        {
            spdlog::warn(std::format("{} in {} is missing indexed topics", kind, logKey(log)));
            if(!_advanceCursor(log)) return ProjectionStatus::FAILED;
            return ProjectionStatus::MALFORMED;
        }

        const ProjectionStatus status = _dispatch(kind, log);
        spdlog::debug(std::format("{} at block {} log {}: {}", kind, log.block_number, log.log_index, status));

        if(status == ProjectionStatus::FAILED)
        {
            spdlog::error(std::format("Failed to project {} in {}", kind, logKey(log)));
            return status;
        }

        if(!_advanceCursor(log)) return ProjectionStatus::FAILED;
        return status;
    }

    ProjectionSummary EventProjector::projectAll(std::vector<chain::EventLog> logs)
    {
        chain::sortLogs(logs);

        ProjectionSummary summary;
        for(const chain::EventLog & log : logs)
        {
            summary.add(project(log));
        }

        spdlog::info("Projected {} logs: {} applied, {} skipped, {} ignored, {} stale, {} malformed, {} failed",
            logs.size(), summary.applied, summary.skipped, summary.ignored, summary.stale, summary.malformed, summary.failed);
        return summary;
    }

    ProjectionStatus EventProjector::_dispatch(EventKind kind, const chain::EventLog & log)
    {
        switch(kind)
        {
            case EventKind::DATA_SET_RAIL_CREATED:  return _onDataSetRailCreated(log);
            case EventKind::PIECES_ADDED:           return _onPiecesAdded(log);
            case EventKind::PIECES_REMOVED:         return _onPiecesRemoved(log);
            case EventKind::NEXT_PROVING_PERIOD:    return _onNextProvingPeriod(log);
            case EventKind::POSSESSION_PROVEN:      return _onPossessionProven(log);
            case EventKind::FAULT_RECORD:           return _onFaultRecord(log);
            case EventKind::RAIL_RATE_UPDATED:      return _onRailRateUpdated(log);
            case EventKind::PROVIDER_REGISTERED:    return _onProviderRegistered(log);
            case EventKind::PROVIDER_APPROVED:      return _onProviderApproved(log);
            case EventKind::PROVIDER_REJECTED:      return _onProviderRejected(log);
            case EventKind::PROVIDER_REMOVED:       return _onProviderRemoved(log);

            default: break;
        }
        return ProjectionStatus::IGNORED;
    }

    bool EventProjector::_advanceCursor(const chain::EventLog & log)
    {
        _cursor.set_block_number(log.block_number);
        _cursor.set_transaction_index(log.transaction_index);
        _cursor.set_log_index(log.log_index);
        _cursor.set_applied_events(_cursor.applied_events() + 1);

        if(!store::save(_store, _cursor))
        {
            spdlog::error("Failed to persist projector cursor");
            return false;
        }
        _has_cursor = true;
        return true;
    }

    // DataSetRailCreated(uint256 indexed dataSetId, uint256 indexed railId, address indexed payer, address payee, bytes extraData)
    ProjectionStatus EventProjector::_onDataSetRailCreated(const chain::EventLog & log)
    {
        const auto set_id = _topicUint64(log, 1);
        const auto rail_id = _topicUint64(log, 2);
        const auto payer = _topicAddress(log, 3);
        if(!set_id || !rail_id || !payer)
        {
            spdlog::warn("DataSetRailCreated {} has ids wider than 64 bits", logKey(log));
            return ProjectionStatus::MALFORMED;
        }

        static constexpr std::array<abi::AbiType, 2> LAYOUT{abi::AbiType::ADDRESS, abi::AbiType::BYTES};
        const auto fields = abi::decodeTuple(log.data, LAYOUT);
        const chain::Address payee = fields[0].asAddress();
        const auto extra = abi::decodeStringAddressBoolBytes(fields[1].asBytes());

        DataSet data_set = _loadDataSet(_store, *set_id, log);
        data_set.set_rail_id(*rail_id);
        data_set.set_payer(chain::toHexString(*payer));
        data_set.set_payee(chain::toHexString(payee));
        data_set.set_service_provider(chain::toHexString(payee));
        data_set.set_metadata(extra.string_value);
        data_set.set_with_cdn(extra.bool_value);
        data_set.set_signature(_toString(extra.bytes_value));
        data_set.set_is_active(true);
        _touch(data_set, log);

        Rail rail = store::loadOrCreate<Rail>(_store, railKey(*rail_id));
        if(rail.rate().empty())
        {
            rail.set_rate("0");
            rail.set_created_at(log.block_timestamp);
        }
        rail.set_rail_id(*rail_id);
        rail.set_set_id(*set_id);
        rail.set_payer(chain::toHexString(*payer));
        rail.set_payee(chain::toHexString(payee));
        rail.set_updated_at(log.block_timestamp);

        Provider provider = _loadProvider(_store, payee);
        provider.set_total_data_sets(provider.total_data_sets() + 1);
        _touch(provider, log);

        if(!store::save(_store, data_set) || !store::save(_store, rail) || !store::save(_store, provider))
        {
            return ProjectionStatus::FAILED;
        }

        spdlog::info("Data set {} created on rail {} for provider {}", *set_id, *rail_id, provider.id());
        return ProjectionStatus::APPLIED;
    }

    // PiecesAdded(uint256 indexed setId, uint256 firstPieceId, uint256[] leafCounts, bytes extraData)
    ProjectionStatus EventProjector::_onPiecesAdded(const chain::EventLog & log)
    {
        const auto set_id = _topicUint64(log, 1);
        const auto first_piece_id = utils::readUint64Word(log.data, 0);
        const auto leaf_counts_offset = utils::readWordAsSizeT(log.data, utils::WORD_SIZE);
        if(!set_id || !first_piece_id || !leaf_counts_offset)
        {
            spdlog::warn("PiecesAdded {} has a malformed head", logKey(log));
            return ProjectionStatus::MALFORMED;
        }

        const auto leaf_counts = abi::decodeUint64Array(log.data, *leaf_counts_offset);
        if(!leaf_counts)
        {
            spdlog::warn("PiecesAdded {} has a malformed leaf count array", logKey(log));
            return ProjectionStatus::MALFORMED;
        }

        const auto extra_data = _dynamicBytesAt(log.data, 2 * utils::WORD_SIZE);
        const auto extra = abi::decodeBytesString(extra_data.value_or(evmc::bytes_view{}));

        DataSet data_set = _loadDataSet(_store, *set_id, log);

        std::uint64_t added_leaves = 0;
        for(std::size_t i = 0; i < leaf_counts->size(); ++i)
        {
            const std::uint64_t piece_id = *first_piece_id + i;
            const std::uint64_t leaf_count = (*leaf_counts)[i];

            // weight left by an earlier attempt that failed before the data set was saved
            const std::uint64_t stored_weight = _sum_tree.leafWeight(*set_id, piece_id);
            if(stored_weight == 0)
            {
                if(!_sum_tree.inc(*set_id, piece_id, leaf_count))
                {
                    return ProjectionStatus::FAILED;
                }
            }
            else if(stored_weight != leaf_count)
            {
                spdlog::warn("Data set {}: piece {} already weighs {}, expected {}", *set_id, piece_id, stored_weight, leaf_count);
            }

            Piece piece = store::create<Piece>(pieceKey(*set_id, piece_id));
            piece.set_set_id(*set_id);
            piece.set_piece_id(piece_id);
            piece.set_leaf_count(leaf_count);
            piece.set_metadata(extra.string_value);
            piece.set_signature(_toString(extra.bytes_value));
            piece.set_created_at(log.block_timestamp);
            piece.set_updated_at(log.block_timestamp);
            piece.set_block_number(log.block_number);

            if(!store::save(_store, piece))
            {
                return ProjectionStatus::FAILED;
            }
            added_leaves += leaf_count;
        }

        data_set.set_total_pieces(data_set.total_pieces() + leaf_counts->size());
        data_set.set_next_piece_id(std::max<std::uint64_t>(data_set.next_piece_id(), *first_piece_id + leaf_counts->size()));
        data_set.set_total_leaves(data_set.total_leaves() + added_leaves);
        _touch(data_set, log);

        if(!store::save(_store, data_set))
        {
            return ProjectionStatus::FAILED;
        }

        spdlog::info("Data set {}: {} pieces added from {} ({} leaves)", *set_id, leaf_counts->size(), *first_piece_id, added_leaves);
        return ProjectionStatus::APPLIED;
    }

    // PiecesRemoved(uint256 indexed setId, uint256[] pieceIds)
    ProjectionStatus EventProjector::_onPiecesRemoved(const chain::EventLog & log)
    {
        const auto set_id = _topicUint64(log, 1);
        const auto piece_ids_offset = utils::readWordAsSizeT(log.data, 0);
        if(!set_id || !piece_ids_offset)
        {
            spdlog::warn("PiecesRemoved {} has a malformed head", logKey(log));
            return ProjectionStatus::MALFORMED;
        }

        const auto piece_ids = abi::decodeUint64Array(log.data, *piece_ids_offset);
        if(!piece_ids)
        {
            spdlog::warn("PiecesRemoved {} has a malformed piece id array", logKey(log));
            return ProjectionStatus::MALFORMED;
        }

        DataSet data_set = _loadDataSet(_store, *set_id, log);

        for(const std::uint64_t piece_id : *piece_ids)
        {
            const std::uint64_t weight = _sum_tree.leafWeight(*set_id, piece_id);

            // epochs are block numbers
            if(!_sum_tree.dec(*set_id, piece_id, weight, log.block_number))
            {
                return ProjectionStatus::FAILED;
            }

            auto piece = store::load<Piece>(_store, pieceKey(*set_id, piece_id));
            if(!piece)
            {
                spdlog::warn("Data set {}: removed piece {} is unknown", *set_id, piece_id);
                continue;
            }

            if(!piece->removed())
            {
                data_set.set_total_pieces(_saturatingSub(data_set.total_pieces(), 1));
                data_set.set_total_leaves(_saturatingSub(data_set.total_leaves(), piece->leaf_count()));
            }

            piece->set_removed(true);
            piece->set_updated_at(log.block_timestamp);
            if(!store::save(_store, *piece))
            {
                return ProjectionStatus::FAILED;
            }
        }

        _touch(data_set, log);
        if(!store::save(_store, data_set))
        {
            return ProjectionStatus::FAILED;
        }

        spdlog::info("Data set {}: {} pieces removed", *set_id, piece_ids->size());
        return ProjectionStatus::APPLIED;
    }

    // NextProvingPeriod(uint256 indexed setId, uint256 challengeEpoch, uint256 leafCount)
    ProjectionStatus EventProjector::_onNextProvingPeriod(const chain::EventLog & log)
    {
        const auto set_id = _topicUint64(log, 1);
        const auto challenge_epoch = utils::readUint64Word(log.data, 0);
        const auto leaf_count = utils::readUint64Word(log.data, utils::WORD_SIZE);
        if(!set_id || !challenge_epoch || !leaf_count)
        {
            spdlog::warn("NextProvingPeriod {} is malformed", logKey(log));
            return ProjectionStatus::MALFORMED;
        }

        DataSet data_set = _loadDataSet(_store, *set_id, log);
        data_set.set_challenge_epoch(*challenge_epoch);
        data_set.set_challenge_range(*leaf_count);
        _touch(data_set, log);

        if(!store::save(_store, data_set))
        {
            return ProjectionStatus::FAILED;
        }
        return ProjectionStatus::APPLIED;
    }

    // PossessionProven(uint256 indexed setId, bytes seed)
    ProjectionStatus EventProjector::_onPossessionProven(const chain::EventLog & log)
    {
        const auto set_id = _topicUint64(log, 1);
        const auto seed = _dynamicBytesAt(log.data, 0);
        if(!set_id || !seed)
        {
            spdlog::warn("PossessionProven {} is malformed", logKey(log));
            return ProjectionStatus::MALFORMED;
        }

        DataSet data_set = _loadDataSet(_store, *set_id, log);

        const std::uint64_t leaf_count = data_set.next_piece_id();
        const std::uint64_t total_leaves = _sum_tree.prefixSum(*set_id, leaf_count);

        Proof proof = store::create<Proof>(logKey(log));
        proof.set_set_id(*set_id);
        proof.set_seed(_toString(*seed));
        proof.set_block_number(log.block_number);
        proof.set_created_at(log.block_timestamp);

        // piece counters are written before the proof and the data set, a retried proof
        // recognises the pieces it already counted by their last_proof_id
        std::vector<Piece> challenged_pieces;
        for(std::uint32_t proof_index = 0; proof_index < _cfg.challenges_per_proof; ++proof_index)
        {
            const auto leaf_index = challenge::generateChallengeIndex(*seed, *set_id, proof_index, total_leaves);
            if(!leaf_index)
            {
                spdlog::warn("Data set {} has no leaves to challenge", *set_id);
                break;
            }

            const auto selection = _sum_tree.select(*set_id, *leaf_index, leaf_count);
            if(!selection)
            {
                spdlog::error("Data set {}: challenge {} selects no piece", *set_id, *leaf_index);
                continue;
            }

            Challenge * challenge = proof.add_challenges();
            challenge->set_proof_index(proof_index);
            challenge->set_leaf_index(*leaf_index);
            challenge->set_piece_id(selection->leaf);
            challenge->set_offset(selection->offset);

            auto piece = std::ranges::find_if(challenged_pieces, [&](const Piece & p){ return p.piece_id() == selection->leaf; });
            if(piece == challenged_pieces.end())
            {
                auto stored = store::load<Piece>(_store, pieceKey(*set_id, selection->leaf));
                if(!stored)
                {
                    spdlog::warn("Data set {}: challenged piece {} is unknown", *set_id, selection->leaf);
                    continue;
                }
                if(stored->last_proof_id() == proof.id())
                {
                    spdlog::debug("Data set {}: piece {} already counted for {}", *set_id, selection->leaf, proof.id());
                    continue;
                }

                stored->set_total_proofs(stored->total_proofs() + 1);
                stored->set_last_proven_epoch(log.block_number);
                stored->set_last_proof_id(proof.id());
                stored->set_updated_at(log.block_timestamp);
                challenged_pieces.push_back(std::move(*stored));
                piece = std::prev(challenged_pieces.end());
            }

            piece->set_total_challenges(piece->total_challenges() + 1);
        }

        for(const Piece & piece : challenged_pieces)
        {
            if(!store::save(_store, piece))
            {
                return ProjectionStatus::FAILED;
            }
        }

        data_set.set_total_proofs(data_set.total_proofs() + 1);
        data_set.set_last_proven_epoch(log.block_number);
        _touch(data_set, log);

        if(!store::save(_store, proof) || !store::save(_store, data_set))
        {
            return ProjectionStatus::FAILED;
        }

        spdlog::info("Data set {}: possession proven with {} challenges", *set_id, proof.challenges_size());
        return ProjectionStatus::APPLIED;
    }

    // FaultRecord(uint256 indexed dataSetId, uint256 periodsFaulted, uint256 deadline)
    ProjectionStatus EventProjector::_onFaultRecord(const chain::EventLog & log)
    {
        const auto set_id = _topicUint64(log, 1);
        const auto periods_faulted = utils::readUint64Word(log.data, 0);
        const auto deadline = utils::readUint64Word(log.data, utils::WORD_SIZE);
        if(!set_id || !periods_faulted || !deadline)
        {
            spdlog::warn("FaultRecord {} is malformed", logKey(log));
            return ProjectionStatus::MALFORMED;
        }

        DataSet data_set = _loadDataSet(_store, *set_id, log);
        data_set.set_total_faulted_periods(data_set.total_faulted_periods() + *periods_faulted);
        _touch(data_set, log);

        FaultRecord fault = store::create<FaultRecord>(logKey(log));
        fault.set_set_id(*set_id);
        fault.set_service_provider(data_set.service_provider());
        fault.set_periods_faulted(*periods_faulted);
        fault.set_deadline(*deadline);
        fault.set_block_number(log.block_number);
        fault.set_created_at(log.block_timestamp);

        if(!store::save(_store, fault) || !store::save(_store, data_set))
        {
            return ProjectionStatus::FAILED;
        }

        if(data_set.service_provider().empty())
        {
            spdlog::warn("Data set {} faulted without a known provider", *set_id);
            return ProjectionStatus::APPLIED;
        }

        const auto provider_address = chain::parseAddress(data_set.service_provider());
        if(!provider_address)
        {
            spdlog::warn("Data set {} has an invalid provider '{}'", *set_id, data_set.service_provider());
            return ProjectionStatus::APPLIED;
        }

        Provider provider = _loadProvider(_store, *provider_address);
        provider.set_total_faulted_periods(provider.total_faulted_periods() + *periods_faulted);
        _touch(provider, log);

        if(!store::save(_store, provider))
        {
            return ProjectionStatus::FAILED;
        }

        spdlog::info("Data set {} faulted {} periods", *set_id, *periods_faulted);
        return ProjectionStatus::APPLIED;
    }

    // RailRateUpdated(uint256 indexed railId, uint256 newRate)
    ProjectionStatus EventProjector::_onRailRateUpdated(const chain::EventLog & log)
    {
        const auto rail_id = _topicUint64(log, 1);
        if(!rail_id || log.data.size() < utils::WORD_SIZE)
        {
            spdlog::warn("RailRateUpdated {} is malformed", logKey(log));
            return ProjectionStatus::MALFORMED;
        }

        auto rail = store::load<Rail>(_store, railKey(*rail_id));
        if(!rail)
        {
            spdlog::debug("Rail {} is not tracked", *rail_id);
            return ProjectionStatus::SKIPPED;
        }

        const std::string rate = utils::toDecimalString(utils::toUint256(log.data, 0));
        rail->set_rate(rate);
        rail->set_updated_at(log.block_timestamp);

        RateChangeQueue change = store::create<RateChangeQueue>(std::format("{}-{}", *rail_id, log.block_number));
        change.set_rail_id(*rail_id);
        change.set_rate(rate);
        change.set_block_number(log.block_number);
        change.set_created_at(log.block_timestamp);

        if(!store::save(_store, *rail) || !store::save(_store, change))
        {
            return ProjectionStatus::FAILED;
        }

        spdlog::info("Rail {} rate set to {}", *rail_id, rate);
        return ProjectionStatus::APPLIED;
    }

    // ProviderRegistered(address indexed provider, uint256 providerId)
    ProjectionStatus EventProjector::_onProviderRegistered(const chain::EventLog & log)
    {
        const auto address = _topicAddress(log, 1);
        const auto provider_id = utils::readUint64Word(log.data, 0);
        if(!address || !provider_id)
        {
            spdlog::warn("ProviderRegistered {} is malformed", logKey(log));
            return ProjectionStatus::MALFORMED;
        }

        Provider provider = _loadProvider(_store, *address);
        provider.set_provider_id(*provider_id);
        provider.set_registered(true);
        if(provider.registered_at() == 0)
        {
            provider.set_registered_at(log.block_timestamp);
        }
        _applyServiceUrls(provider, *address, log);
        _touch(provider, log);

        if(!store::save(_store, provider))
        {
            return ProjectionStatus::FAILED;
        }

        spdlog::info("Provider {} registered as {}", provider.id(), *provider_id);
        return ProjectionStatus::APPLIED;
    }

    // ProviderApproved(address indexed provider, uint256 providerId)
    ProjectionStatus EventProjector::_onProviderApproved(const chain::EventLog & log)
    {
        const auto address = _topicAddress(log, 1);
        const auto provider_id = utils::readUint64Word(log.data, 0);
        if(!address || !provider_id)
        {
            spdlog::warn("ProviderApproved {} is malformed", logKey(log));
            return ProjectionStatus::MALFORMED;
        }

        Provider provider = _loadProvider(_store, *address);
        provider.set_provider_id(*provider_id);
        provider.set_approved(true);
        provider.set_approved_at(log.block_timestamp);
        _applyServiceUrls(provider, *address, log);
        _touch(provider, log);

        if(!store::save(_store, provider))
        {
            return ProjectionStatus::FAILED;
        }

        spdlog::info("Provider {} approved", provider.id());
        return ProjectionStatus::APPLIED;
    }

    // ProviderRejected(address indexed provider, uint256 providerId)
    ProjectionStatus EventProjector::_onProviderRejected(const chain::EventLog & log)
    {
        const auto address = _topicAddress(log, 1);
        if(!address)
        {
            return ProjectionStatus::MALFORMED;
        }

        auto provider = store::load<Provider>(_store, chain::toHexString(*address));
        if(!provider)
        {
            spdlog::debug("Rejected provider {} is not tracked", chain::toHexString(*address));
            return ProjectionStatus::SKIPPED;
        }

        provider->set_approved(false);
        _touch(*provider, log);

        if(!store::save(_store, *provider))
        {
            return ProjectionStatus::FAILED;
        }

        spdlog::info("Provider {} rejected", provider->id());
        return ProjectionStatus::APPLIED;
    }

    // ProviderRemoved(address indexed provider, uint256 providerId)
    ProjectionStatus EventProjector::_onProviderRemoved(const chain::EventLog & log)
    {
        const auto address = _topicAddress(log, 1);
        if(!address)
        {
            return ProjectionStatus::MALFORMED;
        }

        auto provider = store::load<Provider>(_store, chain::toHexString(*address));
        if(!provider)
        {
            spdlog::debug("Removed provider {} is not tracked", chain::toHexString(*address));
            return ProjectionStatus::SKIPPED;
        }

        provider->set_registered(false);
        provider->set_approved(false);
        _touch(*provider, log);

        if(!store::save(_store, *provider))
        {
            return ProjectionStatus::FAILED;
        }

        spdlog::info("Provider {} removed", provider->id());
        return ProjectionStatus::APPLIED;
    }
}
