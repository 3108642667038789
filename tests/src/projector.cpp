#include "unit-tests.hpp"
#include "abi_encoding.hpp"

#include "call_data.hpp"
#include "challenge.hpp"
#include "crypto.hpp"
#include "memory_store.hpp"

using namespace pdp;
using namespace pdp::tests;
using projector::EventKind;
using projector::ProjectionStatus;

namespace
{
    constexpr std::uint64_t SET_ID = 1;
    constexpr std::uint64_t RAIL_ID = 10;

    chain::Address contractAddress()
    {
        return *chain::parseAddress(config::DEFAULT_CONTRACT_ADDRESS);
    }

    chain::EventLog makeLog(EventKind kind, std::vector<evmc::bytes32> indexed, evmc::bytes data, std::uint64_t block, std::uint64_t log_index)
    {
        chain::EventLog log;
        log.address = contractAddress();
        log.topics.push_back(projector::eventTopic(kind));
        log.topics.insert(log.topics.end(), indexed.begin(), indexed.end());
        log.data = std::move(data);
        log.transaction_hash = uint64Topic(block * 1000 + log_index);
        log.block_number = block;
        log.block_timestamp = 1'700'000'000 + block;
        log.log_index = log_index;
        return log;
    }

    evmc::bytes encodeAddServiceProvider(const chain::Address & provider, const std::string & pdp_url, const std::string & retrieval_url)
    {
        const evmc::bytes pdp_tail = encodeStringTail(pdp_url);
        return concat({
            selectorBytes(abi::ADD_SERVICE_PROVIDER_SELECTOR),
            encodeAddressWord(provider),
            encodeUint256Word(3 * 32),
            encodeUint256Word(3 * 32 + pdp_tail.size()),
            pdp_tail,
            encodeStringTail(retrieval_url)
        });
    }

    chain::EventLog providerLog(EventKind kind, const chain::Address & provider, std::uint64_t provider_id, std::uint64_t block)
    {
        return makeLog(kind, {addressTopic(provider)}, encodeUint256Word(provider_id), block, 0);
    }

    chain::EventLog dataSetRailCreatedLog(const chain::Address & payer, const chain::Address & payee, std::uint64_t block)
    {
        const evmc::bytes metadata_tail = encodeStringTail("dataset-label");
        const evmc::bytes extra = concat({
            encodeUint256Word(4 * 32),
            encodeAddressWord(payer),
            encodeBoolWord(true),
            encodeUint256Word(4 * 32 + metadata_tail.size()),
            metadata_tail,
            encodeBytesTail(toBytes("create-signature"))
        });

        const evmc::bytes data = concat({
            encodeAddressWord(payee),
            encodeUint256Word(2 * 32),
            encodeBytesTail(extra)
        });
        return makeLog(EventKind::DATA_SET_RAIL_CREATED, {uint64Topic(SET_ID), uint64Topic(RAIL_ID), addressTopic(payer)}, data, block, 0);
    }

    chain::EventLog piecesAddedLog(std::uint64_t first_piece_id, const std::vector<std::uint64_t> & leaf_counts, std::uint64_t block)
    {
        const evmc::bytes signature_tail = encodeBytesTail(toBytes("piece-signature"));
        const evmc::bytes extra = concat({
            encodeUint256Word(2 * 32),
            encodeUint256Word(2 * 32 + signature_tail.size()),
            signature_tail,
            encodeStringTail("piece-metadata")
        });

        const evmc::bytes counts_tail = encodeUint256ArrayTail(leaf_counts);
        const evmc::bytes data = concat({
            encodeUint256Word(first_piece_id),
            encodeUint256Word(3 * 32),
            encodeUint256Word(3 * 32 + counts_tail.size()),
            counts_tail,
            encodeBytesTail(extra)
        });
        return makeLog(EventKind::PIECES_ADDED, {uint64Topic(SET_ID)}, data, block, 0);
    }

    chain::EventLog piecesRemovedLog(const std::vector<std::uint64_t> & piece_ids, std::uint64_t block)
    {
        const evmc::bytes data = concat({encodeUint256Word(32), encodeUint256ArrayTail(piece_ids)});
        return makeLog(EventKind::PIECES_REMOVED, {uint64Topic(SET_ID)}, data, block, 0);
    }

    chain::EventLog possessionProvenLog(const evmc::bytes & seed, std::uint64_t block)
    {
        const evmc::bytes data = concat({encodeUint256Word(32), encodeBytesTail(seed)});
        return makeLog(EventKind::POSSESSION_PROVEN, {uint64Topic(SET_ID)}, data, block, 0);
    }

    // fails the next save of one record, then behaves like a MemoryStore
    class FlakyStore final : public store::IEntityStore
    {
    public:
        void failNextSave(std::string type_name, std::string key)
        {
            _fail_type = std::move(type_name);
            _fail_key = std::move(key);
        }

        bool load(const std::string & key, google::protobuf::Message & out) const override
        {
            return _records.load(key, out);
        }

        bool save(const std::string & key, const google::protobuf::Message & record) override
        {
            if(!_fail_key.empty() && key == _fail_key && store::recordTypeName(record) == _fail_type)
            {
                _fail_key.clear();
                return false;
            }
            return _records.save(key, record);
        }

    private:
        store::MemoryStore _records;
        std::string _fail_type;
        std::string _fail_key;
    };

    class ProjectorTest : public UnitTest
    {
    protected:
        store::MemoryStore memory;
        sumtree::SumTree tree{memory};
        projector::EventProjector event_projector{memory, tree, projector::ProjectorConfig{
            .contract_address = contractAddress(),
            .challenges_per_proof = 5
        }};

        chain::Address payer = makeAddressFromSuffix("payer");
        chain::Address provider = makeAddressFromSuffix("provider");

        void createDataSetWithPieces()
        {
            ASSERT_EQ(event_projector.project(dataSetRailCreatedLog(payer, provider, 100)), ProjectionStatus::APPLIED);
            ASSERT_EQ(event_projector.project(piecesAddedLog(0, {50, 30}, 101)), ProjectionStatus::APPLIED);
        }
    };
}

TEST_F(UnitTest, Events_TopicsRoundTrip)
{
    for(const auto & signature : projector::EVENT_SIGNATURES)
    {
        const auto topic = crypto::constructEventTopic(signature.signature);
        EXPECT_EQ(projector::eventTopic(signature.kind), topic);
        EXPECT_EQ(projector::classifyTopic(topic), signature.kind);
    }

    EXPECT_EQ(projector::classifyTopic(evmc::bytes32{}), EventKind::UNKNOWN);
    EXPECT_EQ(std::format("{}", EventKind::PIECES_ADDED), "PiecesAdded");
}

TEST_F(ProjectorTest, Projector_DataSetRailCreated_CreatesDataSetRailAndProvider)
{
    ASSERT_EQ(event_projector.project(dataSetRailCreatedLog(payer, provider, 100)), ProjectionStatus::APPLIED);

    const auto data_set = store::load<DataSet>(memory, "1");
    ASSERT_TRUE(data_set.has_value());
    EXPECT_EQ(data_set->rail_id(), RAIL_ID);
    EXPECT_EQ(data_set->payer(), chain::toHexString(payer));
    EXPECT_EQ(data_set->service_provider(), chain::toHexString(provider));
    EXPECT_EQ(data_set->metadata(), "dataset-label");
    EXPECT_TRUE(data_set->with_cdn());
    EXPECT_EQ(data_set->signature(), "create-signature");
    EXPECT_TRUE(data_set->is_active());
    EXPECT_EQ(data_set->created_at(), 1'700'000'100u);

    const auto rail = store::load<Rail>(memory, "10");
    ASSERT_TRUE(rail.has_value());
    EXPECT_EQ(rail->set_id(), SET_ID);
    EXPECT_EQ(rail->rate(), "0");

    const auto stored_provider = store::load<Provider>(memory, chain::toHexString(provider));
    ASSERT_TRUE(stored_provider.has_value());
    EXPECT_EQ(stored_provider->total_data_sets(), 1u);
}

TEST_F(ProjectorTest, Projector_PiecesAdded_UpdatesTreeAndTotals)
{
    createDataSetWithPieces();

    EXPECT_EQ(tree.leafWeight(SET_ID, 0), 50u);
    EXPECT_EQ(tree.leafWeight(SET_ID, 1), 30u);

    const auto data_set = store::load<DataSet>(memory, "1");
    ASSERT_TRUE(data_set.has_value());
    EXPECT_EQ(data_set->total_pieces(), 2u);
    EXPECT_EQ(data_set->next_piece_id(), 2u);
    EXPECT_EQ(data_set->total_leaves(), 80u);

    const auto piece = store::load<Piece>(memory, "1-1");
    ASSERT_TRUE(piece.has_value());
    EXPECT_EQ(piece->leaf_count(), 30u);
    EXPECT_EQ(piece->metadata(), "piece-metadata");
    EXPECT_EQ(piece->signature(), "piece-signature");
    EXPECT_FALSE(piece->removed());
}

TEST_F(ProjectorTest, Projector_PiecesRemoved_DecrementsAtBlockEpoch)
{
    createDataSetWithPieces();
    ASSERT_EQ(event_projector.project(piecesRemovedLog({0}, 150)), ProjectionStatus::APPLIED);

    EXPECT_EQ(tree.leafWeight(SET_ID, 0), 0u);
    EXPECT_EQ(tree.leafWeight(SET_ID, 1), 30u);
    EXPECT_EQ(tree.node(SET_ID, 0)->last_decay_epoch(), 150u);
    EXPECT_EQ(tree.node(SET_ID, 0)->last_leaf_weight(), 50u);

    const auto data_set = store::load<DataSet>(memory, "1");
    EXPECT_EQ(data_set->total_pieces(), 1u);
    EXPECT_EQ(data_set->total_leaves(), 30u);
    EXPECT_TRUE(store::load<Piece>(memory, "1-0")->removed());

    // every selection now lands on the remaining piece
    const auto selection = tree.select(SET_ID, 0, data_set->next_piece_id());
    ASSERT_TRUE(selection.has_value());
    EXPECT_EQ(selection->leaf, 1u);
}

TEST_F(ProjectorTest, Projector_PossessionProven_DerivesChallenges)
{
    createDataSetWithPieces();

    const evmc::bytes seed = encodeUint256Word(0xBEEF);
    const auto log = possessionProvenLog(seed, 200);
    ASSERT_EQ(event_projector.project(log), ProjectionStatus::APPLIED);

    const auto proof = store::load<Proof>(memory, projector::logKey(log));
    ASSERT_TRUE(proof.has_value());
    ASSERT_EQ(proof->challenges_size(), 5);

    std::uint64_t challenges_on_first = 0;
    for(int i = 0; i < proof->challenges_size(); ++i)
    {
        const auto & challenge = proof->challenges(i);
        const auto expected_leaf = challenge::generateChallengeIndex(seed, SET_ID, static_cast<std::uint64_t>(i), 80);
        ASSERT_TRUE(expected_leaf.has_value());
        EXPECT_EQ(challenge.proof_index(), static_cast<std::uint64_t>(i));
        EXPECT_EQ(challenge.leaf_index(), *expected_leaf);

        if(*expected_leaf < 50)
        {
            EXPECT_EQ(challenge.piece_id(), 0u);
            EXPECT_EQ(challenge.offset(), *expected_leaf);
            ++challenges_on_first;
        }
        else
        {
            EXPECT_EQ(challenge.piece_id(), 1u);
            EXPECT_EQ(challenge.offset(), *expected_leaf - 50);
        }
    }

    EXPECT_EQ(store::load<Piece>(memory, "1-0")->total_challenges(), challenges_on_first);
    EXPECT_EQ(store::load<Piece>(memory, "1-1")->total_challenges(), 5 - challenges_on_first);
    EXPECT_EQ(store::load<DataSet>(memory, "1")->last_proven_epoch(), 200u);
}

TEST_F(ProjectorTest, Projector_PossessionProven_EmptyDataSetHasNoChallenges)
{
    ASSERT_EQ(event_projector.project(dataSetRailCreatedLog(payer, provider, 100)), ProjectionStatus::APPLIED);

    const auto log = possessionProvenLog(encodeUint256Word(1), 101);
    ASSERT_EQ(event_projector.project(log), ProjectionStatus::APPLIED);
    EXPECT_EQ(store::load<Proof>(memory, projector::logKey(log))->challenges_size(), 0);
}

TEST_F(ProjectorTest, Projector_NextProvingPeriodAndFaults)
{
    createDataSetWithPieces();

    const auto period = makeLog(EventKind::NEXT_PROVING_PERIOD, {uint64Topic(SET_ID)},
        concat({encodeUint256Word(2880), encodeUint256Word(80)}), 102, 0);
    ASSERT_EQ(event_projector.project(period), ProjectionStatus::APPLIED);

    const auto fault = makeLog(EventKind::FAULT_RECORD, {uint64Topic(SET_ID)},
        concat({encodeUint256Word(3), encodeUint256Word(5760)}), 103, 4);
    ASSERT_EQ(event_projector.project(fault), ProjectionStatus::APPLIED);

    const auto data_set = store::load<DataSet>(memory, "1");
    EXPECT_EQ(data_set->challenge_epoch(), 2880u);
    EXPECT_EQ(data_set->challenge_range(), 80u);
    EXPECT_EQ(data_set->total_faulted_periods(), 3u);

    const auto record = store::load<FaultRecord>(memory, projector::logKey(fault));
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->periods_faulted(), 3u);
    EXPECT_EQ(record->deadline(), 5760u);
    EXPECT_EQ(record->service_provider(), chain::toHexString(provider));

    EXPECT_EQ(store::load<Provider>(memory, chain::toHexString(provider))->total_faulted_periods(), 3u);
}

TEST_F(ProjectorTest, Projector_RailRateUpdated)
{
    ASSERT_EQ(event_projector.project(dataSetRailCreatedLog(payer, provider, 100)), ProjectionStatus::APPLIED);

    evmc::bytes big_rate = encodeUint256Word(0);
    big_rate[23] = 1; // 2^64
    ASSERT_EQ(event_projector.project(makeLog(EventKind::RAIL_RATE_UPDATED, {uint64Topic(RAIL_ID)}, big_rate, 110, 0)), ProjectionStatus::APPLIED);

    EXPECT_EQ(store::load<Rail>(memory, "10")->rate(), "18446744073709551616");
    const auto change = store::load<RateChangeQueue>(memory, "10-110");
    ASSERT_TRUE(change.has_value());
    EXPECT_EQ(change->rate(), "18446744073709551616");

    EXPECT_EQ(event_projector.project(makeLog(EventKind::RAIL_RATE_UPDATED, {uint64Topic(99)}, encodeUint256Word(5), 111, 0)),
        ProjectionStatus::SKIPPED);
    EXPECT_FALSE(store::load<Rail>(memory, "99").has_value());
}

TEST_F(ProjectorTest, Projector_ProviderLifecycle)
{
    auto registered = providerLog(EventKind::PROVIDER_REGISTERED, provider, 7, 50);
    const evmc::bytes call = encodeAddServiceProvider(provider, "https://pdp.provider", "https://retrieval.provider");
    const evmc::bytes data_tail = encodeBytesTail(call);
    registered.transaction_input = concat({
        selectorBytes(abi::EXEC_TRANSACTION_SELECTOR),
        encodeAddressWord(makeAddressFromSuffix("registry")),
        encodeUint256Word(0),
        encodeUint256Word(10 * 32),
        encodeUint256Word(0), encodeUint256Word(0), encodeUint256Word(0), encodeUint256Word(0),
        encodeAddressWord(chain::Address{}),
        encodeAddressWord(chain::Address{}),
        encodeUint256Word(10 * 32 + data_tail.size()),
        data_tail,
        encodeBytesTail(evmc::bytes{})
    });
    ASSERT_EQ(event_projector.project(registered), ProjectionStatus::APPLIED);

    auto stored = store::load<Provider>(memory, chain::toHexString(provider));
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(stored->registered());
    EXPECT_FALSE(stored->approved());
    EXPECT_EQ(stored->provider_id(), 7u);
    EXPECT_EQ(stored->pdp_url(), "https://pdp.provider");
    EXPECT_EQ(stored->piece_retrieval_url(), "https://retrieval.provider");

    ASSERT_EQ(event_projector.project(providerLog(EventKind::PROVIDER_APPROVED, provider, 7, 51)), ProjectionStatus::APPLIED);
    stored = store::load<Provider>(memory, chain::toHexString(provider));
    EXPECT_TRUE(stored->approved());
    // approval without a call in the transaction keeps the known URLs
    EXPECT_EQ(stored->pdp_url(), "https://pdp.provider");

    ASSERT_EQ(event_projector.project(providerLog(EventKind::PROVIDER_REJECTED, provider, 7, 52)), ProjectionStatus::APPLIED);
    EXPECT_FALSE(store::load<Provider>(memory, chain::toHexString(provider))->approved());

    ASSERT_EQ(event_projector.project(providerLog(EventKind::PROVIDER_REMOVED, provider, 7, 53)), ProjectionStatus::APPLIED);
    stored = store::load<Provider>(memory, chain::toHexString(provider));
    EXPECT_FALSE(stored->registered());
    EXPECT_FALSE(stored->approved());
}

TEST_F(ProjectorTest, Projector_ProviderEventsForUnknownProviders)
{
    const chain::Address stranger = makeAddressFromSuffix("stranger");

    EXPECT_EQ(event_projector.project(providerLog(EventKind::PROVIDER_REJECTED, stranger, 1, 10)), ProjectionStatus::SKIPPED);
    EXPECT_EQ(event_projector.project(providerLog(EventKind::PROVIDER_REMOVED, stranger, 1, 11)), ProjectionStatus::SKIPPED);
    EXPECT_FALSE(store::load<Provider>(memory, chain::toHexString(stranger)).has_value());

    // approval creates the provider
    ASSERT_EQ(event_projector.project(providerLog(EventKind::PROVIDER_APPROVED, stranger, 1, 12)), ProjectionStatus::APPLIED);
    const auto created = store::load<Provider>(memory, chain::toHexString(stranger));
    ASSERT_TRUE(created.has_value());
    EXPECT_TRUE(created->approved());
    EXPECT_FALSE(created->registered());
}

TEST_F(ProjectorTest, Projector_IgnoresForeignAndUnknownLogs)
{
    auto foreign = dataSetRailCreatedLog(payer, provider, 100);
    foreign.address = makeAddressFromSuffix("elsewhere");
    EXPECT_EQ(event_projector.project(foreign), ProjectionStatus::IGNORED);

    auto unknown = makeLog(EventKind::UNKNOWN, {}, evmc::bytes{}, 100, 1);
    unknown.topics.front() = crypto::constructEventTopic("Transfer(address,address,uint256)");
    EXPECT_EQ(event_projector.project(unknown), ProjectionStatus::IGNORED);

    chain::EventLog no_topics;
    no_topics.address = contractAddress();
    EXPECT_EQ(event_projector.project(no_topics), ProjectionStatus::IGNORED);

    EXPECT_FALSE(store::load<DataSet>(memory, "1").has_value());
    EXPECT_FALSE(event_projector.lastPosition().has_value());
}

TEST_F(ProjectorTest, Projector_MalformedEventsDoNotAbort)
{
    // indexed set id missing
    EXPECT_EQ(event_projector.project(makeLog(EventKind::PIECES_ADDED, {}, evmc::bytes{}, 90, 0)), ProjectionStatus::MALFORMED);

    // leaf count array offset past the payload
    const evmc::bytes bad_data = concat({encodeUint256Word(0), encodeUint256Word(4096), encodeUint256Word(0)});
    EXPECT_EQ(event_projector.project(makeLog(EventKind::PIECES_ADDED, {uint64Topic(SET_ID)}, bad_data, 91, 0)), ProjectionStatus::MALFORMED);
    EXPECT_EQ(tree.prefixSum(SET_ID, 16), 0u);

    createDataSetWithPieces();
    EXPECT_EQ(store::load<DataSet>(memory, "1")->total_leaves(), 80u);
}

TEST_F(ProjectorTest, Projector_ReplayIsNotAppliedTwice)
{
    std::vector<chain::EventLog> batch{
        piecesAddedLog(0, {50, 30}, 101),
        dataSetRailCreatedLog(payer, provider, 100),
        piecesAddedLog(2, {20}, 102)
    };

    const auto first = event_projector.projectAll(batch);
    EXPECT_EQ(first.applied, 3u);
    EXPECT_EQ(tree.prefixSum(SET_ID, 3), 100u);

    const auto second = event_projector.projectAll(batch);
    EXPECT_EQ(second.applied, 0u);
    EXPECT_EQ(second.stale, 3u);
    EXPECT_EQ(tree.prefixSum(SET_ID, 3), 100u);

    // the cursor survives a restart
    projector::EventProjector restarted(memory, tree, event_projector.config());
    ASSERT_TRUE(restarted.lastPosition().has_value());
    EXPECT_EQ(restarted.lastPosition()->block_number, 102u);
    EXPECT_EQ(restarted.project(piecesAddedLog(5, {1}, 102)), ProjectionStatus::STALE);
    EXPECT_EQ(restarted.project(piecesAddedLog(5, {1}, 103)), ProjectionStatus::APPLIED);
    EXPECT_EQ(store::load<Cursor>(memory, projector::CURSOR_ID)->applied_events(), 4u);
}

TEST_F(UnitTest, Projector_ReplaysJsonLogsIntoFileStore)
{
    const auto storage_path = makeStoragePath("Projector_ReplaysJsonLogsIntoFileStore");
    const chain::Address payer = makeAddressFromSuffix("payer");
    const chain::Address provider = makeAddressFromSuffix("provider");

    json logs = json::array();
    for(const chain::EventLog & log : {dataSetRailCreatedLog(payer, provider, 100), piecesAddedLog(0, {8, 8}, 101)})
    {
        json topics = json::array();
        for(const auto & topic : log.topics)
        {
            topics.push_back(hexPrefixed(topic));
        }

        logs.push_back(json{
            {"address", chain::toHexString(log.address)},
            {"topics", topics},
            {"data", hexPrefixed(log.data)},
            {"blockNumber", utils::toHexQuantity(log.block_number)},
            {"transactionHash", hexPrefixed(log.transaction_hash)},
            {"logIndex", "0x0"}
        });
    }

    {
        store::JsonFileStore json_store(storage_path);
        sumtree::SumTree tree(json_store, 8);
        projector::EventProjector event_projector(json_store, tree, projector::ProjectorConfig{});

        const auto summary = event_projector.projectAll(chain::parseLogs(logs));
        EXPECT_EQ(summary.applied, 2u);
    }

    EXPECT_TRUE(std::filesystem::exists(storage_path / "DataSet" / "1.json"));
    EXPECT_TRUE(std::filesystem::exists(storage_path / "Piece" / "1-1.json"));
    EXPECT_TRUE(std::filesystem::exists(storage_path / "SumTreeCount" / "1-0.json"));
    EXPECT_TRUE(std::filesystem::exists(storage_path / "Cursor" / "projector.json"));

    store::JsonFileStore reopened(storage_path);
    sumtree::SumTree tree(reopened, 8);
    EXPECT_EQ(tree.prefixSum(SET_ID, 2), 16u);
    const auto selection = tree.select(SET_ID, 9, 2);
    ASSERT_TRUE(selection.has_value());
    EXPECT_EQ(selection->leaf, 1u);
    EXPECT_EQ(selection->offset, 1u);
}

TEST_F(UnitTest, Projector_RetriedPiecesAddedCountsWeightsOnce)
{
    FlakyStore flaky;
    sumtree::SumTree tree(flaky, 4);
    projector::EventProjector event_projector(flaky, tree, projector::ProjectorConfig{});

    const chain::Address payer = makeAddressFromSuffix("payer");
    const chain::Address provider = makeAddressFromSuffix("provider");
    ASSERT_EQ(event_projector.project(dataSetRailCreatedLog(payer, provider, 100)), ProjectionStatus::APPLIED);

    const auto added = piecesAddedLog(0, {10, 20, 30}, 101);
    flaky.failNextSave("Piece", "1-1");
    EXPECT_EQ(event_projector.project(added), ProjectionStatus::FAILED);
    EXPECT_EQ(event_projector.lastPosition()->block_number, 100u);

    EXPECT_EQ(event_projector.project(added), ProjectionStatus::APPLIED);

    EXPECT_EQ(tree.leafWeight(SET_ID, 0), 10u);
    EXPECT_EQ(tree.leafWeight(SET_ID, 1), 20u);
    EXPECT_EQ(tree.leafWeight(SET_ID, 2), 30u);
    EXPECT_EQ(tree.prefixSum(SET_ID, 16), 60u);

    const auto data_set = store::load<DataSet>(flaky, "1");
    ASSERT_TRUE(data_set.has_value());
    EXPECT_EQ(data_set->total_pieces(), 3u);
    EXPECT_EQ(data_set->total_leaves(), 60u);
    EXPECT_TRUE(store::load<Piece>(flaky, "1-1").has_value());
}

TEST_F(UnitTest, Projector_RetriedPossessionProvenCountsChallengesOnce)
{
    FlakyStore flaky;
    sumtree::SumTree tree(flaky, 4);
    projector::EventProjector event_projector(flaky, tree, projector::ProjectorConfig{});

    const chain::Address payer = makeAddressFromSuffix("payer");
    const chain::Address provider = makeAddressFromSuffix("provider");
    ASSERT_EQ(event_projector.project(dataSetRailCreatedLog(payer, provider, 100)), ProjectionStatus::APPLIED);
    ASSERT_EQ(event_projector.project(piecesAddedLog(0, {50, 30}, 101)), ProjectionStatus::APPLIED);

    // piece counters are saved, the data set is not
    const auto proven = possessionProvenLog(encodeUint256Word(0xBEEF), 200);
    flaky.failNextSave("DataSet", "1");
    EXPECT_EQ(event_projector.project(proven), ProjectionStatus::FAILED);
    EXPECT_EQ(event_projector.project(proven), ProjectionStatus::APPLIED);

    const auto proof = store::load<Proof>(flaky, projector::logKey(proven));
    ASSERT_TRUE(proof.has_value());
    ASSERT_EQ(proof->challenges_size(), 5);

    std::uint64_t expected_challenges[2] = {0, 0};
    for(const auto & challenge : proof->challenges())
    {
        ++expected_challenges[challenge.piece_id()];
    }

    for(std::uint64_t piece_id = 0; piece_id < 2; ++piece_id)
    {
        const auto piece = store::load<Piece>(flaky, projector::pieceKey(SET_ID, piece_id));
        ASSERT_TRUE(piece.has_value());
        EXPECT_EQ(piece->total_challenges(), expected_challenges[piece_id]) << "piece " << piece_id;
        EXPECT_EQ(piece->total_proofs(), expected_challenges[piece_id] > 0 ? 1u : 0u) << "piece " << piece_id;
    }

    const auto data_set = store::load<DataSet>(flaky, "1");
    EXPECT_EQ(data_set->total_proofs(), 1u);
    EXPECT_EQ(data_set->last_proven_epoch(), 200u);
}
