#include "core/error.hpp"
#include "core/reduce/reduce_aggregator.hpp"
#include "async_test_utils.hpp"
#include "mock_network.hpp"

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>
#include <vector>

namespace TaoMap::Core::Reduce {

using namespace std::chrono_literals;
using Testing::MockInbox;
using Testing::MockNetwork;
using Testing::run_to_completion;

namespace {

    Wire::ChunkMessage contribution(RoundId round, MinerId sender, std::uint32_t index, std::uint32_t total,
        const std::vector<float>& values)
    {
        return Wire::ChunkMessage {
            .round_id = round,
            .sender = sender,
            .chunk = ChunkCodec::make_chunk(index, total, F32::pack(values)),
            .commitment = std::nullopt,
            .proof = {},
        };
    }

    const Endpoint PEER { .host = "10.0.0.100", .port = 9000 };

} // namespace

TEST(ReductionTest, SumAndAverageAreElementWise)
{
    std::vector<Chunk> inputs {
        ChunkCodec::make_chunk(0, 1, F32::pack(std::vector<float> { 1.0f, 2.0f, 3.0f })),
        ChunkCodec::make_chunk(0, 1, F32::pack(std::vector<float> { 0.5f, 0.5f, -3.0f })),
        ChunkCodec::make_chunk(0, 1, F32::pack(std::vector<float> { 1.5f, 0.5f, 6.0f })),
    };

    auto sum = merge(Reductions::sum_f32(), inputs);
    ASSERT_TRUE(sum.has_value());
    EXPECT_EQ(F32::unpack(sum->data), (std::vector<float> { 3.0f, 3.0f, 6.0f }));
    EXPECT_TRUE(ChunkCodec::verify(*sum));

    auto avg = merge(Reductions::average_f32(), inputs);
    ASSERT_TRUE(avg.has_value());
    EXPECT_EQ(F32::unpack(avg->data), (std::vector<float> { 1.0f, 1.0f, 2.0f }));
}

TEST(ReductionTest, MismatchedInputsAreMalformed)
{
    std::vector<Chunk> lengths {
        ChunkCodec::make_chunk(0, 1, F32::pack(std::vector<float> { 1.0f, 2.0f })),
        ChunkCodec::make_chunk(0, 1, F32::pack(std::vector<float> { 1.0f })),
    };
    EXPECT_EQ(merge(Reductions::sum_f32(), lengths).error(), Error::Malformed);

    std::vector<Chunk> ragged { ChunkCodec::make_chunk(0, 1, { 1, 2, 3 }) };
    EXPECT_EQ(merge(Reductions::sum_f32(), ragged).error(), Error::Malformed);

    std::vector<Chunk> indices {
        ChunkCodec::make_chunk(0, 2, F32::pack(std::vector<float> { 1.0f })),
        ChunkCodec::make_chunk(1, 2, F32::pack(std::vector<float> { 1.0f })),
    };
    EXPECT_EQ(merge(Reductions::sum_f32(), indices).error(), Error::Malformed);

    EXPECT_EQ(merge(Reductions::sum_f32(), {}).error(), Error::IncompleteInput);
}

TEST(ContributionSetTest, DeduplicatesBySenderAndIgnoresStrangers)
{
    const std::vector<std::uint32_t> indices { 1 };
    const std::vector<MinerId> senders { 10, 11 };
    ContributionSet set(7, indices, 4, 2, senders);

    EXPECT_EQ(set.observe(contribution(7, 11, 1, 4, { 1.0f })), Observation::Accepted);
    EXPECT_EQ(set.observe(contribution(7, 11, 1, 4, { 9.0f })), Observation::Duplicate);
    EXPECT_EQ(set.observe(contribution(8, 10, 1, 4, { 1.0f })), Observation::Ignored);
    EXPECT_EQ(set.observe(contribution(7, 10, 2, 4, { 1.0f })), Observation::Ignored);
    EXPECT_EQ(set.observe(contribution(7, 99, 1, 4, { 1.0f })), Observation::Ignored);
    EXPECT_FALSE(set.complete(1));
    EXPECT_EQ(set.missing(1), (std::vector<MinerId> { 10 }));

    EXPECT_EQ(set.observe(contribution(7, 10, 1, 4, { 2.0f })), Observation::Accepted);
    EXPECT_TRUE(set.all_complete());
    EXPECT_EQ(set.contributors(1), (std::vector<MinerId> { 10, 11 }));
    // 重复的那一份没有覆盖第一份
    EXPECT_EQ(F32::unpack(set.contributions(1)[1].data), (std::vector<float> { 1.0f }));
}

TEST(ReassemblyBufferTest, FirstChunkPerIndexWins)
{
    ReassemblyBuffer buffer(3, 2);
    EXPECT_EQ(buffer.observe(contribution(3, 5, 0, 2, { 1.0f })), Observation::Accepted);
    EXPECT_EQ(buffer.observe(contribution(3, 6, 0, 2, { 2.0f })), Observation::Duplicate);
    EXPECT_EQ(buffer.observe(contribution(4, 6, 1, 2, { 2.0f })), Observation::Ignored);
    EXPECT_EQ(buffer.missing(), (std::vector<std::uint32_t> { 1 }));
    EXPECT_EQ(buffer.winner(0), 5);
    EXPECT_EQ(buffer.duplicates(), 1U);
    EXPECT_FALSE(buffer.complete());
}

class ReduceAggregatorTest : public ::testing::Test {
protected:
    boost::asio::io_context io_;
    MockInbox inbox_;
    MockNetwork network_;
    const std::vector<MinerId> downstream_ { 10, 11, 12 };
    const std::vector<std::uint32_t> indices_ { 1 };
    ReduceConfig config_ { .endpoints = 3, .max_retries = 2, .transfer_timeout = 200ms, .round_deadline = 300ms };
};

TEST_F(ReduceAggregatorTest, MinerForwardsTheMergedChunk)
{
    inbox_.push(contribution(1, 12, 1, 4, { 3.0f, 0.0f }));
    inbox_.push(contribution(1, 10, 1, 4, { 1.0f, 1.0f }));
    inbox_.push(contribution(1, 10, 1, 4, { 100.0f, 100.0f }));
    inbox_.push(contribution(2, 11, 1, 4, { 100.0f, 100.0f }));
    inbox_.push_error(1, Error::CorruptChunk);
    inbox_.push(contribution(1, 11, 1, 4, { 2.0f, 0.5f }));

    ReduceAggregator<MockInbox> aggregator(config_);
    auto result = run_to_completion(io_,
        aggregator.reduce_at_miner(inbox_, network_, PEER, 4, 1, indices_, 4, downstream_));

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, RoundStatus::Healthy);
    EXPECT_EQ(result->integrity_violations, 1U);
    ASSERT_EQ(result->indices.size(), 1U);
    EXPECT_TRUE(result->indices[0].forwarded);
    EXPECT_EQ(result->indices[0].contributors, downstream_);
    EXPECT_TRUE(result->indices[0].missing.empty());

    ASSERT_EQ(network_.delivered[PEER.port].size(), 1U);
    const auto& merged = network_.delivered[PEER.port].front();
    EXPECT_EQ(merged.sender, 4);
    EXPECT_EQ(merged.chunk.index, 1U);
    EXPECT_EQ(F32::unpack(merged.chunk.data), (std::vector<float> { 6.0f, 1.5f }));

    auto receives = std::ranges::count_if(result->records, [](const TransferRecord& r) { return r.direction == Direction::Receive; });
    EXPECT_EQ(receives, 3);

    // round 2 的贡献留给它自己的 consumer
    EXPECT_EQ(inbox_.released, (std::vector<RoundId> { 1 }));
    ASSERT_EQ(inbox_.queue.size(), 1U);
    EXPECT_EQ(inbox_.queue.front().first, 2U);
}

TEST_F(ReduceAggregatorTest, MinerWithholdsIncompleteMerge)
{
    inbox_.push(contribution(1, 10, 1, 4, { 1.0f }));
    inbox_.push(contribution(1, 11, 1, 4, { 1.0f }));

    ReduceAggregator<MockInbox> aggregator(config_);
    const auto start = Clock::now();
    auto result = run_to_completion(io_,
        aggregator.reduce_at_miner(inbox_, network_, PEER, 4, 1, indices_, 4, downstream_));

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, RoundStatus::Degraded);
    EXPECT_FALSE(result->indices[0].forwarded);
    EXPECT_EQ(result->indices[0].missing, (std::vector<MinerId> { 12 }));
    EXPECT_EQ(result->indices[0].error, Error::IncompleteInput);
    EXPECT_TRUE(network_.sends.empty());
    EXPECT_LT(Clock::now() - start, config_.round_deadline + 500ms);
}

TEST_F(ReduceAggregatorTest, CompleteIndexIsForwardedWhileAnotherWaits)
{
    const std::vector<std::uint32_t> indices { 1, 2 };
    for (MinerId s : downstream_) {
        inbox_.push(contribution(1, s, 1, 4, { 1.0f }));
    }
    inbox_.push(contribution(1, 10, 2, 4, { 1.0f }));

    ReduceAggregator<MockInbox> aggregator(config_);
    auto result = run_to_completion(io_,
        aggregator.reduce_at_miner(inbox_, network_, PEER, 4, 1, indices, 4, downstream_));

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, RoundStatus::Degraded);
    ASSERT_EQ(result->indices.size(), 2U);
    EXPECT_TRUE(result->indices[0].forwarded);
    EXPECT_FALSE(result->indices[1].forwarded);
    EXPECT_EQ(result->indices[1].error, Error::IncompleteInput);
    EXPECT_EQ(result->indices[1].missing, (std::vector<MinerId> { 11, 12 }));

    ASSERT_EQ(network_.delivered[PEER.port].size(), 1U);
    EXPECT_EQ(network_.delivered[PEER.port].front().chunk.index, 1U);
}

TEST_F(ReduceAggregatorTest, MinerRetriesUpstreamOnce)
{
    network_.miners[PEER.port].fail_first = 1;
    for (MinerId s : downstream_) {
        inbox_.push(contribution(1, s, 1, 4, { 1.0f }));
    }

    ReduceAggregator<MockInbox> aggregator(config_);
    auto result = run_to_completion(io_,
        aggregator.reduce_at_miner(inbox_, network_, PEER, 4, 1, indices_, 4, downstream_));

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->indices[0].forwarded);
    EXPECT_EQ(network_.sends_to(PEER.port), 2U);
    EXPECT_EQ(F32::unpack(network_.delivered[PEER.port].front().chunk.data), (std::vector<float> { 3.0f }));
}

TEST_F(ReduceAggregatorTest, MinerAveragesWhenAsked)
{
    for (MinerId s : downstream_) {
        inbox_.push(contribution(1, s, 1, 4, { static_cast<float>(s) }));
    }
    ReduceAggregator<MockInbox> aggregator(config_, Reductions::average_f32());
    auto result = run_to_completion(io_,
        aggregator.reduce_at_miner(inbox_, network_, PEER, 4, 1, indices_, 4, downstream_));

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(F32::unpack(network_.delivered[PEER.port].front().chunk.data), (std::vector<float> { 11.0f }));
}

TEST_F(ReduceAggregatorTest, PeerRebuildsPayloadWithFirstWins)
{
    const auto payload = F32::pack(std::vector<float> { 1, 2, 3, 4, 5, 6 });
    auto chunks = *ChunkCodec::split(payload, 3);
    auto merged = [&](MinerId from, const Chunk& c) {
        return Wire::ChunkMessage { .round_id = 9, .sender = from, .chunk = c, .commitment = std::nullopt, .proof = {} };
    };

    inbox_.push(merged(2, chunks[2]));
    inbox_.push(merged(0, chunks[0]));
    // 冗余 holder 的另一份结果晚到，被丢弃
    inbox_.push(merged(3, ChunkCodec::make_chunk(0, 3, F32::pack(std::vector<float> { 9, 9 }))));
    inbox_.push(merged(1, chunks[1]));

    ReduceAggregator<MockInbox> aggregator(config_);
    auto result = run_to_completion(io_, aggregator.reduce_at_peer(inbox_, 9, 3));

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, RoundStatus::Healthy);
    ASSERT_TRUE(result->payload.has_value());
    EXPECT_EQ(*result->payload, payload);
    EXPECT_EQ(result->winners.at(0), 0);
    EXPECT_EQ(result->duplicates, 1U);
}

TEST_F(ReduceAggregatorTest, PeerKeepsFirstOfIdenticalCopies)
{
    const auto payload = F32::pack(std::vector<float> { 1, 2 });
    auto chunks = *ChunkCodec::split(payload, 2);
    inbox_.push(Wire::ChunkMessage { .round_id = 9, .sender = 0, .chunk = chunks[0], .commitment = std::nullopt, .proof = {} });
    inbox_.push(Wire::ChunkMessage { .round_id = 9, .sender = 5, .chunk = chunks[0], .commitment = std::nullopt, .proof = {} });
    inbox_.push(Wire::ChunkMessage { .round_id = 9, .sender = 1, .chunk = chunks[1], .commitment = std::nullopt, .proof = {} });

    ReduceAggregator<MockInbox> aggregator(config_);
    auto result = run_to_completion(io_, aggregator.reduce_at_peer(inbox_, 9, 2));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->duplicates, 1U);
    EXPECT_EQ(result->winners.at(0), 0);
    EXPECT_EQ(*result->payload, payload);
}

TEST_F(ReduceAggregatorTest, PeerReportsMissingIndices)
{
    auto chunks = *ChunkCodec::split(F32::pack(std::vector<float> { 1, 2, 3 }), 3);
    inbox_.push(Wire::ChunkMessage { .round_id = 9, .sender = 0, .chunk = chunks[0], .commitment = std::nullopt, .proof = {} });
    inbox_.push(Wire::ChunkMessage { .round_id = 9, .sender = 1, .chunk = chunks[1], .commitment = std::nullopt, .proof = {} });

    ReduceAggregator<MockInbox> aggregator(config_);
    auto result = run_to_completion(io_, aggregator.reduce_at_peer(inbox_, 9, 3));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, RoundStatus::Degraded);
    EXPECT_FALSE(result->payload.has_value());
    EXPECT_EQ(result->missing, (std::vector<std::uint32_t> { 2 }));
    EXPECT_EQ(result->received, (std::vector<std::uint32_t> { 0, 1 }));
}

TEST_F(ReduceAggregatorTest, PeerWithNothingFailsTheRound)
{
    inbox_.push_error(9, Error::CorruptChunk);
    ReduceAggregator<MockInbox> aggregator(config_);
    auto result = run_to_completion(io_, aggregator.reduce_at_peer(inbox_, 9, 3));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Error::RoundFailed);
}

TEST_F(ReduceAggregatorTest, SenderListMustMatchEndpointCount)
{
    const std::vector<MinerId> two { 10, 11 };
    ReduceAggregator<MockInbox> aggregator(config_);
    auto result = run_to_completion(io_,
        aggregator.reduce_at_miner(inbox_, network_, PEER, 4, 1, indices_, 4, two));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Error::InvalidArgument);
}

} // namespace TaoMap::Core::Reduce
