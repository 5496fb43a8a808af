#include "core/chunk.hpp"
#include "core/error.hpp"
#include "mock_network.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <random>
#include <ranges>
#include <vector>

namespace TaoMap::Core {

using Testing::make_payload;

TEST(ChunkCodecTest, RoundTripAcrossSizesAndCounts)
{
    for (size_t len : { 0UL, 1UL, 7UL, 64UL, 1000UL, 4099UL }) {
        const auto payload = make_payload(len);
        for (std::uint32_t total : { 1U, 2U, 3U, 4U, 16U, 33U }) {
            auto chunks = ChunkCodec::split(payload, total);
            ASSERT_TRUE(chunks.has_value());
            ASSERT_EQ(chunks->size(), total);
            auto joined = ChunkCodec::join(*chunks);
            ASSERT_TRUE(joined.has_value()) << "len=" << len << " total=" << total;
            EXPECT_EQ(*joined, payload);
        }
    }
}

TEST(ChunkCodecTest, ChunkSizesDifferByAtMostOne)
{
    const auto payload = make_payload(1003);
    auto chunks = ChunkCodec::split(payload, 10);
    ASSERT_TRUE(chunks.has_value());

    auto [lo, hi] = std::ranges::minmax(*chunks | std::views::transform([](const Chunk& c) { return c.data.size(); }));
    EXPECT_LE(hi - lo, 1U);
    EXPECT_EQ(lo, 100U);
    EXPECT_EQ(hi, 101U);
    // 前 rem 个多一个字节
    EXPECT_EQ((*chunks)[2].data.size(), 101U);
    EXPECT_EQ((*chunks)[3].data.size(), 100U);
}

TEST(ChunkCodecTest, BoundsAreContiguous)
{
    size_t expected_offset = 0;
    for (std::uint32_t i = 0; i < 7; ++i) {
        auto b = ChunkCodec::bounds(100, 7, i);
        EXPECT_EQ(b.offset, expected_offset);
        expected_offset += b.length;
    }
    EXPECT_EQ(expected_offset, 100U);
}

TEST(ChunkCodecTest, SplitIntoZeroChunksIsInvalid)
{
    const auto payload = make_payload(10);
    auto chunks = ChunkCodec::split(payload, 0);
    ASSERT_FALSE(chunks.has_value());
    EXPECT_EQ(chunks.error(), Error::InvalidArgument);
}

TEST(ChunkCodecTest, JoinAcceptsAnyOrder)
{
    const auto payload = make_payload(777, 9);
    auto chunks = *ChunkCodec::split(payload, 9);
    std::mt19937 rng(42);
    for (int round = 0; round < 5; ++round) {
        std::ranges::shuffle(chunks, rng);
        auto joined = ChunkCodec::join(chunks);
        ASSERT_TRUE(joined.has_value());
        EXPECT_EQ(*joined, payload);
    }
}

TEST(ChunkCodecTest, MissingIndexIsIncomplete)
{
    auto chunks = *ChunkCodec::split(make_payload(100), 4);
    chunks.erase(chunks.begin() + 3);
    auto joined = ChunkCodec::join(chunks);
    ASSERT_FALSE(joined.has_value());
    EXPECT_EQ(joined.error(), Error::IncompleteInput);
}

TEST(ChunkCodecTest, DuplicateIndexIsIncomplete)
{
    auto chunks = *ChunkCodec::split(make_payload(100), 4);
    chunks[3] = chunks[2];
    auto joined = ChunkCodec::join(chunks);
    ASSERT_FALSE(joined.has_value());
    EXPECT_EQ(joined.error(), Error::IncompleteInput);
}

TEST(ChunkCodecTest, DisagreeingTotalIsIncomplete)
{
    auto chunks = *ChunkCodec::split(make_payload(100), 4);
    chunks[1] = ChunkCodec::make_chunk(1, 5, chunks[1].data);
    auto joined = ChunkCodec::join(chunks);
    ASSERT_FALSE(joined.has_value());
    EXPECT_EQ(joined.error(), Error::IncompleteInput);
}

TEST(ChunkCodecTest, EmptyInputIsIncomplete)
{
    auto joined = ChunkCodec::join({});
    ASSERT_FALSE(joined.has_value());
    EXPECT_EQ(joined.error(), Error::IncompleteInput);
}

TEST(ChunkCodecTest, FlippedByteIsCorrupt)
{
    auto chunks = *ChunkCodec::split(make_payload(100), 4);
    chunks[2].data[5] ^= 0x01;
    EXPECT_FALSE(ChunkCodec::verify(chunks[2]));
    auto joined = ChunkCodec::join(chunks);
    ASSERT_FALSE(joined.has_value());
    EXPECT_EQ(joined.error(), Error::CorruptChunk);
}

TEST(ChunkCodecTest, ChunkReplayedAtOtherIndexFailsVerification)
{
    auto chunks = *ChunkCodec::split(make_payload(100), 4);
    Chunk moved = chunks[1];
    moved.index = 0;
    EXPECT_FALSE(ChunkCodec::verify(moved));
}

TEST(ChunkCodecTest, WrongBoundariesAreMalformed)
{
    auto chunks = *ChunkCodec::split(make_payload(100), 4);
    // 合法 fingerprint，但长度和 split 的边界不一致
    auto grown = chunks[3].data;
    grown.push_back(0);
    grown.push_back(0);
    chunks[3] = ChunkCodec::make_chunk(3, 4, grown);
    auto joined = ChunkCodec::join(chunks);
    ASSERT_FALSE(joined.has_value());
    EXPECT_EQ(joined.error(), Error::Malformed);
}

TEST(ChunkCodecTest, CommitmentProvesEveryChunk)
{
    auto chunks = *ChunkCodec::split(make_payload(500), 5);
    auto commitment = ChunkCodec::commit(chunks);
    for (const auto& c : chunks) {
        auto proof = commitment.tree.prove(c.index);
        ASSERT_TRUE(proof.has_value());
        EXPECT_TRUE(ChunkCodec::verify_membership(c, commitment.root, *proof));
    }

    auto proof = *commitment.tree.prove(0);
    EXPECT_FALSE(ChunkCodec::verify_membership(chunks[1], commitment.root, proof));

    auto other = ChunkCodec::commit(*ChunkCodec::split(make_payload(500, 2), 5));
    EXPECT_FALSE(ChunkCodec::verify_membership(chunks[0], other.root, proof));
}

} // namespace TaoMap::Core
