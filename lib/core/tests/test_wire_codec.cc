#include "core/error.hpp"
#include "core/wire/codec.hpp"
#include "mock_network.hpp"

#include <gtest/gtest.h>
#include <variant>
#include <vector>

namespace TaoMap::Core::Wire {

namespace {

    constexpr size_t MAX_BODY = 1 << 20;

    ChunkMessage sample_chunk_message()
    {
        auto chunks = *ChunkCodec::split(Testing::make_payload(300), 3);
        auto commitment = ChunkCodec::commit(chunks);
        return ChunkMessage {
            .round_id = 77,
            .sender = -1,
            .chunk = chunks[1],
            .commitment = commitment.root,
            .proof = commitment.tree.prove(1)->siblings,
        };
    }

} // namespace

TEST(WireCodecTest, ChunkMessageSurvivesEncoding)
{
    const auto msg = sample_chunk_message();
    auto frame = encode(msg);
    auto decoded = decode(frame, MAX_BODY);
    ASSERT_TRUE(decoded.has_value());
    ASSERT_TRUE(std::holds_alternative<ChunkMessage>(*decoded));
    EXPECT_EQ(std::get<ChunkMessage>(*decoded), msg);
}

TEST(WireCodecTest, MergedChunkWithoutCommitment)
{
    ChunkMessage msg {
        .round_id = 5,
        .sender = 12,
        .chunk = ChunkCodec::make_chunk(0, 1, { 1, 2, 3, 4 }),
        .commitment = std::nullopt,
        .proof = {},
    };
    auto decoded = decode(encode(msg), MAX_BODY);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(std::get<ChunkMessage>(*decoded), msg);
}

TEST(WireCodecTest, HeaderCarriesBodyLengthAndType)
{
    AckMessage ack { .round_id = 1, .index = 2, .status = AckStatus::Corrupt };
    auto frame = encode(ack);
    ASSERT_EQ(frame.size(), FRAME_HEADER_SIZE + 8 + 4 + 1);
    auto header = parse_header(frame, MAX_BODY);
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->type, MessageType::Ack);
    EXPECT_EQ(header->body_length, 13U);
    EXPECT_EQ(std::get<AckMessage>(*decode(frame, MAX_BODY)), ack);
}

TEST(WireCodecTest, ProbeMessages)
{
    ProbeRequest req { .round_id = 9, .declared_size = 64, .nonce = Crypto::Utils::sha256(Testing::make_payload(8)) };
    EXPECT_EQ(std::get<ProbeRequest>(*decode(encode(req), MAX_BODY)), req);

    auto response = Validator::Probe::respond(req);
    EXPECT_EQ(std::get<ProbeResponse>(*decode(encode(response), MAX_BODY)), response);
}

TEST(WireCodecTest, TruncatedFrameIsMalformed)
{
    auto frame = encode(sample_chunk_message());
    for (size_t cut : { 0UL, 3UL, FRAME_HEADER_SIZE, frame.size() / 2, frame.size() - 1 }) {
        std::vector<Byte> truncated(frame.begin(), frame.begin() + static_cast<std::ptrdiff_t>(cut));
        auto decoded = decode(truncated, MAX_BODY);
        ASSERT_FALSE(decoded.has_value()) << "cut=" << cut;
        EXPECT_EQ(decoded.error(), Error::Malformed);
    }
}

TEST(WireCodecTest, BodyShorterThanFieldsIsMalformed)
{
    // header 与实际长度一致，但 body 里的 data 长度字段越界
    auto frame = encode(sample_chunk_message());
    frame.resize(frame.size() - 10);
    Crypto::Utils::write_u32_le(frame.data(), static_cast<std::uint32_t>(frame.size() - FRAME_HEADER_SIZE));
    auto decoded = decode(frame, MAX_BODY);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), Error::Malformed);
}

TEST(WireCodecTest, TrailingBytesAreMalformed)
{
    auto frame = encode(AckMessage { .round_id = 1, .index = 0, .status = AckStatus::Accepted });
    frame.push_back(0);
    Crypto::Utils::write_u32_le(frame.data(), static_cast<std::uint32_t>(frame.size() - FRAME_HEADER_SIZE));
    auto decoded = decode(frame, MAX_BODY);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), Error::Malformed);
}

TEST(WireCodecTest, OversizedFrameRejectedFromHeader)
{
    auto frame = encode(sample_chunk_message());
    auto header = parse_header(frame, 16);
    ASSERT_FALSE(header.has_value());
    EXPECT_EQ(header.error(), Error::FrameTooLarge);
}

TEST(WireCodecTest, UnknownTypeAndBadStatusAreMalformed)
{
    auto frame = encode(AckMessage { .round_id = 1, .index = 0, .status = AckStatus::Accepted });
    auto bad_type = frame;
    bad_type[4] = 0x7F;
    EXPECT_EQ(decode(bad_type, MAX_BODY).error(), Error::Malformed);

    auto bad_status = frame;
    bad_status.back() = 9;
    EXPECT_EQ(decode(bad_status, MAX_BODY).error(), Error::Malformed);
}

TEST(WireCodecTest, IndexOutsideTotalIsMalformed)
{
    auto msg = sample_chunk_message();
    msg.chunk.index = 3;
    msg.chunk.total = 3;
    auto decoded = decode(encode(msg), MAX_BODY);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), Error::Malformed);
}

TEST(WireCodecTest, ImpossibleProofCountIsMalformed)
{
    auto frame = encode(sample_chunk_message());
    // proof count 位于 round(8) sender(4) index(4) total(4) fp(32) flag(1) commitment(32) 之后
    const size_t at = FRAME_HEADER_SIZE + 8 + 4 + 4 + 4 + 32 + 1 + 32;
    Crypto::Utils::write_u32_le(frame.data() + at, 0x10000000);
    auto decoded = decode(frame, MAX_BODY);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error(), Error::Malformed);
}

} // namespace TaoMap::Core::Wire
