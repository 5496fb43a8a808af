#pragma once

#include "core/chunk.hpp"
#include "core/common.hpp"
#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

namespace TaoMap::Core::Wire {

/// Map / reduce transfer of one chunk
struct ChunkMessage {
    RoundId round_id = 0;
    MinerId sender = 0;
    Chunk chunk;
    // Peer 对整个 payload 的承诺；reduce 合并后的 chunk 没有承诺
    std::optional<Hash> commitment;
    std::vector<Hash> proof;

    bool operator==(const ChunkMessage&) const = default;
};

enum class AckStatus : std::uint8_t {
    Accepted = 0,
    Rejected = 1,
    Corrupt = 2,
};

struct AckMessage {
    RoundId round_id = 0;
    std::uint32_t index = 0;
    AckStatus status = AckStatus::Accepted;

    bool operator==(const AckMessage&) const = default;
};

/// Validator benchmark request. The nonce is revealed only when the probe starts.
struct ProbeRequest {
    RoundId round_id = 0;
    std::uint64_t declared_size = 0;
    Hash nonce {};

    bool operator==(const ProbeRequest&) const = default;
};

struct ProbeResponse {
    RoundId round_id = 0;
    Hash fingerprint {};
    std::vector<Byte> payload;

    bool operator==(const ProbeResponse&) const = default;
};

enum class MessageType : std::uint8_t {
    Chunk = 1,
    Ack = 2,
    ProbeRequest = 3,
    ProbeResponse = 4,
};

using Message = std::variant<ChunkMessage, AckMessage, ProbeRequest, ProbeResponse>;

} // namespace TaoMap::Core::Wire
