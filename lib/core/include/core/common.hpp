#pragma once

#include "crypto/common.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace TaoMap::Core {

using Crypto::Byte;
using Crypto::BytesSpan;
using Crypto::Hash;

/// Miner identifier (uid in the metagraph)
using MinerId = int;

// Peer 在 ChunkMessage.sender 和 TransferRecord.peer 里使用的 id
inline constexpr MinerId PEER_ID = -1;

/// One map, reduce or probe round
using RoundId = std::uint64_t;

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Millis = std::chrono::milliseconds;

/// Network address of a Peer, Miner or endpoint
struct Endpoint {
    std::string host;
    std::uint16_t port = 0;

    bool operator==(const Endpoint&) const = default;
};

enum class RoundStatus : std::uint8_t {
    Healthy,
    Degraded, ///< some indices failed; the rest are usable
};

/// What the round planner knows about a Miner
struct MinerCapability {
    MinerId id;
    Endpoint endpoint;
    double bandwidth_hint = 1.0; ///< relative upload capacity, > 0
    bool redundancy_eligible = true; ///< may hold replica copies
};

} // namespace TaoMap::Core
