#pragma once

#include "core/common.hpp"
#include "core/concepts.hpp"
#include "core/config.hpp"
#include "core/wire/messages.hpp"
#include <concepts>
#include <expected>
#include <system_error>

namespace TaoMap::Core {

// Accepted ack, or TimedOut / Rejected / CorruptChunk / Unreachable / Malformed
using SendResult = std::expected<Wire::AckMessage, std::error_code>;

// Integrity-checked chunk, or TimedOut / CorruptChunk / Malformed
using ReceiveResult = std::expected<Wire::ChunkMessage, std::error_code>;

using ProbeResult = std::expected<Wire::ProbeResponse, std::error_code>;

/**
 * Point-to-point chunk sender. Every call must complete within its timeout;
 * there is no retry inside the transport.
 */
template <typename T>
concept ChunkTransport = requires(T& t, const Endpoint& to, const Wire::ChunkMessage& msg, Millis timeout) {
    { t.async_send(to, msg, timeout) } -> AwaitableOf<SendResult>;
};

/// config() 给出回应帧的上限，declared_size 要先对它校验
template <typename T>
concept ProbeTransport = requires(T& t, const Endpoint& to, const Wire::ProbeRequest& req, Millis timeout) {
    { t.async_probe(to, req, timeout) } -> AwaitableOf<ProbeResult>;
    { t.config() } -> std::convertible_to<const ChannelConfig&>;
};

/**
 * Receive side. Chunks are integrity-checked before they are returned, and
 * only arrivals of the requested round are returned; other rounds stay
 * queued for their own consumer. release_round drops what is left of a
 * round once its consumer is done with it.
 */
template <typename T>
concept ChunkSource = requires(T& t, RoundId round, Millis timeout) {
    { t.async_receive(round, timeout) } -> AwaitableOf<ReceiveResult>;
    t.release_round(round);
};

} // namespace TaoMap::Core
