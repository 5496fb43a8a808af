#pragma once

#include "core/config.hpp"
#include "core/transfer/concept.hpp"
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <expected>
#include <system_error>
#include <vector>

namespace TaoMap::Core {

/**
 * @brief Client side of the Transfer Channel over TCP.
 *
 * One connection per operation. The timeout covers name resolution, connect,
 * write and read: a steady_timer cancels the resolver and closes the socket,
 * so every call completes within it. Operations run on the executor of the
 * awaiting coroutine.
 */
class TcpChannel {
public:
    explicit TcpChannel(ChannelConfig config = {})
        : config_(config)
    {
    }

    // Accepted ack, otherwise TimedOut / Rejected / CorruptChunk / Unreachable / Malformed
    boost::asio::awaitable<SendResult> async_send(const Endpoint& to, const Wire::ChunkMessage& msg, Millis timeout);

    // Response whose declared fingerprint matches its payload
    boost::asio::awaitable<ProbeResult> async_probe(const Endpoint& to, const Wire::ProbeRequest& req, Millis timeout);

    [[nodiscard]] const ChannelConfig& config() const { return config_; }

private:
    boost::asio::awaitable<std::expected<Wire::Message, std::error_code>>
    exchange(const Endpoint& to, std::vector<Byte> frame, Millis timeout);

    ChannelConfig config_;
};

static_assert(ChunkTransport<TcpChannel>);
static_assert(ProbeTransport<TcpChannel>);

} // namespace TaoMap::Core
