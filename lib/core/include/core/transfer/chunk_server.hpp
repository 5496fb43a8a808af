#pragma once

#include "core/config.hpp"
#include "core/transfer/concept.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <functional>
#include <memory>
#include <optional>

namespace TaoMap::Core {

/**
 * @brief Receive side of the Transfer Channel over TCP.
 *
 * Every chunk is checked against its fingerprint (and its Merkle proof when
 * the sender attached a commitment) before it is acked and queued. Corrupt
 * chunks are answered with a Corrupt ack and surface from async_receive as
 * CorruptChunk; they never reach a consumer as data.
 *
 * Arrivals are queued per round. async_receive(round, ...) only ever returns
 * arrivals of that round, and any number of consumers may wait on distinct
 * rounds at the same time.
 *
 * The accept loop and the connection handlers own the server state, so the
 * ChunkServer may be destroyed while they are still suspended; destruction
 * stops the server and the handlers unwind on their own.
 *
 * Not thread-safe. Construct it on a strand or a single-threaded io_context
 * and call async_receive from the same executor.
 */
class ChunkServer {
public:
    using tcp = boost::asio::ip::tcp;

    /// nullopt answers the probe with a Rejected ack.
    using ProbeResponder = std::function<std::optional<Wire::ProbeResponse>(const Wire::ProbeRequest&)>;

    /// false answers the chunk with a Rejected ack.
    using Admission = std::function<bool(const Wire::ChunkMessage&)>;

    ChunkServer(boost::asio::any_io_executor ex, const tcp::endpoint& bind, ChannelConfig config = {});
    ~ChunkServer();

    ChunkServer(const ChunkServer&) = delete;
    ChunkServer& operator=(const ChunkServer&) = delete;

    [[nodiscard]] Endpoint local_endpoint() const;

    void start();
    void stop();

    void set_probe_responder(ProbeResponder responder);
    void set_admission(Admission admission);

    /// 只返回 @p round 的到达；其他 round 的 chunk 留在各自队列里
    boost::asio::awaitable<ReceiveResult> async_receive(RoundId round, Millis timeout);

    /// Drops whatever is still queued for @p round and wakes its waiters.
    void release_round(RoundId round);

    /// Total arrivals queued across all rounds.
    [[nodiscard]] size_t queued() const;
    [[nodiscard]] size_t queued(RoundId round) const;

    [[nodiscard]] const ChannelConfig& config() const;

private:
    struct State;

    // 协程各自持有 state，server 对象先析构也不会悬空
    static boost::asio::awaitable<void> accept_loop(std::shared_ptr<State> st);
    static boost::asio::awaitable<void> serve(std::shared_ptr<State> st, std::shared_ptr<tcp::socket> socket);

    std::shared_ptr<State> state_;
};

static_assert(ChunkSource<ChunkServer>);

} // namespace TaoMap::Core
