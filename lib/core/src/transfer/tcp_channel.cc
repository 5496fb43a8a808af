#include "core/transfer/tcp_channel.hpp"
#include "core/error.hpp"
#include "core/transfer/framing.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/log/trivial.hpp>
#include <memory>
#include <string>

namespace TaoMap::Core {

namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

    // watchdog 和 resolve 的回调都可能晚于协程结束，状态放在 shared_ptr 里
    struct Exchange {
        explicit Exchange(const net::any_io_executor& ex)
            : resolver(ex)
            , socket(ex)
            , watchdog(ex)
            , wake(ex, net::steady_timer::time_point::max())
        {
        }

        tcp::resolver resolver;
        tcp::socket socket;
        net::steady_timer watchdog;
        bool timed_out = false;

        // getaddrinfo 取消后仍要跑完才回调，协程只等 wake
        net::steady_timer wake;
        bool resolved = false;
        boost::system::error_code resolve_ec;
        tcp::resolver::results_type endpoints;
    };

} // namespace

net::awaitable<std::expected<Wire::Message, std::error_code>>
TcpChannel::exchange(const Endpoint& to, std::vector<Byte> frame, Millis timeout)
{
    auto executor = co_await net::this_coro::executor;
    auto state = std::make_shared<Exchange>(executor);

    state->watchdog.expires_after(timeout);
    state->watchdog.async_wait([state](const boost::system::error_code& ec) {
        if (!ec) {
            state->timed_out = true;
            state->resolver.cancel();
            boost::system::error_code ignored;
            state->socket.close(ignored);
            state->wake.cancel();
        }
    });

    auto fail = [&](std::error_code ec) -> std::unexpected<std::error_code> {
        state->watchdog.cancel();
        return std::unexpected(state->timed_out ? make_error_code(Error::TimedOut) : ec);
    };

    state->resolver.async_resolve(to.host, std::to_string(to.port),
        [state](const boost::system::error_code& ec, tcp::resolver::results_type results) {
            state->resolved = true;
            state->resolve_ec = ec;
            state->endpoints = std::move(results);
            state->wake.cancel();
        });

    boost::system::error_code ec;
    while (!state->resolved && !state->timed_out) {
        co_await state->wake.async_wait(net::redirect_error(net::use_awaitable, ec));
    }
    if (state->timed_out) {
        BOOST_LOG_TRIVIAL(debug) << "resolve " << to.host << " did not finish within " << timeout.count() << "ms";
        co_return fail(make_error_code(Error::TimedOut));
    }
    if (state->resolve_ec) {
        BOOST_LOG_TRIVIAL(debug) << "resolve " << to.host << " failed: " << state->resolve_ec.message();
        co_return fail(make_error_code(Error::Unreachable));
    }

    co_await net::async_connect(state->socket, state->endpoints, net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        BOOST_LOG_TRIVIAL(debug) << "connect " << to.host << ":" << to.port << " failed: " << ec.message();
        co_return fail(make_error_code(Error::Unreachable));
    }

    if (auto err = co_await Framing::write_frame(state->socket, frame)) {
        co_return fail(make_error_code(Error::Unreachable));
    }

    auto reply = co_await Framing::read_message(state->socket, config_.max_frame_bytes);
    if (!reply) {
        co_return fail(reply.error());
    }

    state->watchdog.cancel();
    boost::system::error_code ignored;
    state->socket.shutdown(tcp::socket::shutdown_both, ignored);
    state->socket.close(ignored);
    co_return std::move(*reply);
}

net::awaitable<SendResult> TcpChannel::async_send(const Endpoint& to, const Wire::ChunkMessage& msg, Millis timeout)
{
    auto reply = co_await exchange(to, Wire::encode(msg), timeout);
    if (!reply) {
        co_return std::unexpected(reply.error());
    }

    const auto* ack = std::get_if<Wire::AckMessage>(&*reply);
    if (ack == nullptr || ack->round_id != msg.round_id || ack->index != msg.chunk.index) {
        co_return std::unexpected(make_error_code(Error::Malformed));
    }

    switch (ack->status) {
    case Wire::AckStatus::Accepted:
        co_return *ack;
    case Wire::AckStatus::Rejected:
        co_return std::unexpected(make_error_code(Error::Rejected));
    case Wire::AckStatus::Corrupt:
        co_return std::unexpected(make_error_code(Error::CorruptChunk));
    }
    co_return std::unexpected(make_error_code(Error::Malformed));
}

net::awaitable<ProbeResult> TcpChannel::async_probe(const Endpoint& to, const Wire::ProbeRequest& req, Millis timeout)
{
    auto reply = co_await exchange(to, Wire::encode(req), timeout);
    if (!reply) {
        co_return std::unexpected(reply.error());
    }

    if (const auto* ack = std::get_if<Wire::AckMessage>(&*reply)) {
        if (ack->status == Wire::AckStatus::Rejected) {
            co_return std::unexpected(make_error_code(Error::Rejected));
        }
        co_return std::unexpected(make_error_code(Error::Malformed));
    }

    auto* response = std::get_if<Wire::ProbeResponse>(&*reply);
    if (response == nullptr || response->round_id != req.round_id) {
        co_return std::unexpected(make_error_code(Error::Malformed));
    }
    if (Crypto::Utils::sha256(response->payload) != response->fingerprint) {
        BOOST_LOG_TRIVIAL(warning) << "probe response from " << to.host << ":" << to.port
                                   << " does not match its fingerprint";
        co_return std::unexpected(make_error_code(Error::CorruptChunk));
    }
    co_return std::move(*response);
}

} // namespace TaoMap::Core
