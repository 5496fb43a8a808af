#include "core/transfer/chunk_server.hpp"
#include "core/chunk.hpp"
#include "core/error.hpp"
#include "core/transfer/framing.hpp"
#include "core/wire/codec.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/log/trivial.hpp>
#include <deque>
#include <map>
#include <set>

namespace TaoMap::Core {

namespace net = boost::asio;
using tcp = net::ip::tcp;

struct ChunkServer::State {
    State(net::any_io_executor executor, const tcp::endpoint& bind, ChannelConfig cfg)
        : ex(executor)
        , acceptor(executor, bind)
        , config(cfg)
    {
    }

    struct RoundQueue {
        std::deque<ReceiveResult> items;
        // 每个等待者一个本地 timer，push 时只唤醒本 round 的等待者
        std::set<net::steady_timer*> waiters;
    };

    net::any_io_executor ex;
    tcp::acceptor acceptor;
    ChannelConfig config;
    bool running = false;

    std::set<std::shared_ptr<tcp::socket>> connections;
    std::map<RoundId, RoundQueue> rounds;
    size_t total_queued = 0;

    ProbeResponder responder;
    Admission admission;

    void push(RoundId round, ReceiveResult result)
    {
        // 队列满时错误通知直接丢弃
        if (!result && total_queued >= config.inbox_capacity) {
            return;
        }
        auto& q = rounds[round];
        q.items.push_back(std::move(result));
        ++total_queued;
        for (auto* waiter : q.waiters) {
            waiter->cancel();
        }
    }

    void forget_if_idle(RoundId round)
    {
        auto it = rounds.find(round);
        if (it != rounds.end() && it->second.items.empty() && it->second.waiters.empty()) {
            rounds.erase(it);
        }
    }

    void wake_all()
    {
        for (auto& [round, q] : rounds) {
            for (auto* waiter : q.waiters) {
                waiter->cancel();
            }
        }
    }

    Wire::AckMessage admit(Wire::ChunkMessage msg)
    {
        Wire::AckMessage ack { .round_id = msg.round_id, .index = msg.chunk.index, .status = Wire::AckStatus::Accepted };

        bool intact = ChunkCodec::verify(msg.chunk);
        if (intact && msg.commitment) {
            Crypto::MerkleTree::Proof proof {
                .leaf_index = msg.chunk.index,
                .total_leaves = msg.chunk.total,
                .siblings = msg.proof,
            };
            intact = ChunkCodec::verify_membership(msg.chunk, *msg.commitment, proof);
        }
        if (!intact) {
            BOOST_LOG_TRIVIAL(warning) << "corrupt chunk " << msg.chunk.index << "/" << msg.chunk.total
                                       << " from miner " << msg.sender << " in round " << msg.round_id;
            ack.status = Wire::AckStatus::Corrupt;
            push(msg.round_id, std::unexpected(make_error_code(Error::CorruptChunk)));
            return ack;
        }

        if ((admission && !admission(msg)) || total_queued >= config.inbox_capacity) {
            ack.status = Wire::AckStatus::Rejected;
            return ack;
        }

        const RoundId round = msg.round_id;
        push(round, std::move(msg));
        return ack;
    }

    Wire::Message answer(const Wire::ProbeRequest& req)
    {
        Wire::AckMessage refused { .round_id = req.round_id, .index = 0, .status = Wire::AckStatus::Rejected };
        // 回应帧装不下 declared_size 时直接拒绝，不去生成 payload
        if (req.declared_size > config.max_frame_bytes
            || config.max_frame_bytes - req.declared_size < Wire::PROBE_RESPONSE_OVERHEAD) {
            BOOST_LOG_TRIVIAL(warning) << "probe in round " << req.round_id << " declares " << req.declared_size
                                       << " bytes, frame limit is " << config.max_frame_bytes;
            return refused;
        }
        if (!responder) {
            return refused;
        }
        if (auto response = responder(req)) {
            return std::move(*response);
        }
        return refused;
    }
};

net::awaitable<void> ChunkServer::accept_loop(std::shared_ptr<State> st)
{
    while (st->running) {
        boost::system::error_code ec;
        tcp::socket socket = co_await st->acceptor.async_accept(net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            if (st->running) {
                BOOST_LOG_TRIVIAL(warning) << "accept failed: " << ec.message();
                continue;
            }
            break;
        }
        if (!st->running) {
            break;
        }
        auto conn = std::make_shared<tcp::socket>(std::move(socket));
        st->connections.insert(conn);
        net::co_spawn(st->ex, serve(st, conn), net::detached);
    }
}

net::awaitable<void> ChunkServer::serve(std::shared_ptr<State> st, std::shared_ptr<tcp::socket> socket)
{
    while (st->running) {
        auto msg = co_await Framing::read_message(*socket, st->config.max_frame_bytes);
        if (!msg) {
            // 对端关闭连接是正常结束；坏帧不带可信的 round，只记日志
            if (msg.error() != Error::Unreachable && st->running) {
                BOOST_LOG_TRIVIAL(warning) << "dropping connection: " << msg.error().message();
            }
            break;
        }
        if (!st->running) {
            break;
        }

        std::error_code ec;
        if (auto* chunk = std::get_if<Wire::ChunkMessage>(&*msg)) {
            ec = co_await Framing::write_message(*socket, st->admit(std::move(*chunk)));
        } else if (auto* req = std::get_if<Wire::ProbeRequest>(&*msg)) {
            ec = co_await Framing::write_message(*socket, st->answer(*req));
        } else {
            BOOST_LOG_TRIVIAL(warning) << "unexpected message type on chunk server";
            break;
        }
        if (ec) {
            break;
        }
    }

    boost::system::error_code ignored;
    socket->close(ignored);
    st->connections.erase(socket);
}

ChunkServer::ChunkServer(net::any_io_executor ex, const tcp::endpoint& bind, ChannelConfig config)
    : state_(std::make_shared<State>(ex, bind, config))
{
}

ChunkServer::~ChunkServer()
{
    stop();
}

Endpoint ChunkServer::local_endpoint() const
{
    auto ep = state_->acceptor.local_endpoint();
    return Endpoint { .host = ep.address().to_string(), .port = ep.port() };
}

void ChunkServer::start()
{
    if (state_->running) {
        return;
    }
    state_->running = true;
    net::co_spawn(state_->ex, accept_loop(state_), net::detached);
}

void ChunkServer::stop()
{
    auto& st = *state_;
    if (!st.running) {
        return;
    }
    st.running = false;

    boost::system::error_code ignored;
    st.acceptor.close(ignored);
    for (const auto& socket : st.connections) {
        socket->close(ignored);
    }
    st.connections.clear();
    st.wake_all();
}

void ChunkServer::set_probe_responder(ProbeResponder responder)
{
    state_->responder = std::move(responder);
}

void ChunkServer::set_admission(Admission admission)
{
    state_->admission = std::move(admission);
}

net::awaitable<ReceiveResult> ChunkServer::async_receive(RoundId round, Millis timeout)
{
    // server 可能在等待期间被销毁，协程自己持有一份 state
    auto st = state_;
    const auto deadline = Clock::now() + timeout;
    net::steady_timer wake(st->ex);

    for (;;) {
        if (auto it = st->rounds.find(round); it != st->rounds.end() && !it->second.items.empty()) {
            auto result = std::move(it->second.items.front());
            it->second.items.pop_front();
            --st->total_queued;
            st->forget_if_idle(round);
            co_return result;
        }
        if (!st->running) {
            co_return std::unexpected(make_error_code(Error::Unreachable));
        }
        if (Clock::now() >= deadline) {
            co_return std::unexpected(make_error_code(Error::TimedOut));
        }

        wake.expires_at(deadline);
        st->rounds[round].waiters.insert(&wake);
        boost::system::error_code ec;
        co_await wake.async_wait(net::redirect_error(net::use_awaitable, ec));
        if (auto it = st->rounds.find(round); it != st->rounds.end()) {
            it->second.waiters.erase(&wake);
        }
        st->forget_if_idle(round);
    }
}

void ChunkServer::release_round(RoundId round)
{
    auto it = state_->rounds.find(round);
    if (it == state_->rounds.end()) {
        return;
    }
    state_->total_queued -= it->second.items.size();
    it->second.items.clear();
    state_->forget_if_idle(round);
}

size_t ChunkServer::queued() const
{
    return state_->total_queued;
}

size_t ChunkServer::queued(RoundId round) const
{
    auto it = state_->rounds.find(round);
    return it == state_->rounds.end() ? 0 : it->second.items.size();
}

const ChannelConfig& ChunkServer::config() const
{
    return state_->config;
}

} // namespace TaoMap::Core
