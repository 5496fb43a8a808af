#pragma once

#include "core/chunk.hpp"
#include "core/config.hpp"
#include "core/error.hpp"
#include "core/map/assignment.hpp"
#include "core/map/map_core.hpp"
#include "core/transfer/concept.hpp"
#include "core/wait_group.hpp"
#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/log/trivial.hpp>
#include <exception>
#include <expected>
#include <memory>
#include <span>

namespace TaoMap::Core::Map {

/**
 * @brief Map phase driver: splits a payload and delivers every chunk to all
 * of its holders concurrently.
 *
 * Each (index, holder) pair runs as its own coroutine on the awaiting
 * executor, which must be a strand or a single-threaded io_context. The
 * round returns as soon as no index is still pending with a send in flight,
 * or when the round deadline passes. Sends to redundant holders that are
 * still running at that point are recorded TimedOut and their results are
 * dropped. The transport must outlive all transfers, including the ones
 * still running when run() returns.
 */
template <ChunkTransport T>
class MapDistributor {
public:
    MapDistributor(T& transport, MapConfig config, MinerId self = PEER_ID)
        : transport_(transport)
        , config_(config)
        , self_(self)
    {
    }

    auto run(RoundId round, BytesSpan payload, std::span<const MinerCapability> miners)
        -> boost::asio::awaitable<std::expected<MapRoundResult, std::error_code>>
    {
        namespace net = boost::asio;

        if (auto ok = config_.validate(); !ok) {
            co_return std::unexpected(ok.error());
        }

        const auto start = Clock::now();
        auto chunks = ChunkCodec::split(payload, config_.total_chunks);
        if (!chunks) {
            co_return std::unexpected(chunks.error());
        }
        auto assignment = Assignment::build(miners, config_.total_chunks, config_.redundancy);
        if (!assignment) {
            BOOST_LOG_TRIVIAL(error) << "map round " << round << ": " << assignment.error().message();
            co_return std::unexpected(assignment.error());
        }

        auto executor = co_await net::this_coro::executor;
        auto st = std::make_shared<RoundState>(executor, std::move(*assignment), config_.max_retries);
        st->deadline = start + config_.round_deadline;

        auto commitment = ChunkCodec::commit(*chunks);
        for (auto& chunk : *chunks) {
            auto proof = commitment.tree.prove(chunk.index);
            if (!proof) {
                co_return std::unexpected(proof.error());
            }
            st->messages.push_back(Wire::ChunkMessage {
                .round_id = round,
                .sender = self_,
                .chunk = std::move(chunk),
                .commitment = commitment.root,
                .proof = std::move(proof->siblings),
            });
        }

        BOOST_LOG_TRIVIAL(info) << "map round " << round << " started: " << payload.size() << " bytes, "
                                << config_.total_chunks << " chunks, R=" << st->assignment.redundancy();
        if (st->assignment.redundancy() < st->assignment.requested_redundancy()) {
            BOOST_LOG_TRIVIAL(warning) << "map round " << round << ": R=" << st->assignment.requested_redundancy()
                                       << " requested, only " << st->assignment.redundancy() << " distinct holders available";
        }

        // 重试目标不能是还在发送中的 holder，初始发送先全部登记
        for (std::uint32_t i = 0; i < st->assignment.total(); ++i) {
            for (MinerId holder : st->assignment.holders(i)) {
                st->core.mark_sending(i, holder);
            }
        }
        for (std::uint32_t i = 0; i < st->assignment.total(); ++i) {
            for (MinerId holder : st->assignment.holders(i)) {
                st->wg.add();
                net::co_spawn(executor, deliver(st, transport_, config_.transfer_timeout, i, holder),
                    [st](std::exception_ptr e) {
                        if (e) {
                            try {
                                std::rethrow_exception(e);
                            } catch (const std::exception& ex) {
                                BOOST_LOG_TRIVIAL(error) << "map transfer aborted: " << ex.what();
                            }
                        }
                        st->wg.done();
                    });
            }
        }

        const bool settled = co_await st->wg.wait_until(st->deadline);
        st->closed = true;
        if (!settled) {
            BOOST_LOG_TRIVIAL(warning) << "map round " << round << " hit its deadline with "
                                       << st->wg.pending() << " transfers pending";
        } else if (st->wg.pending() > 0) {
            BOOST_LOG_TRIVIAL(debug) << "map round " << round << " settled, abandoning "
                                     << st->wg.pending() << " redundant sends";
        }
        for (auto& record : st->records) {
            if (record.status == TransferStatus::InFlight) {
                record.status = TransferStatus::TimedOut;
                record.end = Clock::now();
            }
        }

        auto result = st->core.finalize();
        result.records = std::move(st->records);

        BOOST_LOG_TRIVIAL(info) << "map round " << round << " finished: " << result.delivered.size() << " delivered, "
                                << result.failed.size() << " failed";
        if (result.delivered.empty()) {
            co_return std::unexpected(make_error_code(Error::RoundFailed));
        }
        co_return result;
    }

private:
    struct RoundState {
        RoundState(const boost::asio::any_io_executor& ex, Assignment a, std::uint32_t max_retries)
            : assignment(std::move(a))
            , core(assignment, max_retries)
            , wg(ex)
        {
        }

        Assignment assignment;
        MapCore core;
        WaitGroup wg;
        std::vector<Wire::ChunkMessage> messages;
        std::vector<TransferRecord> records;
        TimePoint deadline;
        bool closed = false;
    };

    static Millis remaining(TimePoint deadline)
    {
        auto left = std::chrono::ceil<Millis>(deadline - Clock::now());
        return std::max(left, Millis { 0 });
    }

    // 一个 (index, holder) 的发送，失败后按 MapCore 的决定换 holder 重试
    static auto deliver(std::shared_ptr<RoundState> st, T& transport, Millis transfer_timeout,
        std::uint32_t index, MinerId first) -> boost::asio::awaitable<void>
    {
        std::optional<MinerId> next = first;
        while (next && !st->closed) {
            const MinerId to = *next;
            const auto& msg = st->messages[index];
            const size_t slot = st->records.size();
            st->core.mark_sending(index, to);
            st->records.push_back(TransferRecord {
                .peer = to,
                .chunk_index = index,
                .direction = Direction::Send,
                .start = Clock::now(),
                .end = {},
                .bytes = msg.chunk.data.size(),
                .status = TransferStatus::InFlight,
            });

            const auto timeout = std::min(transfer_timeout, remaining(st->deadline));
            auto result = co_await transport.async_send(st->assignment.miner(to).endpoint, msg, timeout);
            if (st->closed) {
                co_return;
            }

            auto& record = st->records[slot];
            record.end = Clock::now();
            if (result) {
                record.status = TransferStatus::Ok;
                if (!st->core.observe_ack(index, to)) {
                    BOOST_LOG_TRIVIAL(trace) << "duplicate ack for index " << index << " from miner " << to << " discarded";
                }
                release_if_settled(*st);
                co_return;
            }

            record.status = to_transfer_status(result.error());
            BOOST_LOG_TRIVIAL(debug) << "send of index " << index << " to miner " << to << " failed: "
                                     << result.error().message();
            st->core.observe_failure(index, to, result.error());
            next = st->core.next_retry_target(index, to);
            if (next) {
                // 先登记，避免这一刻被判定为已结束
                st->core.mark_sending(index, *next);
                BOOST_LOG_TRIVIAL(debug) << "retrying index " << index << " on miner " << *next;
            } else {
                release_if_settled(*st);
            }
        }
    }

    // 没有 index 还在等待在途的发送时，本轮结束
    static void release_if_settled(RoundState& st)
    {
        if (st.core.all_settled()) {
            st.wg.release();
        }
    }

    T& transport_;
    MapConfig config_;
    MinerId self_;
};

} // namespace TaoMap::Core::Map
