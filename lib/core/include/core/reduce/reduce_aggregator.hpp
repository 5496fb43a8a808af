#pragma once

#include "core/chunk.hpp"
#include "core/config.hpp"
#include "core/error.hpp"
#include "core/reduce/reduce_core.hpp"
#include "core/reduce/reduction.hpp"
#include "core/transfer/concept.hpp"
#include "core/transfer/record.hpp"
#include "core/wait_group.hpp"
#include <algorithm>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/log/trivial.hpp>
#include <exception>
#include <expected>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace TaoMap::Core::Reduce {

struct IndexOutcome {
    std::uint32_t index = 0;
    bool forwarded = false;
    std::vector<MinerId> contributors;
    std::vector<MinerId> missing; ///< expected senders that never contributed
    std::error_code error; ///< why the index was not forwarded
};

struct MinerReduceResult {
    RoundStatus status = RoundStatus::Healthy;
    std::vector<IndexOutcome> indices;
    size_t integrity_violations = 0;
    std::vector<TransferRecord> records;
};

struct ReduceRoundResult {
    RoundStatus status = RoundStatus::Healthy;
    std::optional<std::vector<Byte>> payload; ///< only when every index arrived
    std::vector<std::uint32_t> received;
    std::vector<std::uint32_t> missing;
    std::map<std::uint32_t, MinerId> winners;
    size_t duplicates = 0;
    size_t integrity_violations = 0;
    std::vector<TransferRecord> records;
};

/**
 * @brief Reduce phase: miners merge the B downstream contributions of each
 * index they hold and forward the merged chunk; the Peer collects one merged
 * chunk per index and joins them.
 *
 * Run on a strand or a single-threaded io_context. The inbox only ever
 * yields integrity-checked chunks; corrupt arrivals are counted.
 */
template <ChunkSource S>
class ReduceAggregator {
public:
    explicit ReduceAggregator(ReduceConfig config, Reduction reduction = Reductions::sum_f32())
        : config_(config)
        , reduction_(std::move(reduction))
    {
    }

    /**
     * Collects contributions for @p indices until all are complete or the
     * round deadline passes. Each index is merged and forwarded to @p peer as
     * soon as its last contribution arrives; an incomplete index is never
     * forwarded.
     */
    template <ChunkTransport T>
    auto reduce_at_miner(S& inbox, T& upstream, const Endpoint& peer, MinerId self, RoundId round,
        std::span<const std::uint32_t> indices, std::uint32_t total, std::span<const MinerId> downstream = {})
        -> boost::asio::awaitable<std::expected<MinerReduceResult, std::error_code>>
    {
        namespace net = boost::asio;

        if (auto ok = config_.validate(); !ok) {
            co_return std::unexpected(ok.error());
        }
        if (indices.empty() || total == 0 || (!downstream.empty() && downstream.size() != config_.endpoints)) {
            co_return std::unexpected(make_error_code(Error::InvalidArgument));
        }

        const auto deadline = Clock::now() + config_.round_deadline;
        ContributionSet set(round, indices, total, config_.endpoints, downstream);
        MinerReduceResult result;

        auto executor = co_await net::this_coro::executor;
        auto st = std::make_shared<ForwardState>(executor);
        std::map<std::uint32_t, std::error_code> merge_errors;

        // index 一凑齐就合并并上送，不等其他 index
        auto launch = [&](std::uint32_t index) {
            auto merged = merge(reduction_, set.contributions(index));
            if (!merged) {
                BOOST_LOG_TRIVIAL(warning) << "reduce round " << round << ": merge of index " << index
                                           << " failed: " << merged.error().message();
                merge_errors[index] = merged.error();
                return;
            }
            st->wg.add();
            net::co_spawn(executor,
                forward(st, upstream, peer, Wire::ChunkMessage { .round_id = round, .sender = self, .chunk = std::move(*merged), .commitment = std::nullopt, .proof = {} }, deadline),
                [st](std::exception_ptr e) {
                    if (e) {
                        try {
                            std::rethrow_exception(e);
                        } catch (const std::exception& ex) {
                            BOOST_LOG_TRIVIAL(error) << "reduce forward aborted: " << ex.what();
                        }
                    }
                    st->wg.done();
                });
        };

        while (!set.all_complete()) {
            auto left = remaining(deadline);
            if (left <= Millis::zero()) {
                break;
            }
            auto arrival = co_await inbox.async_receive(round, left);
            if (!arrival) {
                if (is_integrity_violation(arrival.error())) {
                    ++result.integrity_violations;
                    continue;
                }
                break;
            }
            if (set.observe(*arrival) == Observation::Accepted) {
                result.records.push_back(received_record(*arrival));
                if (set.complete(arrival->chunk.index)) {
                    launch(arrival->chunk.index);
                }
            }
        }
        // 迟到的贡献没人再取
        inbox.release_round(round);

        co_await st->wg.wait_until(deadline);
        st->closed = true;
        for (auto& record : st->records) {
            if (record.status == TransferStatus::InFlight) {
                record.status = TransferStatus::TimedOut;
                record.end = Clock::now();
            }
        }

        for (auto index : set.indices()) {
            IndexOutcome outcome { .index = index, .forwarded = false, .contributors = set.contributors(index), .missing = set.missing(index), .error = {} };
            if (!set.complete(index)) {
                BOOST_LOG_TRIVIAL(warning) << "reduce round " << round << ": index " << index << " has "
                                           << set.received(index) << "/" << config_.endpoints << " contributions, not forwarded";
                outcome.error = make_error_code(Error::IncompleteInput);
            } else if (auto it = merge_errors.find(index); it != merge_errors.end()) {
                outcome.error = it->second;
            } else if (auto done = st->outcomes.find(index); done != st->outcomes.end()) {
                outcome.forwarded = !done->second;
                outcome.error = done->second;
            } else {
                // 截止时仍在发送
                outcome.error = make_error_code(Error::TimedOut);
            }
            result.indices.push_back(std::move(outcome));
        }
        std::ranges::move(st->records, std::back_inserter(result.records));

        const bool all_forwarded = std::ranges::all_of(result.indices, [](const IndexOutcome& o) { return o.forwarded; });
        result.status = all_forwarded ? RoundStatus::Healthy : RoundStatus::Degraded;
        BOOST_LOG_TRIVIAL(info) << "reduce round " << round << " at miner " << self << ": "
                                << std::ranges::count_if(result.indices, [](const IndexOutcome& o) { return o.forwarded; })
                                << "/" << result.indices.size() << " indices forwarded";
        co_return result;
    }

    /**
     * Collects one merged chunk per index from the miners and rebuilds the
     * payload. The first verified chunk per index wins. Missing indices at
     * the deadline give a Degraded result without payload; receiving nothing
     * at all is RoundFailed.
     */
    auto reduce_at_peer(S& inbox, RoundId round, std::uint32_t total)
        -> boost::asio::awaitable<std::expected<ReduceRoundResult, std::error_code>>
    {
        if (auto ok = config_.validate(); !ok) {
            co_return std::unexpected(ok.error());
        }
        if (total == 0) {
            co_return std::unexpected(make_error_code(Error::InvalidArgument));
        }

        const auto deadline = Clock::now() + config_.round_deadline;
        ReassemblyBuffer buffer(round, total);
        ReduceRoundResult result;

        while (!buffer.complete()) {
            auto left = remaining(deadline);
            if (left <= Millis::zero()) {
                break;
            }
            auto arrival = co_await inbox.async_receive(round, left);
            if (!arrival) {
                if (is_integrity_violation(arrival.error())) {
                    ++result.integrity_violations;
                    continue;
                }
                break;
            }
            if (buffer.observe(*arrival) == Observation::Accepted) {
                result.records.push_back(received_record(*arrival));
            }
        }
        inbox.release_round(round);

        result.received = buffer.received();
        result.missing = buffer.missing();
        result.winners = buffer.winners();
        result.duplicates = buffer.duplicates();

        if (result.received.empty()) {
            BOOST_LOG_TRIVIAL(error) << "reduce round " << round << " received no merged chunk";
            co_return std::unexpected(make_error_code(Error::RoundFailed));
        }
        if (!result.missing.empty()) {
            BOOST_LOG_TRIVIAL(warning) << "reduce round " << round << " degraded: " << result.missing.size()
                                       << " of " << total << " indices missing";
            result.status = RoundStatus::Degraded;
            co_return result;
        }

        auto chunks = buffer.chunks();
        auto payload = ChunkCodec::join(chunks);
        if (!payload) {
            co_return std::unexpected(payload.error());
        }
        result.payload = std::move(*payload);
        BOOST_LOG_TRIVIAL(info) << "reduce round " << round << " finished: " << result.payload->size() << " bytes";
        co_return result;
    }

private:
    struct ForwardState {
        explicit ForwardState(const boost::asio::any_io_executor& ex)
            : wg(ex)
        {
        }

        WaitGroup wg;
        std::vector<TransferRecord> records;
        std::map<std::uint32_t, std::error_code> outcomes; ///< by index
        bool closed = false;
    };

    static Millis remaining(TimePoint deadline)
    {
        auto left = std::chrono::ceil<Millis>(deadline - Clock::now());
        return std::max(left, Millis { 0 });
    }

    static TransferRecord received_record(const Wire::ChunkMessage& msg)
    {
        const auto now = Clock::now();
        return TransferRecord {
            .peer = msg.sender,
            .chunk_index = msg.chunk.index,
            .direction = Direction::Receive,
            .start = now,
            .end = now,
            .bytes = msg.chunk.data.size(),
            .status = TransferStatus::Ok,
        };
    }

    // 合并后的 chunk 发给 Peer，只对可重试的错误重发
    template <ChunkTransport T>
    auto forward(std::shared_ptr<ForwardState> st, T& upstream, Endpoint peer, Wire::ChunkMessage msg,
        TimePoint deadline) -> boost::asio::awaitable<void>
    {
        std::error_code last = make_error_code(Error::TimedOut);
        for (std::uint32_t attempt = 0; attempt <= config_.max_retries && !st->closed; ++attempt) {
            const auto timeout = std::min(config_.transfer_timeout, remaining(deadline));
            if (timeout <= Millis::zero()) {
                break;
            }
            const size_t rec = st->records.size();
            st->records.push_back(TransferRecord {
                .peer = PEER_ID,
                .chunk_index = msg.chunk.index,
                .direction = Direction::Send,
                .start = Clock::now(),
                .end = {},
                .bytes = msg.chunk.data.size(),
                .status = TransferStatus::InFlight,
            });

            auto ack = co_await upstream.async_send(peer, msg, timeout);
            if (st->closed) {
                co_return;
            }
            st->records[rec].end = Clock::now();
            st->records[rec].status = ack ? TransferStatus::Ok : to_transfer_status(ack.error());
            if (ack) {
                st->outcomes[msg.chunk.index] = {};
                co_return;
            }
            last = ack.error();
            BOOST_LOG_TRIVIAL(debug) << "forward of index " << msg.chunk.index << " failed: " << last.message();
            if (!is_retryable(last)) {
                break;
            }
        }
        if (!st->closed) {
            st->outcomes[msg.chunk.index] = last;
        }
    }

    ReduceConfig config_;
    Reduction reduction_;
};

} // namespace TaoMap::Core::Reduce
