#pragma once

#include "core/config.hpp"
#include "core/error.hpp"
#include "core/scoring/scoring_engine.hpp"
#include "core/transfer/concept.hpp"
#include "core/validator/probe.hpp"
#include "core/validator/selection.hpp"
#include "core/wait_group.hpp"
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/log/trivial.hpp>
#include <exception>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace TaoMap::Core::Validator {

using Scoring::ScoreSample;

/**
 * @brief Probes a seed-selected sample of miners and turns each probe into a
 * ScoreSample.
 *
 * The probe timer starts when the request is sent and stops at full,
 * verified receipt. Samples are forwarded to the scoring engine when one is
 * attached. Run on a strand or a single-threaded io_context; the sampler and
 * its transport must outlive the probes it spawns.
 */
template <ProbeTransport T>
class Sampler {
public:
    Sampler(T& transport, SamplerConfig config, Scoring::ScoringEngine* scores = nullptr)
        : transport_(transport)
        , config_(config)
        , scores_(scores)
    {
    }

    /// Probes select_sample(miners, sample_size, seed) concurrently.
    auto run(RoundId round, std::span<const MinerCapability> miners, const SamplingSeed& seed)
        -> boost::asio::awaitable<std::expected<std::vector<ScoreSample>, std::error_code>>
    {
        if (auto ok = config_.validate(transport_.config()); !ok) {
            co_return std::unexpected(ok.error());
        }
        if (miners.empty()) {
            co_return std::unexpected(make_error_code(Error::NoEligibleMiner));
        }

        auto sample = Selection::select_sample(miners, config_.sample_size, seed, round);
        BOOST_LOG_TRIVIAL(info) << "probe round " << round << ": " << sample.size() << " of " << miners.size()
                                << " miners selected";
        auto samples = co_await probe_all(round, std::move(sample), seed);
        publish(samples);
        co_return samples;
    }

    /// Probes the groups one after another, the miners of a group concurrently.
    auto run_groups(RoundId round, const std::vector<std::vector<MinerCapability>>& groups, const SamplingSeed& seed)
        -> boost::asio::awaitable<std::expected<std::vector<ScoreSample>, std::error_code>>
    {
        if (auto ok = config_.validate(transport_.config()); !ok) {
            co_return std::unexpected(ok.error());
        }
        if (groups.empty()) {
            co_return std::unexpected(make_error_code(Error::NoEligibleMiner));
        }

        std::vector<ScoreSample> all;
        for (size_t g = 0; g < groups.size(); ++g) {
            BOOST_LOG_TRIVIAL(debug) << "probe round " << round << ": group " << g + 1 << "/" << groups.size()
                                     << " with " << groups[g].size() << " miners";
            auto samples = co_await probe_all(round, groups[g], seed);
            publish(samples);
            all.insert(all.end(), samples.begin(), samples.end());
        }
        co_return all;
    }

    /**
     * One probe with the given deadline. Never fails: every outcome is a
     * sample. @p expected is Probe::expected_digest(nonce, declared_size),
     * computed before the timer starts.
     */
    auto probe(RoundId round, MinerCapability miner, Hash nonce, Hash expected, TimePoint deadline)
        -> boost::asio::awaitable<ScoreSample>
    {
        const Wire::ProbeRequest req { .round_id = round, .declared_size = config_.declared_size, .nonce = nonce };

        ScoreSample sample { .miner_id = miner.id, .round_id = round };
        const auto start = Clock::now();
        auto timeout = std::chrono::ceil<Millis>(deadline - start);
        if (timeout < Millis::zero()) {
            timeout = Millis::zero();
        }

        auto response = co_await transport_.async_probe(miner.endpoint, req, timeout);
        const auto end = Clock::now();
        sample.observed_at = end;
        sample.latency = end - start;

        if (!response) {
            const auto& ec = response.error();
            sample.success = false;
            sample.integrity_ok = !is_integrity_violation(ec);
            if (ec == Error::TimedOut) {
                sample.latency = config_.deadline;
            }
            BOOST_LOG_TRIVIAL(debug) << "probe of miner " << miner.id << " failed: " << ec.message();
            co_return sample;
        }

        if (!Probe::verify_response(req, expected, *response)) {
            BOOST_LOG_TRIVIAL(warning) << "miner " << miner.id << " returned wrong probe content in round " << round;
            sample.success = false;
            sample.integrity_ok = false;
            co_return sample;
        }

        sample.success = true;
        sample.integrity_ok = true;
        sample.bytes = response->payload.size();
        co_return sample;
    }

private:
    struct ProbeState {
        explicit ProbeState(const boost::asio::any_io_executor& ex, size_t n)
            : wg(ex)
            , results(n)
        {
        }

        WaitGroup wg;
        std::vector<std::optional<ScoreSample>> results;
    };

    auto probe_all(RoundId round, std::vector<MinerCapability> miners, const SamplingSeed& seed)
        -> boost::asio::awaitable<std::vector<ScoreSample>>
    {
        namespace net = boost::asio;

        // 期望摘要的计算量与 declared_size 成正比，必须在任何计时开始前做完
        std::vector<Hash> nonces;
        std::vector<Hash> digests;
        nonces.reserve(miners.size());
        digests.reserve(miners.size());
        for (const auto& m : miners) {
            nonces.push_back(Selection::probe_nonce(seed, round, m.id));
            digests.push_back(Probe::expected_digest(nonces.back(), config_.declared_size));
        }

        auto executor = co_await net::this_coro::executor;
        auto st = std::make_shared<ProbeState>(executor, miners.size());
        const auto deadline = Clock::now() + config_.deadline;

        for (size_t i = 0; i < miners.size(); ++i) {
            st->wg.add();
            net::co_spawn(executor, probe(round, miners[i], nonces[i], digests[i], deadline),
                [st, i](std::exception_ptr e, ScoreSample sample) {
                    if (e) {
                        try {
                            std::rethrow_exception(e);
                        } catch (const std::exception& ex) {
                            BOOST_LOG_TRIVIAL(error) << "probe aborted: " << ex.what();
                        }
                    } else {
                        st->results[i] = sample;
                    }
                    st->wg.done();
                });
        }

        co_await st->wg.wait_until(deadline);

        std::vector<ScoreSample> samples;
        samples.reserve(miners.size());
        for (size_t i = 0; i < miners.size(); ++i) {
            if (st->results[i]) {
                samples.push_back(*st->results[i]);
                continue;
            }
            // 截止时还没返回的 probe 记为超时
            samples.push_back(ScoreSample {
                .miner_id = miners[i].id,
                .round_id = round,
                .latency = config_.deadline,
                .bytes = 0,
                .success = false,
                .integrity_ok = true,
                .observed_at = Clock::now(),
            });
        }
        log_summary(round, samples);
        co_return samples;
    }

    static void log_summary(RoundId round, const std::vector<ScoreSample>& samples)
    {
        size_t ok = 0;
        for (const auto& s : samples) {
            ok += s.success ? 1 : 0;
        }
        BOOST_LOG_TRIVIAL(info) << "probe round " << round << ": " << ok << "/" << samples.size() << " probes succeeded";
    }

    void publish(const std::vector<ScoreSample>& samples)
    {
        if (scores_ == nullptr) {
            return;
        }
        for (const auto& s : samples) {
            scores_->record_sample(s);
        }
    }

    T& transport_;
    SamplerConfig config_;
    Scoring::ScoringEngine* scores_;
};

} // namespace TaoMap::Core::Validator
