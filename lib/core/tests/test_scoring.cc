#include "core/scoring/scoring_engine.hpp"

#include <cmath>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include <vector>

namespace TaoMap::Core::Scoring {

using namespace std::chrono_literals;

class ScoringEngineTest : public ::testing::Test {
protected:
    ScoreSample success(MinerId id, double mib_per_sec, TimePoint at)
    {
        // 1 MiB 的样本，按吞吐换算延迟
        const auto bytes = 1024ULL * 1024ULL;
        auto latency = std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(1.0 / mib_per_sec));
        return ScoreSample { .miner_id = id, .round_id = 1, .latency = latency, .bytes = bytes, .success = true, .integrity_ok = true, .observed_at = at };
    }

    ScoreSample failure(MinerId id, TimePoint at)
    {
        return ScoreSample { .miner_id = id, .round_id = 1, .latency = 5s, .bytes = 0, .success = false, .integrity_ok = true, .observed_at = at };
    }

    ScoreSample tampered(MinerId id, TimePoint at)
    {
        return ScoreSample { .miner_id = id, .round_id = 1, .latency = 1ms, .bytes = 0, .success = false, .integrity_ok = false, .observed_at = at };
    }

    ScoringConfig config_ {};
    TimePoint t0_ = Clock::now();
};

TEST_F(ScoringEngineTest, UnknownMinerReadsBaseline)
{
    ScoringEngine engine(config_);
    EXPECT_DOUBLE_EQ(engine.current_score(123), config_.baseline);
    EXPECT_FALSE(engine.window_stats(123).has_value());
    EXPECT_TRUE(engine.normalized_weights().empty());
}

TEST_F(ScoringEngineTest, FastSuccessMovesTowardOne)
{
    ScoringEngine engine(config_);
    engine.record_sample(success(1, 1000.0, t0_));
    // target = 1.0, s = 0.5 + 0.1 * 0.5
    EXPECT_NEAR(engine.current_score(1, t0_), 0.55, 1e-9);

    for (int i = 0; i < 100; ++i) {
        engine.record_sample(success(1, 1000.0, t0_));
    }
    EXPECT_GT(engine.current_score(1, t0_), 0.99);
    EXPECT_LE(engine.current_score(1, t0_), 1.0);
}

TEST_F(ScoringEngineTest, SlowSuccessEarnsProportionalTarget)
{
    ScoringEngine engine(config_);
    // 50 MiB/s 是参考吞吐的一半：target = 0.5 + 0.5 * 0.5
    engine.record_sample(success(1, 50.0, t0_));
    EXPECT_NEAR(engine.current_score(1, t0_), 0.5 + 0.1 * 0.25, 1e-6);
}

TEST_F(ScoringEngineTest, IntegrityViolationCostsMoreThanFailure)
{
    ScoringEngine engine(config_);
    engine.record_sample(failure(1, t0_));
    engine.record_sample(tampered(2, t0_));
    EXPECT_NEAR(engine.current_score(1, t0_), 0.4, 1e-9);
    EXPECT_NEAR(engine.current_score(2, t0_), 0.25, 1e-9);
    EXPECT_LT(engine.current_score(2, t0_), engine.current_score(1, t0_));
}

TEST_F(ScoringEngineTest, ScoreStaysInUnitInterval)
{
    ScoringEngine engine(config_);
    for (int i = 0; i < 200; ++i) {
        engine.record_sample(tampered(1, t0_));
    }
    EXPECT_GE(engine.current_score(1, t0_), 0.0);
    EXPECT_LT(engine.current_score(1, t0_), 1e-9);
}

TEST_F(ScoringEngineTest, DecaysTowardBaseline)
{
    ScoringEngine engine(config_);
    engine.record_sample(tampered(1, t0_));
    EXPECT_NEAR(engine.current_score(1, t0_), 0.25, 1e-9);

    // 一个半衰期后偏离 baseline 的部分减半
    EXPECT_NEAR(engine.current_score(1, t0_ + config_.half_life), 0.375, 1e-9);
    EXPECT_NEAR(engine.current_score(1, t0_ + 20 * config_.half_life), 0.5, 1e-6);

    engine.record_sample(failure(1, t0_ + config_.half_life));
    EXPECT_NEAR(engine.current_score(1, t0_ + config_.half_life), 0.375 * 0.8, 1e-9);
}

TEST_F(ScoringEngineTest, OutOfOrderSampleDoesNotRewindTime)
{
    ScoringEngine engine(config_);
    engine.record_sample(failure(1, t0_ + 10s));
    engine.record_sample(failure(1, t0_));
    EXPECT_NEAR(engine.current_score(1, t0_ + 10s), 0.5 * 0.8 * 0.8, 1e-9);
}

TEST_F(ScoringEngineTest, WeightsAreNormalized)
{
    ScoringEngine engine(config_);
    engine.record_sample(success(1, 1000.0, t0_));
    engine.record_sample(failure(2, t0_));
    engine.record_sample(tampered(3, t0_));

    auto weights = engine.normalized_weights(t0_);
    ASSERT_EQ(weights.size(), 3U);
    double sum = 0.0;
    for (const auto& [id, w] : weights) {
        sum += w;
    }
    EXPECT_NEAR(sum, 1.0, 1e-12);
    EXPECT_GT(weights[1], weights[2]);
    EXPECT_GT(weights[2], weights[3]);
    EXPECT_NEAR(weights[1], 0.55 / (0.55 + 0.4 + 0.25), 1e-9);
}

TEST_F(ScoringEngineTest, AllZeroScoresGiveUniformWeights)
{
    ScoringEngine engine(ScoringConfig { .baseline = 0.0, .alpha = 0.1, .failure_penalty = 0.2, .integrity_penalty = 0.5 });
    engine.record_sample(failure(1, t0_));
    engine.record_sample(failure(2, t0_));
    auto weights = engine.normalized_weights(t0_);
    EXPECT_DOUBLE_EQ(weights[1], 0.5);
    EXPECT_DOUBLE_EQ(weights[2], 0.5);
}

TEST_F(ScoringEngineTest, WindowKeepsRecentSamples)
{
    ScoringConfig config = config_;
    config.window = 4;
    ScoringEngine engine(config);
    engine.record_sample(tampered(1, t0_));
    for (int i = 0; i < 3; ++i) {
        engine.record_sample(success(1, 10.0, t0_));
    }
    auto stats = engine.window_stats(1);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->samples, 4U);
    EXPECT_EQ(stats->successes, 3U);
    EXPECT_EQ(stats->integrity_failures, 1U);
    EXPECT_NEAR(stats->mean_throughput, 10.0 * 1024 * 1024, 1.0);

    engine.record_sample(failure(1, t0_));
    stats = engine.window_stats(1);
    EXPECT_EQ(stats->samples, 4U);
    EXPECT_EQ(stats->integrity_failures, 0U);
}

TEST_F(ScoringEngineTest, ConcurrentWritersLoseNoUpdates)
{
    constexpr int THREADS = 8;
    constexpr int PER_THREAD = 50;

    ScoringConfig config = config_;
    config.window = 1000;
    ScoringEngine engine(config);

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([&engine, this, t] {
            for (int i = 0; i < PER_THREAD; ++i) {
                engine.record_sample(success(t, 10.0, t0_));
                engine.record_sample(failure(100, t0_));
                (void)engine.current_score(100, t0_);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(engine.window_stats(100)->samples, static_cast<size_t>(THREADS * PER_THREAD));
    EXPECT_EQ(engine.known_miners().size(), static_cast<size_t>(THREADS + 1));
    // 失败的乘性惩罚与顺序无关
    EXPECT_NEAR(engine.current_score(100, t0_), 0.0, 1e-12);
    EXPECT_NEAR(engine.current_score(0, t0_), 0.55 - 0.05 * std::pow(0.9, PER_THREAD), 1e-9);
}

TEST_F(ScoringEngineTest, InvalidConfigIsRejected)
{
    EXPECT_THROW(ScoringEngine(ScoringConfig { .failure_penalty = 0.6, .integrity_penalty = 0.5 }), std::invalid_argument);
    EXPECT_THROW(ScoringEngine(ScoringConfig { .baseline = 1.5 }), std::invalid_argument);
}

} // namespace TaoMap::Core::Scoring
