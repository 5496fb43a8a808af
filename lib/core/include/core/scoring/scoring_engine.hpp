#pragma once

#include "core/common.hpp"
#include "core/config.hpp"
#include <atomic>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace TaoMap::Core::Scoring {

/// One timed, integrity-checked observation of a miner.
struct ScoreSample {
    MinerId miner_id = 0;
    RoundId round_id = 0;
    Clock::duration latency {};
    std::uint64_t bytes = 0;
    bool success = false;
    bool integrity_ok = true;
    TimePoint observed_at = Clock::now();
};

struct WindowStats {
    size_t samples = 0;
    size_t successes = 0;
    size_t integrity_failures = 0;
    double mean_throughput = 0.0; ///< bytes/s over successful samples
};

/**
 * @brief Long-lived per-miner score in [0, 1].
 *
 * Writers of one miner are serialized by that miner's mutex; readers load
 * the published score atomically and apply decay toward the baseline
 * themselves. The miner table only takes its exclusive lock to insert.
 */
class ScoringEngine {
public:
    /// Throws std::invalid_argument when the config does not validate.
    explicit ScoringEngine(ScoringConfig config = {});

    void record_sample(const ScoreSample& sample);

    [[nodiscard]] double current_score(MinerId miner) const { return current_score(miner, Clock::now()); }
    [[nodiscard]] double current_score(MinerId miner, TimePoint now) const;

    /// Scores of all known miners normalized to sum 1; uniform when all are zero.
    [[nodiscard]] std::map<MinerId, double> normalized_weights() const { return normalized_weights(Clock::now()); }
    [[nodiscard]] std::map<MinerId, double> normalized_weights(TimePoint now) const;

    [[nodiscard]] std::optional<WindowStats> window_stats(MinerId miner) const;

    [[nodiscard]] std::vector<MinerId> known_miners() const;

    [[nodiscard]] const ScoringConfig& config() const { return config_; }

    /// bytes per second
    [[nodiscard]] static double throughput(const ScoreSample& sample);

private:
    struct MinerState {
        explicit MinerState(double baseline)
            : score(baseline)
            , updated(0)
        {
        }

        std::mutex write;
        std::atomic<double> score;
        // Clock ticks of the last update, 0 before the first one
        std::atomic<Clock::rep> updated;
        std::deque<ScoreSample> window;
    };

    MinerState& state_for(MinerId miner);
    [[nodiscard]] MinerState* find(MinerId miner) const;
    [[nodiscard]] double decayed(double score, Clock::rep updated, TimePoint now) const;

    ScoringConfig config_;
    mutable std::shared_mutex table_mutex_;
    std::map<MinerId, std::unique_ptr<MinerState>> miners_;
};

} // namespace TaoMap::Core::Scoring
