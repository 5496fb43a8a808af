#include "core/scoring/scoring_engine.hpp"

#include <algorithm>
#include <boost/log/trivial.hpp>
#include <cmath>
#include <stdexcept>

namespace TaoMap::Core::Scoring {

ScoringEngine::ScoringEngine(ScoringConfig config)
    : config_(config)
{
    if (auto ok = config_.validate(); !ok) {
        throw std::invalid_argument("invalid scoring config: " + ok.error().message());
    }
}

double ScoringEngine::throughput(const ScoreSample& sample)
{
    const double seconds = std::chrono::duration<double>(sample.latency).count();
    return static_cast<double>(sample.bytes) / std::max(seconds, 1e-6);
}

double ScoringEngine::decayed(double score, Clock::rep updated, TimePoint now) const
{
    if (updated == 0) {
        return score;
    }
    const auto last = TimePoint(Clock::duration(updated));
    if (now <= last) {
        return score;
    }
    const double dt = std::chrono::duration<double>(now - last).count();
    const double half_life = std::chrono::duration<double>(config_.half_life).count();
    return config_.baseline + (score - config_.baseline) * std::exp2(-dt / half_life);
}

ScoringEngine::MinerState& ScoringEngine::state_for(MinerId miner)
{
    {
        std::shared_lock lock(table_mutex_);
        auto it = miners_.find(miner);
        if (it != miners_.end()) {
            return *it->second;
        }
    }
    std::unique_lock lock(table_mutex_);
    auto [it, inserted] = miners_.try_emplace(miner, nullptr);
    if (inserted) {
        it->second = std::make_unique<MinerState>(config_.baseline);
    }
    return *it->second;
}

ScoringEngine::MinerState* ScoringEngine::find(MinerId miner) const
{
    std::shared_lock lock(table_mutex_);
    auto it = miners_.find(miner);
    return it == miners_.end() ? nullptr : it->second.get();
}

void ScoringEngine::record_sample(const ScoreSample& sample)
{
    auto& st = state_for(sample.miner_id);
    std::lock_guard lock(st.write);

    const auto updated = st.updated.load(std::memory_order_acquire);
    double s = decayed(st.score.load(std::memory_order_relaxed), updated, sample.observed_at);
    const double b = config_.baseline;

    if (!sample.integrity_ok) {
        s -= config_.integrity_penalty * s;
        BOOST_LOG_TRIVIAL(warning) << "miner " << sample.miner_id << " integrity violation in round "
                                   << sample.round_id << ", score now " << s;
    } else if (!sample.success) {
        s -= config_.failure_penalty * s;
        BOOST_LOG_TRIVIAL(debug) << "miner " << sample.miner_id << " failed in round " << sample.round_id;
    } else {
        const double ratio = std::min(1.0, throughput(sample) / config_.reference_throughput);
        const double target = b + (1.0 - b) * ratio;
        s += config_.alpha * (target - s);
    }
    s = std::clamp(s, 0.0, 1.0);

    const auto stamp = std::max(updated, sample.observed_at.time_since_epoch().count());
    st.score.store(s, std::memory_order_relaxed);
    st.updated.store(stamp, std::memory_order_release);

    st.window.push_back(sample);
    while (st.window.size() > config_.window) {
        st.window.pop_front();
    }
}

double ScoringEngine::current_score(MinerId miner, TimePoint now) const
{
    const auto* st = find(miner);
    if (st == nullptr) {
        return config_.baseline;
    }
    const auto updated = st->updated.load(std::memory_order_acquire);
    return decayed(st->score.load(std::memory_order_relaxed), updated, now);
}

std::map<MinerId, double> ScoringEngine::normalized_weights(TimePoint now) const
{
    std::map<MinerId, double> weights;
    double sum = 0.0;
    for (MinerId id : known_miners()) {
        double s = current_score(id, now);
        weights[id] = s;
        sum += s;
    }
    if (weights.empty()) {
        return weights;
    }
    for (auto& [id, w] : weights) {
        w = sum > 0.0 ? w / sum : 1.0 / static_cast<double>(weights.size());
    }
    return weights;
}

std::optional<WindowStats> ScoringEngine::window_stats(MinerId miner) const
{
    auto* st = find(miner);
    if (st == nullptr) {
        return std::nullopt;
    }
    std::lock_guard lock(st->write);

    WindowStats stats;
    double total = 0.0;
    for (const auto& s : st->window) {
        ++stats.samples;
        if (!s.integrity_ok) {
            ++stats.integrity_failures;
        } else if (s.success) {
            ++stats.successes;
            total += throughput(s);
        }
    }
    if (stats.successes > 0) {
        stats.mean_throughput = total / static_cast<double>(stats.successes);
    }
    return stats;
}

std::vector<MinerId> ScoringEngine::known_miners() const
{
    std::shared_lock lock(table_mutex_);
    std::vector<MinerId> ids;
    ids.reserve(miners_.size());
    for (const auto& [id, st] : miners_) {
        ids.push_back(id);
    }
    return ids;
}

} // namespace TaoMap::Core::Scoring
