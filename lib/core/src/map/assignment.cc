#include "core/map/assignment.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <boost/log/trivial.hpp>
#include <limits>
#include <stdexcept>

namespace TaoMap::Core::Map {

auto Assignment::build(std::span<const MinerCapability> miners, std::uint32_t total, std::uint32_t redundancy)
    -> std::expected<Assignment, std::error_code>
{
    if (miners.empty()) {
        return std::unexpected(make_error_code(Error::NoEligibleMiner));
    }
    if (total == 0 || redundancy == 0) {
        return std::unexpected(make_error_code(Error::InvalidArgument));
    }

    Assignment a;
    a.requested_ = redundancy;
    a.miners_.assign(miners.begin(), miners.end());
    for (size_t i = 0; i < a.miners_.size(); ++i) {
        const auto& m = a.miners_[i];
        if (!(m.bandwidth_hint > 0.0) || !a.position_.emplace(m.id, i).second) {
            return std::unexpected(make_error_code(Error::InvalidArgument));
        }
    }

    const size_t n = a.miners_.size();
    const size_t eligible = static_cast<size_t>(std::count_if(a.miners_.begin(), a.miners_.end(),
        [](const MinerCapability& m) { return m.redundancy_eligible; }));

    // 每个 index 的副本只能来自 eligible 且不是 primary 的 miner
    size_t achievable = std::numeric_limits<size_t>::max();
    for (std::uint32_t i = 0; i < total; ++i) {
        const auto& primary = a.miners_[i % n];
        size_t replicas = eligible - (primary.redundancy_eligible ? 1 : 0);
        achievable = std::min(achievable, replicas + 1);
    }
    a.redundancy_ = static_cast<std::uint32_t>(std::min<size_t>(redundancy, achievable));
    if (a.redundancy_ < redundancy) {
        BOOST_LOG_TRIVIAL(warning) << "redundancy reduced from " << redundancy << " to " << a.redundancy_
                                   << ": only " << eligible << " of " << n << " miners can hold replicas";
    }

    std::vector<size_t> assigned(n, 0);
    a.holders_.resize(total);
    for (std::uint32_t i = 0; i < total; ++i) {
        auto& group = a.holders_[i];
        const size_t primary = i % n;
        group.push_back(a.miners_[primary].id);
        ++assigned[primary];

        while (group.size() < a.redundancy_) {
            // least assigned / bandwidth, ties by list order
            size_t best = n;
            double best_cost = std::numeric_limits<double>::infinity();
            for (size_t j = 0; j < n; ++j) {
                const auto& m = a.miners_[j];
                if (!m.redundancy_eligible || std::ranges::find(group, m.id) != group.end()) {
                    continue;
                }
                double cost = static_cast<double>(assigned[j] + 1) / m.bandwidth_hint;
                if (cost < best_cost) {
                    best_cost = cost;
                    best = j;
                }
            }
            // achievable 已保证一定能找到
            group.push_back(a.miners_[best].id);
            ++assigned[best];
        }

        for (MinerId id : group) {
            a.by_miner_[id].push_back(i);
        }
    }

    BOOST_LOG_TRIVIAL(debug) << "assignment: " << total << " indices over " << n << " miners, R=" << a.redundancy_;
    return a;
}

std::vector<std::uint32_t> Assignment::indices_of(MinerId miner) const
{
    auto it = by_miner_.find(miner);
    if (it == by_miner_.end()) {
        return {};
    }
    return it->second;
}

size_t Assignment::load(MinerId miner) const
{
    auto it = by_miner_.find(miner);
    return it == by_miner_.end() ? 0 : it->second.size();
}

bool Assignment::holds(MinerId miner, std::uint32_t index) const
{
    if (index >= holders_.size()) {
        return false;
    }
    return std::ranges::find(holders_[index], miner) != holders_[index].end();
}

const MinerCapability& Assignment::miner(MinerId id) const
{
    auto it = position_.find(id);
    if (it == position_.end()) {
        throw std::out_of_range("unknown miner id");
    }
    return miners_[it->second];
}

} // namespace TaoMap::Core::Map
