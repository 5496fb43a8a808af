#include "core/map/map_core.hpp"
#include "core/error.hpp"

#include <boost/log/trivial.hpp>

namespace TaoMap::Core::Map {

MapCore::MapCore(const Assignment& assignment, std::uint32_t max_retries)
    : assignment_(assignment)
    , max_retries_(max_retries)
    , states_(assignment.total(), IndexState::Pending)
    , retries_(assignment.total(), 0)
    , inflight_(assignment.total())
    , dead_(assignment.total())
{
}

void MapCore::mark_sending(std::uint32_t index, MinerId to)
{
    inflight_.at(index).insert(to);
}

bool MapCore::observe_ack(std::uint32_t index, MinerId from)
{
    inflight_.at(index).erase(from);
    if (states_.at(index) != IndexState::Pending) {
        return false;
    }
    states_[index] = IndexState::Delivered;
    winners_[index] = from;
    return true;
}

void MapCore::observe_failure(std::uint32_t index, MinerId from, const std::error_code& ec)
{
    inflight_.at(index).erase(from);
    if (is_retryable(ec)) {
        return;
    }
    dead_[index].insert(from);
    // Rejected / Corrupt / Malformed: 本轮不再使用该 miner
    if (excluded_.insert(from).second) {
        BOOST_LOG_TRIVIAL(warning) << "miner " << from << " excluded from round: " << ec.message();
    }
}

std::optional<MinerId> MapCore::next_retry_target(std::uint32_t index, MinerId failed)
{
    if (states_.at(index) != IndexState::Pending || retries_[index] >= max_retries_) {
        return std::nullopt;
    }
    for (MinerId candidate : assignment_.holders(index)) {
        if (candidate == failed || excluded_.contains(candidate) || inflight_[index].contains(candidate)
            || dead_[index].contains(candidate)) {
            continue;
        }
        ++retries_[index];
        return candidate;
    }
    return std::nullopt;
}

std::optional<MinerId> MapCore::winner(std::uint32_t index) const
{
    auto it = winners_.find(index);
    if (it == winners_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool MapCore::all_settled() const
{
    for (size_t i = 0; i < states_.size(); ++i) {
        if (states_[i] == IndexState::Pending && !inflight_[i].empty()) {
            return false;
        }
    }
    return true;
}

MapRoundResult MapCore::finalize()
{
    MapRoundResult result;
    for (std::uint32_t i = 0; i < states_.size(); ++i) {
        if (states_[i] == IndexState::Pending) {
            states_[i] = IndexState::Failed;
        }
        if (states_[i] == IndexState::Delivered) {
            result.delivered.push_back(i);
        } else {
            result.failed.push_back(i);
        }
        inflight_[i].clear();
    }
    result.winners = winners_;
    result.status = result.failed.empty() ? RoundStatus::Healthy : RoundStatus::Degraded;
    return result;
}

} // namespace TaoMap::Core::Map
