#include "core/reduce/reduce_core.hpp"

#include <algorithm>

namespace TaoMap::Core::Reduce {

ContributionSet::ContributionSet(RoundId round, std::span<const std::uint32_t> indices, std::uint32_t total,
    std::uint32_t required, std::span<const MinerId> senders)
    : round_(round)
    , total_(total)
    , required_(required)
    , indices_(indices.begin(), indices.end())
    , senders_(senders.begin(), senders.end())
{
    std::ranges::sort(indices_);
    auto dup = std::ranges::unique(indices_);
    indices_.erase(dup.begin(), dup.end());
    for (auto i : indices_) {
        received_[i];
    }
}

Observation ContributionSet::observe(const Wire::ChunkMessage& msg)
{
    if (msg.round_id != round_ || msg.chunk.total != total_) {
        return Observation::Ignored;
    }
    auto it = received_.find(msg.chunk.index);
    if (it == received_.end()) {
        return Observation::Ignored;
    }
    if (!senders_.empty() && !senders_.contains(msg.sender)) {
        return Observation::Ignored;
    }
    if (it->second.size() >= required_ && !it->second.contains(msg.sender)) {
        return Observation::Ignored;
    }
    if (!it->second.emplace(msg.sender, msg.chunk).second) {
        return Observation::Duplicate;
    }
    return Observation::Accepted;
}

bool ContributionSet::complete(std::uint32_t index) const
{
    auto it = received_.find(index);
    return it != received_.end() && it->second.size() >= required_;
}

bool ContributionSet::all_complete() const
{
    return std::ranges::all_of(indices_, [this](std::uint32_t i) { return complete(i); });
}

std::vector<Chunk> ContributionSet::contributions(std::uint32_t index) const
{
    std::vector<Chunk> out;
    auto it = received_.find(index);
    if (it != received_.end()) {
        for (const auto& [sender, chunk] : it->second) {
            out.push_back(chunk);
        }
    }
    return out;
}

std::vector<MinerId> ContributionSet::contributors(std::uint32_t index) const
{
    std::vector<MinerId> out;
    auto it = received_.find(index);
    if (it != received_.end()) {
        for (const auto& [sender, chunk] : it->second) {
            out.push_back(sender);
        }
    }
    return out;
}

std::vector<MinerId> ContributionSet::missing(std::uint32_t index) const
{
    std::vector<MinerId> out;
    auto it = received_.find(index);
    for (MinerId s : senders_) {
        if (it == received_.end() || !it->second.contains(s)) {
            out.push_back(s);
        }
    }
    return out;
}

size_t ContributionSet::received(std::uint32_t index) const
{
    auto it = received_.find(index);
    return it == received_.end() ? 0 : it->second.size();
}

ReassemblyBuffer::ReassemblyBuffer(RoundId round, std::uint32_t total)
    : round_(round)
    , total_(total)
{
}

Observation ReassemblyBuffer::observe(const Wire::ChunkMessage& msg)
{
    if (msg.round_id != round_ || msg.chunk.total != total_ || msg.chunk.index >= total_) {
        return Observation::Ignored;
    }
    if (!chunks_.emplace(msg.chunk.index, std::make_pair(msg.sender, msg.chunk)).second) {
        ++duplicates_;
        return Observation::Duplicate;
    }
    return Observation::Accepted;
}

std::vector<std::uint32_t> ReassemblyBuffer::received() const
{
    std::vector<std::uint32_t> out;
    for (const auto& [index, entry] : chunks_) {
        out.push_back(index);
    }
    return out;
}

std::vector<std::uint32_t> ReassemblyBuffer::missing() const
{
    std::vector<std::uint32_t> out;
    for (std::uint32_t i = 0; i < total_; ++i) {
        if (!chunks_.contains(i)) {
            out.push_back(i);
        }
    }
    return out;
}

std::optional<MinerId> ReassemblyBuffer::winner(std::uint32_t index) const
{
    auto it = chunks_.find(index);
    if (it == chunks_.end()) {
        return std::nullopt;
    }
    return it->second.first;
}

std::map<std::uint32_t, MinerId> ReassemblyBuffer::winners() const
{
    std::map<std::uint32_t, MinerId> out;
    for (const auto& [index, entry] : chunks_) {
        out.emplace(index, entry.first);
    }
    return out;
}

std::vector<Chunk> ReassemblyBuffer::chunks() const
{
    std::vector<Chunk> out;
    out.reserve(chunks_.size());
    for (const auto& [index, entry] : chunks_) {
        out.push_back(entry.second);
    }
    return out;
}

} // namespace TaoMap::Core::Reduce
