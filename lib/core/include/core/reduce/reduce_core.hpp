#pragma once

#include "core/chunk.hpp"
#include "core/common.hpp"
#include "core/wire/messages.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <vector>

namespace TaoMap::Core::Reduce {

enum class Observation : std::uint8_t {
    Accepted,
    Duplicate, ///< same sender (miner side) or same index (peer side) seen before
    Ignored, ///< other round, unknown index or unexpected sender
};

/**
 * @brief Miner-side collection of downstream contributions for the indices
 * this miner holds.
 *
 * An index is complete once @p required distinct senders contributed. When
 * @p senders is non-empty only those ids are accepted and missing() names
 * the ones that never answered.
 */
class ContributionSet {
public:
    ContributionSet(RoundId round, std::span<const std::uint32_t> indices, std::uint32_t total,
        std::uint32_t required, std::span<const MinerId> senders = {});

    Observation observe(const Wire::ChunkMessage& msg);

    [[nodiscard]] bool complete(std::uint32_t index) const;
    [[nodiscard]] bool all_complete() const;

    /// Ordered by sender id, so merges do not depend on arrival order.
    [[nodiscard]] std::vector<Chunk> contributions(std::uint32_t index) const;

    [[nodiscard]] std::vector<MinerId> contributors(std::uint32_t index) const;

    /// Expected senders that have not contributed. Empty when no sender list was given.
    [[nodiscard]] std::vector<MinerId> missing(std::uint32_t index) const;

    [[nodiscard]] size_t received(std::uint32_t index) const;

    [[nodiscard]] const std::vector<std::uint32_t>& indices() const { return indices_; }

private:
    RoundId round_;
    std::uint32_t total_;
    std::uint32_t required_;
    std::vector<std::uint32_t> indices_;
    std::set<MinerId> senders_;
    std::map<std::uint32_t, std::map<MinerId, Chunk>> received_;
};

/**
 * @brief Peer-side buffer of merged chunks, one per index.
 *
 * The first integrity-verified chunk for an index wins; later ones, from
 * redundant holders, are discarded.
 */
class ReassemblyBuffer {
public:
    ReassemblyBuffer(RoundId round, std::uint32_t total);

    Observation observe(const Wire::ChunkMessage& msg);

    [[nodiscard]] bool complete() const { return chunks_.size() == total_; }
    [[nodiscard]] std::vector<std::uint32_t> received() const;
    [[nodiscard]] std::vector<std::uint32_t> missing() const;
    [[nodiscard]] std::optional<MinerId> winner(std::uint32_t index) const;
    [[nodiscard]] std::map<std::uint32_t, MinerId> winners() const;
    [[nodiscard]] std::vector<Chunk> chunks() const;
    [[nodiscard]] size_t duplicates() const { return duplicates_; }

private:
    RoundId round_;
    std::uint32_t total_;
    std::map<std::uint32_t, std::pair<MinerId, Chunk>> chunks_;
    size_t duplicates_ = 0;
};

} // namespace TaoMap::Core::Reduce
