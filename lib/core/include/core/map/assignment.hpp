#pragma once

#include "core/common.hpp"
#include <cstdint>
#include <expected>
#include <map>
#include <span>
#include <system_error>
#include <vector>

namespace TaoMap::Core::Map {

/**
 * @brief Which Miners hold which chunk index in one round.
 *
 * holders(i) lists redundancy() distinct miners; the first one is the
 * round-robin primary, the rest are load-aware replicas drawn from the
 * redundancy-eligible miners.
 */
class Assignment {
public:
    /**
     * Fails with NoEligibleMiner on an empty capability list and with
     * InvalidArgument on duplicate ids, a non-positive bandwidth hint,
     * total == 0 or redundancy == 0. A redundancy the miner set cannot
     * satisfy is reduced, with a warning.
     */
    [[nodiscard]]
    static auto build(std::span<const MinerCapability> miners, std::uint32_t total, std::uint32_t redundancy)
        -> std::expected<Assignment, std::error_code>;

    [[nodiscard]] std::uint32_t total() const { return static_cast<std::uint32_t>(holders_.size()); }
    [[nodiscard]] std::uint32_t redundancy() const { return redundancy_; }
    [[nodiscard]] std::uint32_t requested_redundancy() const { return requested_; }

    [[nodiscard]] const std::vector<MinerId>& holders(std::uint32_t index) const { return holders_.at(index); }

    [[nodiscard]] std::vector<std::uint32_t> indices_of(MinerId miner) const;

    /// Number of indices the miner holds.
    [[nodiscard]] size_t load(MinerId miner) const;

    [[nodiscard]] bool holds(MinerId miner, std::uint32_t index) const;

    /// Throws std::out_of_range for an unknown id.
    [[nodiscard]] const MinerCapability& miner(MinerId id) const;

    [[nodiscard]] const std::vector<MinerCapability>& miners() const { return miners_; }

private:
    Assignment() = default;

    std::uint32_t redundancy_ = 0;
    std::uint32_t requested_ = 0;
    std::vector<MinerCapability> miners_;
    std::map<MinerId, size_t> position_;
    std::vector<std::vector<MinerId>> holders_;
    std::map<MinerId, std::vector<std::uint32_t>> by_miner_;
};

} // namespace TaoMap::Core::Map
