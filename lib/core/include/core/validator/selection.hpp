#pragma once

#include "core/common.hpp"
#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string_view>
#include <system_error>
#include <vector>

namespace TaoMap::Core::Validator {

/// Secret per-round randomness of the validator.
using SamplingSeed = Hash;

/// SHA-256 of the seed, published before the round.
struct SeedCommitment {
    Hash digest;

    bool operator==(const SeedCommitment&) const = default;
};

namespace Selection {

    // 32 bytes from OpenSSL's CSPRNG
    [[nodiscard]] auto draw_seed() -> std::expected<SamplingSeed, std::error_code>;

    [[nodiscard]] SeedCommitment commit(const SamplingSeed& seed);

    [[nodiscard]] bool verify_reveal(const SeedCommitment& commitment, const SamplingSeed& seed);

    /**
     * @brief Uniform k-subset of @p miners, a partial Fisher-Yates shuffle
     * driven by the seed. k larger than the list returns all miners.
     */
    [[nodiscard]] std::vector<MinerCapability> select_sample(std::span<const MinerCapability> miners, size_t k,
        const SamplingSeed& seed, RoundId round);

    /// Per-miner probe nonce, unknown to the miner until the probe is sent.
    [[nodiscard]] Hash probe_nonce(const SamplingSeed& seed, RoundId round, MinerId miner);

    /**
     * @brief Benchmark groups of miners with neighboring addresses.
     *
     * Miners are de-duplicated by host (first one wins; unspecified hosts
     * are dropped), ordered by numeric IPv4 address, cut into groups of
     * @p group_size, and a short last group is kept. Group order is then
     * shuffled with the seed.
     */
    [[nodiscard]] std::vector<std::vector<MinerCapability>> group_by_address(std::span<const MinerCapability> miners,
        size_t group_size, const SamplingSeed& seed);

    [[nodiscard]] std::optional<std::uint32_t> parse_ipv4(std::string_view host);

} // namespace Selection

} // namespace TaoMap::Core::Validator
