#pragma once

#include "core/common.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <system_error>

namespace TaoMap::Core {

// Benchmark tensor of the original subnet: 15 x 1024 x 1024 float32
inline constexpr std::uint64_t DEFAULT_PROBE_BYTES = 15ULL * 1024 * 1024 * sizeof(float);

struct ChannelConfig {
    std::size_t max_frame_bytes = 128 * 1024 * 1024;
    std::size_t inbox_capacity = 4096; ///< queued chunks before new ones are rejected

    [[nodiscard]] std::expected<void, std::error_code> validate() const;
};

struct MapConfig {
    std::uint32_t total_chunks = 1;
    std::uint32_t redundancy = 1; ///< R
    std::uint32_t max_retries = 2; ///< per index
    Millis transfer_timeout { 5000 };
    Millis round_deadline { 30000 };

    [[nodiscard]] std::expected<void, std::error_code> validate() const;
};

struct ReduceConfig {
    std::uint32_t endpoints = 1; ///< B, contributions expected per index
    std::uint32_t max_retries = 2; ///< upstream send of the merged chunk
    Millis transfer_timeout { 5000 };
    Millis round_deadline { 30000 };

    [[nodiscard]] std::expected<void, std::error_code> validate() const;
};

struct SamplerConfig {
    std::size_t sample_size = 16;
    std::uint64_t declared_size = DEFAULT_PROBE_BYTES;
    Millis deadline { 50000 };
    std::size_t group_size = 4;

    [[nodiscard]] std::expected<void, std::error_code> validate() const;
    /// Also requires the probe response for declared_size to fit in one frame of @p channel.
    [[nodiscard]] std::expected<void, std::error_code> validate(const ChannelConfig& channel) const;
};

struct ScoringConfig {
    double baseline = 0.5; ///< neutral score, decay target
    double alpha = 0.1; ///< EMA step toward the success target
    double failure_penalty = 0.2; ///< fraction of the score removed on timeout / refusal
    double integrity_penalty = 0.5; ///< fraction removed on corrupt content
    double reference_throughput = 100.0 * 1024 * 1024; ///< bytes/s that earns the full success target
    std::chrono::seconds half_life { 3600 };
    std::size_t window = 32; ///< samples kept per miner for statistics

    [[nodiscard]] std::expected<void, std::error_code> validate() const;
};

} // namespace TaoMap::Core
