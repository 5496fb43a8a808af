#pragma once

#include "crypto/common.hpp"
#include "crypto/sha256.hpp"
#include <cstdint>
#include <expected>
#include <string_view>
#include <system_error>
#include <vector>

namespace TaoMap::Crypto::Random {

// OS randomness through OpenSSL's CSPRNG.
[[nodiscard]] auto bytes(size_t len) -> std::expected<std::vector<Byte>, std::error_code>;

[[nodiscard]] auto hash() -> std::expected<Hash, std::error_code>;

/**
 * @brief Deterministic byte stream keyed by a 32-byte seed.
 *
 * Block i is SHA-256(domain || seed || le64(i)). Two parties holding the same
 * seed and domain read the same stream; without the seed the output is
 * unpredictable.
 */
class SeededStream {
public:
    SeededStream(const Hash& seed, std::string_view domain);

    SeededStream(SeededStream&&) noexcept = default;
    SeededStream& operator=(SeededStream&&) noexcept = default;

    void fill(MutableBytesSpan out);

    uint64_t next_u64();

    // Uniform in [0, bound), rejection sampled. bound must be > 0.
    uint64_t uniform(uint64_t bound);

private:
    void refill();

    // domain || seed 只吸收一次，每块从这里复制
    Sha256 prefix_;
    Sha256 block_hash_;
    uint64_t counter_ = 0;
    Hash block_ {};
    size_t offset_ = sizeof(Hash);
};

/**
 * @brief Bulk keystream for benchmark payloads.
 *
 * AES-256-CTR over zeros with key SHA-256("expand" || seed) and a zero IV.
 * Throws std::system_error when OpenSSL fails.
 */
[[nodiscard]] std::vector<Byte> expand(const Hash& seed, size_t len);

// SHA-256 of expand(seed, len), computed block by block without holding the payload.
[[nodiscard]] Hash expand_digest(const Hash& seed, size_t len);

} // namespace TaoMap::Crypto::Random
