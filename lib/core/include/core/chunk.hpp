#pragma once

#include "core/common.hpp"
#include "crypto/merkle_tree.hpp"
#include <cstdint>
#include <expected>
#include <span>
#include <system_error>
#include <vector>

namespace TaoMap::Core {

using Fingerprint = Hash;

/// One ordered, fingerprinted fragment of a payload
struct Chunk {
    std::uint32_t index = 0;
    std::uint32_t total = 0;
    std::vector<Byte> data;
    Fingerprint fingerprint {};

    bool operator==(const Chunk&) const = default;
};

struct ChunkBounds {
    size_t offset;
    size_t length;
};

/// Payload commitment: Merkle root over every chunk's data.
struct Commitment {
    Hash root;
    Crypto::MerkleTree::Tree tree;
};

namespace ChunkCodec {

    /**
     * @brief Where chunk @p index of a @p payload_len byte payload lives.
     *
     * base = len / total, rem = len % total. The first rem chunks carry one
     * extra byte. Requires total >= 1 and index < total.
     */
    [[nodiscard]] ChunkBounds bounds(size_t payload_len, std::uint32_t total, std::uint32_t index) noexcept;

    /// SHA-256(0x00 || le32(index) || le32(total) || data)
    [[nodiscard]] Fingerprint fingerprint(std::uint32_t index, std::uint32_t total, BytesSpan data);

    [[nodiscard]] Chunk make_chunk(std::uint32_t index, std::uint32_t total, std::vector<Byte> data);

    /// Recomputes the fingerprint and compares.
    [[nodiscard]] bool verify(const Chunk& chunk);

    [[nodiscard]]
    auto split(BytesSpan payload, std::uint32_t total)
        -> std::expected<std::vector<Chunk>, std::error_code>;

    /// Inverse of split. Chunks may arrive in any order.
    [[nodiscard]]
    auto join(std::span<const Chunk> chunks)
        -> std::expected<std::vector<Byte>, std::error_code>;

    /// chunks must be ordered by index.
    [[nodiscard]] Commitment commit(std::span<const Chunk> chunks);

    [[nodiscard]] bool verify_membership(const Chunk& chunk, const Hash& root, const Crypto::MerkleTree::Proof& proof);

} // namespace ChunkCodec

} // namespace TaoMap::Core
