#include "core/chunk.hpp"
#include "core/error.hpp"
#include "crypto/sha256.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace TaoMap::Core::ChunkCodec {

namespace {

    constexpr Byte CHUNK_PREFIX { 0x00 };

} // namespace

ChunkBounds bounds(size_t payload_len, std::uint32_t total, std::uint32_t index) noexcept
{
    size_t base = payload_len / total;
    size_t rem = payload_len % total;
    size_t offset = (index * base) + std::min<size_t>(index, rem);
    size_t length = base + (index < rem ? 1 : 0);
    return { .offset = offset, .length = length };
}

Fingerprint fingerprint(std::uint32_t index, std::uint32_t total, BytesSpan data)
{
    auto h = Crypto::Sha256 {}
                 .update(CHUNK_PREFIX)
                 .update_u32(index)
                 .update_u32(total)
                 .update(data)
                 .finish();
    if (!h) {
        throw std::system_error(h.error(), "chunk fingerprint");
    }
    return *h;
}

Chunk make_chunk(std::uint32_t index, std::uint32_t total, std::vector<Byte> data)
{
    Chunk c { .index = index, .total = total, .data = std::move(data) };
    c.fingerprint = fingerprint(index, total, c.data);
    return c;
}

bool verify(const Chunk& chunk)
{
    return fingerprint(chunk.index, chunk.total, chunk.data) == chunk.fingerprint;
}

auto split(BytesSpan payload, std::uint32_t total)
    -> std::expected<std::vector<Chunk>, std::error_code>
{
    if (total == 0) {
        return std::unexpected(make_error_code(Error::InvalidArgument));
    }

    std::vector<Chunk> chunks;
    chunks.reserve(total);
    for (std::uint32_t i = 0; i < total; ++i) {
        auto [offset, length] = bounds(payload.size(), total, i);
        auto part = payload.subspan(offset, length);
        chunks.push_back(make_chunk(i, total, { part.begin(), part.end() }));
    }
    return chunks;
}

auto join(std::span<const Chunk> chunks)
    -> std::expected<std::vector<Byte>, std::error_code>
{
    if (chunks.empty()) {
        return std::unexpected(make_error_code(Error::IncompleteInput));
    }

    const std::uint32_t total = chunks.front().total;
    if (total == 0 || chunks.size() != total) {
        return std::unexpected(make_error_code(Error::IncompleteInput));
    }

    // 先检查完整性，再按 index 排位
    std::vector<const Chunk*> ordered(total, nullptr);
    for (const auto& c : chunks) {
        if (c.total != total || c.index >= total || ordered[c.index] != nullptr) {
            return std::unexpected(make_error_code(Error::IncompleteInput));
        }
        if (!verify(c)) {
            return std::unexpected(make_error_code(Error::CorruptChunk));
        }
        ordered[c.index] = &c;
    }

    size_t len = 0;
    for (const auto* c : ordered) {
        len += c->data.size();
    }

    // Boundaries must be exactly the ones split would have produced.
    std::vector<Byte> payload;
    payload.reserve(len);
    for (std::uint32_t i = 0; i < total; ++i) {
        const auto& data = ordered[i]->data;
        if (data.size() != bounds(len, total, i).length) {
            return std::unexpected(make_error_code(Error::Malformed));
        }
        payload.insert(payload.end(), data.begin(), data.end());
    }
    return payload;
}

Commitment commit(std::span<const Chunk> chunks)
{
    std::vector<BytesSpan> leaves;
    leaves.reserve(chunks.size());
    for (const auto& c : chunks) {
        leaves.emplace_back(c.data);
    }
    auto tree = Crypto::MerkleTree::build(std::span<const BytesSpan> { leaves });
    Hash root = tree.root().value_or(Crypto::MerkleTree::detail::hash_leaf({}));
    return Commitment { .root = root, .tree = std::move(tree) };
}

bool verify_membership(const Chunk& chunk, const Hash& root, const Crypto::MerkleTree::Proof& proof)
{
    if (proof.leaf_index != chunk.index || proof.total_leaves != chunk.total) {
        return false;
    }
    return Crypto::MerkleTree::verify(chunk.data, root, proof);
}

} // namespace TaoMap::Core::ChunkCodec
