#include "crypto/merkle_tree.hpp"
#include "crypto/error.hpp"
#include "crypto/sha256.hpp"
#include <bit>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace TaoMap::Crypto::MerkleTree {

namespace detail {

    constexpr Byte LEAF_PREFIX { 0x00 };
    constexpr Byte INTERNAL_PREFIX { 0x01 };

    Hash hash_leaf(BytesSpan data)
    {
        auto h = Sha256 {}.update(LEAF_PREFIX).update(data).finish();
        if (!h) {
            throw std::system_error(h.error(), "merkle leaf hash");
        }
        return *h;
    }

    Hash hash_internal(const Hash& left, const Hash& right)
    {
        std::array<Byte, 65> buf;
        buf[0] = INTERNAL_PREFIX;
        std::memcpy(buf.data() + 1, left.data(), 32);
        std::memcpy(buf.data() + 33, right.data(), 32);

        return Utils::sha256(buf);
    }

} // namespace detail

std::optional<Hash> Tree::root() const
{
    if (nodes_.size() < 2)
        return std::nullopt;
    return nodes_[1];
}

std::expected<Proof, std::error_code> Tree::prove(size_t leaf_index) const
{
    if (leaf_count_ == 0) {
        return std::unexpected(make_error_code(Error::EmptyTree));
    }
    if (leaf_index >= leaf_count_) {
        return std::unexpected(make_error_code(Error::InvalidLeafIndex));
    }

    size_t padded_leaf_count = nodes_.size() / 2;

    std::vector<Hash> siblings;
    siblings.reserve(static_cast<size_t>(std::bit_width(padded_leaf_count)));

    size_t t = leaf_index + padded_leaf_count;
    while (t > 1) {
        // t^1 是兄弟节点
        siblings.push_back(nodes_[t ^ 1]);
        t >>= 1;
    }

    return Proof {
        .leaf_index = leaf_index,
        .total_leaves = leaf_count_,
        .siblings = std::move(siblings)
    };
}

Tree build(std::span<const BytesSpan> leaves)
{
    Tree tree;

    if (leaves.empty()) {
        return tree;
    }

    size_t N = leaves.size();
    tree.leaf_count_ = N;

    // A single leaf still gets a two-slot array so the root lives at index 1.
    size_t P = std::bit_ceil(N);
    tree.nodes_.resize(2 * P);

    for (size_t i = 0; i < N; ++i) {
        tree.nodes_[P + i] = detail::hash_leaf(leaves[i]);
    }

    if (N < P) {
        Hash empty_leaf_hash = detail::hash_leaf({});
        for (size_t i = N; i < P; ++i) {
            tree.nodes_[P + i] = empty_leaf_hash;
        }
    }

    for (size_t i = P - 1; i > 0; --i) {
        tree.nodes_[i] = detail::hash_internal(tree.nodes_[2 * i], tree.nodes_[2 * i + 1]);
    }

    return tree;
}

Tree build(std::span<const std::vector<Byte>> leaves)
{
    std::vector<BytesSpan> views(leaves.begin(), leaves.end());
    return build(std::span<const BytesSpan> { views });
}

bool verify(BytesSpan leaf, const Hash& root_hash, const Proof& proof)
{
    if (proof.leaf_index >= proof.total_leaves) {
        return false;
    }
    // Path length must match the padded height, otherwise a short proof could
    // pass an internal node off as a leaf.
    if (proof.siblings.size() != static_cast<size_t>(std::bit_width(std::bit_ceil(proof.total_leaves)) - 1)) {
        return false;
    }

    Hash acc = detail::hash_leaf(leaf);
    size_t idx = proof.leaf_index;

    for (const auto& sib : proof.siblings) {
        if (idx & 1) {
            acc = detail::hash_internal(sib, acc);
        } else {
            acc = detail::hash_internal(acc, sib);
        }
        idx >>= 1;
    }

    return acc == root_hash;
}

} // namespace TaoMap::Crypto::MerkleTree
