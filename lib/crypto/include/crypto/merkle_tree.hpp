#pragma once

#include <cstddef>
#include <expected>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

#include "crypto/common.hpp"

namespace TaoMap::Crypto::MerkleTree {

struct Proof {
    size_t leaf_index;
    size_t total_leaves;
    std::vector<Hash> siblings; // 从叶子到根的路径
};

class Tree {
public:
    Tree() = default;

    [[nodiscard]] std::optional<Hash> root() const;

    [[nodiscard]] std::expected<Proof, std::error_code> prove(size_t leaf_index) const;

    [[nodiscard]] const std::vector<Hash>& nodes() const { return nodes_; }
    [[nodiscard]] size_t leaf_count() const { return leaf_count_; }

private:
    friend Tree build(std::span<const BytesSpan> leaves);

    size_t leaf_count_ = 0;
    // heap layout: root at 1, leaves start at bit_ceil(leaf_count_)
    std::vector<Hash> nodes_;
};

[[nodiscard]]
Tree build(std::span<const BytesSpan> leaves);

[[nodiscard]]
Tree build(std::span<const std::vector<Byte>> leaves);

// 只需要 root 即可验证，不需要 Tree 对象
[[nodiscard]]
bool verify(BytesSpan leaf, const Hash& root_hash, const Proof& proof);

namespace detail {
    // Hash(0x00 || data)
    Hash hash_leaf(BytesSpan data);

    // Hash(0x01 || left || right)
    Hash hash_internal(const Hash& left, const Hash& right);
}

} // namespace TaoMap::Crypto::MerkleTree
