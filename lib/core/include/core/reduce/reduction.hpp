#pragma once

#include "core/chunk.hpp"
#include "core/common.hpp"
#include <cstddef>
#include <expected>
#include <functional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace TaoMap::Core::Reduce {

/**
 * @brief Element-wise combination of equal-length chunks.
 *
 * combine folds one input into the accumulator and must be associative and
 * commutative. finish, when set, runs once with the number of inputs.
 */
struct Reduction {
    std::string name;
    std::function<std::expected<void, std::error_code>(std::span<Byte> acc, BytesSpan input)> combine;
    std::function<std::expected<void, std::error_code>(std::span<Byte> acc, size_t count)> finish;
};

namespace Reductions {
    // little-endian float32, element-wise sum
    Reduction sum_f32();
    // sum, then divided by the number of contributions
    Reduction average_f32();
}

/**
 * Merges the chunks of one index. Inputs must agree on index, total and
 * length; otherwise Malformed. An empty input is IncompleteInput. The result
 * is re-fingerprinted.
 */
[[nodiscard]]
auto merge(const Reduction& reduction, std::span<const Chunk> inputs)
    -> std::expected<Chunk, std::error_code>;

namespace F32 {
    [[nodiscard]] std::vector<Byte> pack(std::span<const float> values);
    [[nodiscard]] std::vector<float> unpack(BytesSpan bytes);
}

} // namespace TaoMap::Core::Reduce
