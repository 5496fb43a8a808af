#include "core/reduce/reduction.hpp"
#include "core/error.hpp"

#include <bit>
#include <cstdint>

namespace TaoMap::Core::Reduce {

namespace {

    float load_f32(const Byte* p)
    {
        std::uint32_t bits = static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8)
            | (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
        return std::bit_cast<float>(bits);
    }

    void store_f32(Byte* p, float v)
    {
        auto bits = std::bit_cast<std::uint32_t>(v);
        p[0] = static_cast<Byte>(bits);
        p[1] = static_cast<Byte>(bits >> 8);
        p[2] = static_cast<Byte>(bits >> 16);
        p[3] = static_cast<Byte>(bits >> 24);
    }

    std::expected<void, std::error_code> add_f32(std::span<Byte> acc, BytesSpan input)
    {
        if (acc.size() != input.size() || acc.size() % sizeof(float) != 0) {
            return std::unexpected(make_error_code(Error::Malformed));
        }
        for (size_t off = 0; off < acc.size(); off += sizeof(float)) {
            store_f32(acc.data() + off, load_f32(acc.data() + off) + load_f32(input.data() + off));
        }
        return {};
    }

} // namespace

namespace Reductions {

    Reduction sum_f32()
    {
        return Reduction { .name = "sum", .combine = add_f32, .finish = {} };
    }

    Reduction average_f32()
    {
        return Reduction {
            .name = "average",
            .combine = add_f32,
            .finish = [](std::span<Byte> acc, size_t count) -> std::expected<void, std::error_code> {
                if (count == 0 || acc.size() % sizeof(float) != 0) {
                    return std::unexpected(make_error_code(Error::Malformed));
                }
                const auto n = static_cast<float>(count);
                for (size_t off = 0; off < acc.size(); off += sizeof(float)) {
                    store_f32(acc.data() + off, load_f32(acc.data() + off) / n);
                }
                return {};
            },
        };
    }

} // namespace Reductions

auto merge(const Reduction& reduction, std::span<const Chunk> inputs)
    -> std::expected<Chunk, std::error_code>
{
    if (inputs.empty()) {
        return std::unexpected(make_error_code(Error::IncompleteInput));
    }
    const auto& first = inputs.front();
    std::vector<Byte> acc = first.data;
    if (acc.size() % sizeof(float) != 0) {
        return std::unexpected(make_error_code(Error::Malformed));
    }

    for (const auto& input : inputs.subspan(1)) {
        if (input.index != first.index || input.total != first.total) {
            return std::unexpected(make_error_code(Error::Malformed));
        }
        if (auto ok = reduction.combine(acc, input.data); !ok) {
            return std::unexpected(ok.error());
        }
    }
    if (reduction.finish) {
        if (auto ok = reduction.finish(acc, inputs.size()); !ok) {
            return std::unexpected(ok.error());
        }
    }
    return ChunkCodec::make_chunk(first.index, first.total, std::move(acc));
}

namespace F32 {

    std::vector<Byte> pack(std::span<const float> values)
    {
        std::vector<Byte> out(values.size() * sizeof(float));
        for (size_t i = 0; i < values.size(); ++i) {
            store_f32(out.data() + i * sizeof(float), values[i]);
        }
        return out;
    }

    std::vector<float> unpack(BytesSpan bytes)
    {
        std::vector<float> out(bytes.size() / sizeof(float));
        for (size_t i = 0; i < out.size(); ++i) {
            out[i] = load_f32(bytes.data() + i * sizeof(float));
        }
        return out;
    }

} // namespace F32

} // namespace TaoMap::Core::Reduce
