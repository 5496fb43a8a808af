#include "core/config.hpp"
#include "core/error.hpp"
#include "core/wire/codec.hpp"

namespace TaoMap::Core {

namespace {

    std::expected<void, std::error_code> invalid()
    {
        return std::unexpected(make_error_code(Error::InvalidArgument));
    }

} // namespace

std::expected<void, std::error_code> ChannelConfig::validate() const
{
    if (max_frame_bytes == 0 || max_frame_bytes > UINT32_MAX || inbox_capacity == 0)
        return invalid();
    return {};
}

std::expected<void, std::error_code> MapConfig::validate() const
{
    if (total_chunks == 0 || redundancy == 0)
        return invalid();
    if (transfer_timeout <= Millis::zero() || round_deadline <= Millis::zero())
        return invalid();
    return {};
}

std::expected<void, std::error_code> ReduceConfig::validate() const
{
    if (endpoints == 0)
        return invalid();
    if (transfer_timeout <= Millis::zero() || round_deadline <= Millis::zero())
        return invalid();
    return {};
}

std::expected<void, std::error_code> SamplerConfig::validate() const
{
    if (sample_size == 0 || group_size == 0 || deadline <= Millis::zero())
        return invalid();
    return {};
}

std::expected<void, std::error_code> SamplerConfig::validate(const ChannelConfig& channel) const
{
    if (auto ok = validate(); !ok)
        return ok;
    if (auto ok = channel.validate(); !ok)
        return ok;
    // 回应 body = 固定头 + declared_size 字节的 payload
    if (declared_size > channel.max_frame_bytes
        || channel.max_frame_bytes - declared_size < Wire::PROBE_RESPONSE_OVERHEAD)
        return invalid();
    return {};
}

std::expected<void, std::error_code> ScoringConfig::validate() const
{
    if (baseline < 0.0 || baseline > 1.0)
        return invalid();
    if (alpha <= 0.0 || alpha > 1.0)
        return invalid();
    // integrity 违规必须比普通失败罚得更重
    if (failure_penalty < 0.0 || integrity_penalty > 1.0 || integrity_penalty <= failure_penalty)
        return invalid();
    if (reference_throughput <= 0.0 || half_life.count() <= 0 || window == 0)
        return invalid();
    return {};
}

} // namespace TaoMap::Core
