#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace TaoMap::Core {
enum class Error : std::uint8_t {
    Success = 0,
    TimedOut, // 超时（包括被 round deadline 取消）
    Rejected, // 对端拒绝
    Malformed, // 帧或消息无法解析
    CorruptChunk, // fingerprint 或 commitment 不匹配
    IncompleteInput, // join 时缺少或重复 index
    Unreachable, // 连接失败或 IO 错误
    InvalidArgument,
    NoEligibleMiner,
    RoundFailed, // 整轮没有任何 index 可以恢复
    FrameTooLarge
};

class CoreErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "TaoMap"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Error>(ev)) {
        case Error::Success:
            return "Success";
        case Error::TimedOut:
            return "Transfer timed out";
        case Error::Rejected:
            return "Peer rejected the request";
        case Error::Malformed:
            return "Malformed message";
        case Error::CorruptChunk:
            return "Chunk data does not match its fingerprint";
        case Error::IncompleteInput:
            return "Chunk set is incomplete or has duplicate indices";
        case Error::Unreachable:
            return "Peer unreachable";
        case Error::InvalidArgument:
            return "Invalid argument";
        case Error::NoEligibleMiner:
            return "No eligible miner";
        case Error::RoundFailed:
            return "Round recovered no index";
        case Error::FrameTooLarge:
            return "Frame exceeds configured maximum size";
        default:
            return "Unknown TaoMap error";
        }
    }
};

inline const std::error_category& core_category()
{
    static CoreErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(Error e)
{
    return { static_cast<int>(e), core_category() };
}

} // namespace TaoMap::Core

namespace std {
template <>
struct is_error_code_enum<TaoMap::Core::Error> : true_type { };
} // namespace std

namespace TaoMap::Core {

/// Failures worth another attempt against a different holder.
inline bool is_retryable(const std::error_code& ec)
{
    return ec == Error::TimedOut || ec == Error::Unreachable;
}

/// Failures that count against the sender's integrity.
inline bool is_integrity_violation(const std::error_code& ec)
{
    return ec == Error::CorruptChunk || ec == Error::Malformed;
}

} // namespace TaoMap::Core
