#pragma once

#include "core/common.hpp"
#include "core/error.hpp"
#include <cstdint>
#include <system_error>

namespace TaoMap::Core {

enum class Direction : std::uint8_t {
    Send,
    Receive,
};

enum class TransferStatus : std::uint8_t {
    InFlight,
    Ok,
    TimedOut,
    Rejected,
    Corrupt,
    Malformed,
    Unreachable,
};

/// One attempted Transfer Channel operation. Diagnostics and scoring only.
struct TransferRecord {
    MinerId peer;
    std::uint32_t chunk_index;
    Direction direction;
    TimePoint start;
    TimePoint end;
    std::uint64_t bytes = 0;
    TransferStatus status = TransferStatus::InFlight;
};

inline TransferStatus to_transfer_status(const std::error_code& ec)
{
    if (!ec)
        return TransferStatus::Ok;
    if (ec == Error::TimedOut)
        return TransferStatus::TimedOut;
    if (ec == Error::Rejected)
        return TransferStatus::Rejected;
    if (ec == Error::CorruptChunk)
        return TransferStatus::Corrupt;
    if (ec == Error::Malformed || ec == Error::FrameTooLarge)
        return TransferStatus::Malformed;
    return TransferStatus::Unreachable;
}

const char* to_string(TransferStatus s);

} // namespace TaoMap::Core
