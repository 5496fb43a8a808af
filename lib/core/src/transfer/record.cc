#include "core/transfer/record.hpp"

namespace TaoMap::Core {

const char* to_string(TransferStatus s)
{
    switch (s) {
    case TransferStatus::InFlight:
        return "in-flight";
    case TransferStatus::Ok:
        return "ok";
    case TransferStatus::TimedOut:
        return "timed-out";
    case TransferStatus::Rejected:
        return "rejected";
    case TransferStatus::Corrupt:
        return "corrupt";
    case TransferStatus::Malformed:
        return "malformed";
    case TransferStatus::Unreachable:
        return "unreachable";
    }
    return "unknown";
}

} // namespace TaoMap::Core
