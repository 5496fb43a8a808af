#include "crypto/common.hpp"
#include <openssl/sha.h>

namespace TaoMap::Crypto::Utils {

Hash sha256(BytesSpan data)
{
    Hash hash;
    SHA256(u8ptr(data), data.size(), u8ptr(hash.data()));
    return hash;
}

std::string to_hex(BytesSpan data)
{
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (Byte b : data) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

void write_u32_le(Byte* buf, uint32_t val)
{
    buf[0] = static_cast<Byte>(val);
    buf[1] = static_cast<Byte>(val >> 8);
    buf[2] = static_cast<Byte>(val >> 16);
    buf[3] = static_cast<Byte>(val >> 24);
}

void write_u64_le(Byte* buf, uint64_t val)
{
    write_u32_le(buf, static_cast<uint32_t>(val));
    write_u32_le(buf + 4, static_cast<uint32_t>(val >> 32));
}

uint32_t read_u32_le(const Byte* buf)
{
    return static_cast<uint32_t>(buf[0]) | (static_cast<uint32_t>(buf[1]) << 8) | (static_cast<uint32_t>(buf[2]) << 16) | (static_cast<uint32_t>(buf[3]) << 24);
}

uint64_t read_u64_le(const Byte* buf)
{
    return static_cast<uint64_t>(read_u32_le(buf)) | (static_cast<uint64_t>(read_u32_le(buf + 4)) << 32);
}

} // namespace TaoMap::Crypto::Utils
