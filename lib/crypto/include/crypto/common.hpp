#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace TaoMap::Crypto {

using Byte = uint8_t;
using BytesSpan = std::span<const Byte>;
using MutableBytesSpan = std::span<Byte>;

// SHA-256 digest
using Hash = std::array<Byte, 32>;

inline BytesSpan as_span(std::string_view s)
{
    return BytesSpan(reinterpret_cast<const Byte*>(s.data()), s.size());
}

// OpenSSL 的接口都是 unsigned char*
inline unsigned char* u8ptr(Byte* p) { return reinterpret_cast<unsigned char*>(p); }
inline const unsigned char* u8ptr(const Byte* p) { return reinterpret_cast<const unsigned char*>(p); }
inline const unsigned char* u8ptr(BytesSpan s) { return u8ptr(s.data()); }

namespace Utils {
    Hash sha256(BytesSpan data);

    std::string to_hex(BytesSpan data);

    inline std::string to_hex(const Hash& h) { return to_hex(BytesSpan { h }); }

    void write_u32_le(Byte* buf, uint32_t val);
    void write_u64_le(Byte* buf, uint64_t val);
    uint32_t read_u32_le(const Byte* buf);
    uint64_t read_u64_le(const Byte* buf);
} // namespace Utils

} // namespace TaoMap::Crypto
