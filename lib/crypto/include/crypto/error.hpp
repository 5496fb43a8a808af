#pragma once

#include <cstdint>
#include <string>
#include <system_error>

namespace TaoMap::Crypto {
enum class Error : std::uint8_t {
    Success = 0,
    DigestFailure, // EVP digest 调用失败
    RandomFailure, // 随机数生成失败
    CipherFailure, // EVP cipher 调用失败
    InvalidLeafIndex, // Merkle 叶子索引越界
    EmptyTree
};

class CryptoErrorCategory : public std::error_category {
public:
    [[nodiscard]] const char* name() const noexcept override { return "TaoMapCrypto"; }

    std::string message(int ev) const override
    {
        switch (static_cast<Error>(ev)) {
        case Error::Success:
            return "Success";
        case Error::DigestFailure:
            return "OpenSSL digest failure";
        case Error::RandomFailure:
            return "OpenSSL RNG failure";
        case Error::CipherFailure:
            return "OpenSSL cipher failure";
        case Error::InvalidLeafIndex:
            return "Leaf index is out of range";
        case Error::EmptyTree:
            return "Merkle tree has no leaves";
        default:
            return "Unknown crypto error";
        }
    }
};

inline const std::error_category& crypto_category()
{
    static CryptoErrorCategory instance;
    return instance;
}

inline std::error_code make_error_code(Error e)
{
    return { static_cast<int>(e), crypto_category() };
}
} // namespace TaoMap::Crypto

namespace std {
template <>
struct is_error_code_enum<TaoMap::Crypto::Error> : true_type { };
} // namespace std
