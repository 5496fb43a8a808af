#include "crypto/sha256.hpp"
#include "crypto/error.hpp"
#include <openssl/evp.h>
#include <utility>

namespace TaoMap::Crypto {

Sha256::Sha256()
    : ptr_(EVP_MD_CTX_new())
{
    if (ptr_ == nullptr || 1 != EVP_DigestInit_ex(ptr_, EVP_sha256(), nullptr)) {
        failed_ = true;
    }
}

Sha256::~Sha256()
{
    if (ptr_ != nullptr)
        EVP_MD_CTX_free(ptr_);
}

Sha256::Sha256(Sha256&& other) noexcept
    : ptr_(std::exchange(other.ptr_, nullptr))
    , failed_(other.failed_)
{
}

Sha256& Sha256::operator=(Sha256&& other) noexcept
{
    if (this != &other) {
        if (ptr_ != nullptr)
            EVP_MD_CTX_free(ptr_);
        ptr_ = std::exchange(other.ptr_, nullptr);
        failed_ = other.failed_;
    }
    return *this;
}

Sha256& Sha256::update(BytesSpan data)
{
    if (failed_ || ptr_ == nullptr) {
        failed_ = true;
        return *this;
    }
    if (1 != EVP_DigestUpdate(ptr_, u8ptr(data), data.size())) {
        failed_ = true;
    }
    return *this;
}

Sha256& Sha256::update_u32(uint32_t v)
{
    Byte buf[4];
    Utils::write_u32_le(buf, v);
    return update(BytesSpan { buf, sizeof(buf) });
}

Sha256& Sha256::update_u64(uint64_t v)
{
    Byte buf[8];
    Utils::write_u64_le(buf, v);
    return update(BytesSpan { buf, sizeof(buf) });
}

Sha256& Sha256::copy_from(const Sha256& other)
{
    if (other.failed_ || other.ptr_ == nullptr || ptr_ == nullptr) {
        failed_ = true;
        return *this;
    }
    failed_ = 1 != EVP_MD_CTX_copy_ex(ptr_, other.ptr_);
    return *this;
}

std::expected<Hash, std::error_code> Sha256::finish()
{
    if (failed_ || ptr_ == nullptr) {
        return std::unexpected(make_error_code(Error::DigestFailure));
    }
    Hash h;
    unsigned int len = 0;
    if (1 != EVP_DigestFinal_ex(ptr_, u8ptr(h.data()), &len) || len != h.size()) {
        failed_ = true;
        return std::unexpected(make_error_code(Error::DigestFailure));
    }
    // finish 之后上下文不可再用
    failed_ = true;
    return h;
}

} // namespace TaoMap::Crypto
