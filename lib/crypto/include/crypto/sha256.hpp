#pragma once

#include "crypto/common.hpp"
#include <expected>
#include <system_error>

struct evp_md_ctx_st;

namespace TaoMap::Crypto {

// Incremental SHA-256 over an owned EVP context.
class Sha256 {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;
    Sha256(Sha256&& other) noexcept;
    Sha256& operator=(Sha256&& other) noexcept;

    Sha256& update(BytesSpan data);
    Sha256& update(Byte b) { return update(BytesSpan { &b, 1 }); }
    Sha256& update_u32(uint32_t v);
    Sha256& update_u64(uint64_t v);

    // 把 other 已吸收的前缀复制进来，复用本对象的上下文
    Sha256& copy_from(const Sha256& other);

    // 任何一步失败都会让 finish 返回错误
    [[nodiscard]] std::expected<Hash, std::error_code> finish();

private:
    evp_md_ctx_st* ptr_ = nullptr;
    bool failed_ = false;
};

} // namespace TaoMap::Crypto
