#include "crypto/random.hpp"
#include "crypto/error.hpp"
#include "crypto/sha256.hpp"
#include <algorithm>
#include <cstring>
#include <limits>
#include <memory>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <stdexcept>

namespace TaoMap::Crypto::Random {

auto bytes(size_t len) -> std::expected<std::vector<Byte>, std::error_code>
{
    std::vector<Byte> out(len);
    if (len == 0) {
        return out;
    }
    if (RAND_bytes(u8ptr(out.data()), static_cast<int>(len)) != 1) {
        return std::unexpected(make_error_code(Error::RandomFailure));
    }
    return out;
}

auto hash() -> std::expected<Hash, std::error_code>
{
    Hash h;
    if (RAND_bytes(u8ptr(h.data()), static_cast<int>(h.size())) != 1) {
        return std::unexpected(make_error_code(Error::RandomFailure));
    }
    return h;
}

SeededStream::SeededStream(const Hash& seed, std::string_view domain)
{
    prefix_.update(as_span(domain)).update(BytesSpan { seed });
}

void SeededStream::refill()
{
    auto block = block_hash_.copy_from(prefix_).update_u64(counter_++).finish();
    if (!block) {
        throw std::system_error(block.error(), "seeded stream");
    }
    block_ = *block;
    offset_ = 0;
}

void SeededStream::fill(MutableBytesSpan out)
{
    size_t written = 0;
    while (written < out.size()) {
        if (offset_ == block_.size()) {
            refill();
        }
        size_t n = std::min(out.size() - written, block_.size() - offset_);
        std::memcpy(out.data() + written, block_.data() + offset_, n);
        offset_ += n;
        written += n;
    }
}

uint64_t SeededStream::next_u64()
{
    Byte buf[8];
    fill(MutableBytesSpan { buf, sizeof(buf) });
    return Utils::read_u64_le(buf);
}

uint64_t SeededStream::uniform(uint64_t bound)
{
    if (bound == 0) {
        throw std::invalid_argument("uniform bound must be positive");
    }
    // 拒绝采样，避免取模偏差
    const uint64_t limit = std::numeric_limits<uint64_t>::max() - (std::numeric_limits<uint64_t>::max() % bound);
    for (;;) {
        uint64_t v = next_u64();
        if (v < limit) {
            return v % bound;
        }
    }
}

namespace {

    struct CipherCtxDeleter {
        void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
    };
    using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

    constexpr size_t EXPAND_BLOCK = 1 << 20;

    // AES-256-CTR 加密全零即为密钥流
    class Keystream {
    public:
        explicit Keystream(const Hash& seed)
            : ctx_(EVP_CIPHER_CTX_new())
        {
            auto key = Sha256 {}.update(as_span("expand")).update(BytesSpan { seed }).finish();
            if (!key) {
                throw std::system_error(key.error(), "expand key");
            }
            const std::array<Byte, 16> iv {};
            if (!ctx_ || 1 != EVP_EncryptInit_ex(ctx_.get(), EVP_aes_256_ctr(), nullptr, u8ptr(key->data()), u8ptr(iv.data()))) {
                throw std::system_error(make_error_code(Error::CipherFailure), "expand init");
            }
        }

        void fill(MutableBytesSpan out)
        {
            std::memset(out.data(), 0, out.size());
            size_t done = 0;
            while (done < out.size()) {
                const int n = static_cast<int>(std::min(out.size() - done, EXPAND_BLOCK));
                int written = 0;
                if (1 != EVP_EncryptUpdate(ctx_.get(), u8ptr(out.data() + done), &written, u8ptr(out.data() + done), n) || written != n) {
                    throw std::system_error(make_error_code(Error::CipherFailure), "expand");
                }
                done += static_cast<size_t>(n);
            }
        }

    private:
        CipherCtx ctx_;
    };

} // namespace

std::vector<Byte> expand(const Hash& seed, size_t len)
{
    std::vector<Byte> out(len);
    Keystream(seed).fill(out);
    return out;
}

Hash expand_digest(const Hash& seed, size_t len)
{
    Keystream stream(seed);
    Sha256 digest;
    std::vector<Byte> block(std::min(len, EXPAND_BLOCK));
    for (size_t done = 0; done < len;) {
        const size_t n = std::min(len - done, block.size());
        MutableBytesSpan part { block.data(), n };
        stream.fill(part);
        digest.update(BytesSpan { part });
        done += n;
    }
    auto h = digest.finish();
    if (!h) {
        throw std::system_error(h.error(), "expand digest");
    }
    return *h;
}

} // namespace TaoMap::Crypto::Random
