#include "core/wire/codec.hpp"
#include "core/error.hpp"
#include <cstring>
#include <limits>
#include <type_traits>

namespace TaoMap::Core::Wire {

using Crypto::Utils::read_u32_le;
using Crypto::Utils::read_u64_le;
using Crypto::Utils::write_u32_le;
using Crypto::Utils::write_u64_le;

namespace {

    class Writer {
    public:
        explicit Writer(MessageType type)
        {
            buf_.resize(FRAME_HEADER_SIZE);
            buf_[4] = static_cast<Byte>(type);
        }

        void u8(Byte v) { buf_.push_back(v); }

        void u32(std::uint32_t v)
        {
            auto at = grow(4);
            write_u32_le(buf_.data() + at, v);
        }

        void u64(std::uint64_t v)
        {
            auto at = grow(8);
            write_u64_le(buf_.data() + at, v);
        }

        void hash(const Hash& h) { buf_.insert(buf_.end(), h.begin(), h.end()); }

        void bytes32(BytesSpan data)
        {
            u32(static_cast<std::uint32_t>(data.size()));
            buf_.insert(buf_.end(), data.begin(), data.end());
        }

        void bytes64(BytesSpan data)
        {
            u64(data.size());
            buf_.insert(buf_.end(), data.begin(), data.end());
        }

        std::vector<Byte> finish() &&
        {
            write_u32_le(buf_.data(), static_cast<std::uint32_t>(buf_.size() - FRAME_HEADER_SIZE));
            return std::move(buf_);
        }

    private:
        size_t grow(size_t n)
        {
            size_t at = buf_.size();
            buf_.resize(at + n);
            return at;
        }

        std::vector<Byte> buf_;
    };

    // 任何越界读取都会让 reader 进入失败状态，最后统一检查
    class Reader {
    public:
        explicit Reader(BytesSpan data)
            : data_(data)
        {
        }

        Byte u8()
        {
            if (!take(1))
                return 0;
            return data_[pos_ - 1];
        }

        std::uint32_t u32()
        {
            if (!take(4))
                return 0;
            return read_u32_le(data_.data() + pos_ - 4);
        }

        std::uint64_t u64()
        {
            if (!take(8))
                return 0;
            return read_u64_le(data_.data() + pos_ - 8);
        }

        Hash hash()
        {
            Hash h {};
            if (take(h.size())) {
                std::memcpy(h.data(), data_.data() + pos_ - h.size(), h.size());
            }
            return h;
        }

        std::vector<Byte> bytes(std::uint64_t len)
        {
            if (len > remaining()) {
                ok_ = false;
                return {};
            }
            take(static_cast<size_t>(len));
            auto start = data_.begin() + static_cast<std::ptrdiff_t>(pos_ - len);
            return { start, start + static_cast<std::ptrdiff_t>(len) };
        }

        [[nodiscard]] size_t remaining() const { return data_.size() - pos_; }
        [[nodiscard]] bool ok() const { return ok_; }
        [[nodiscard]] bool at_end() const { return ok_ && pos_ == data_.size(); }

    private:
        bool take(size_t n)
        {
            if (!ok_ || n > remaining()) {
                ok_ = false;
                return false;
            }
            pos_ += n;
            return true;
        }

        BytesSpan data_;
        size_t pos_ = 0;
        bool ok_ = true;
    };

    std::vector<Byte> encode_chunk(const ChunkMessage& m)
    {
        Writer w(MessageType::Chunk);
        w.u64(m.round_id);
        w.u32(static_cast<std::uint32_t>(m.sender));
        w.u32(m.chunk.index);
        w.u32(m.chunk.total);
        w.hash(m.chunk.fingerprint);
        w.u8(m.commitment ? 1 : 0);
        if (m.commitment) {
            w.hash(*m.commitment);
        }
        w.u32(static_cast<std::uint32_t>(m.proof.size()));
        for (const auto& h : m.proof) {
            w.hash(h);
        }
        w.bytes32(m.chunk.data);
        return std::move(w).finish();
    }

    std::vector<Byte> encode_ack(const AckMessage& m)
    {
        Writer w(MessageType::Ack);
        w.u64(m.round_id);
        w.u32(m.index);
        w.u8(static_cast<Byte>(m.status));
        return std::move(w).finish();
    }

    std::vector<Byte> encode_probe_request(const ProbeRequest& m)
    {
        Writer w(MessageType::ProbeRequest);
        w.u64(m.round_id);
        w.u64(m.declared_size);
        w.hash(m.nonce);
        return std::move(w).finish();
    }

    std::vector<Byte> encode_probe_response(const ProbeResponse& m)
    {
        Writer w(MessageType::ProbeResponse);
        w.u64(m.round_id);
        w.hash(m.fingerprint);
        w.bytes64(m.payload);
        return std::move(w).finish();
    }

    auto malformed() { return std::unexpected(make_error_code(Error::Malformed)); }

    auto decode_chunk(Reader& r) -> std::expected<Message, std::error_code>
    {
        ChunkMessage m;
        m.round_id = r.u64();
        m.sender = static_cast<MinerId>(r.u32());
        m.chunk.index = r.u32();
        m.chunk.total = r.u32();
        m.chunk.fingerprint = r.hash();
        Byte has_commitment = r.u8();
        if (has_commitment > 1)
            return malformed();
        if (has_commitment) {
            m.commitment = r.hash();
        }
        std::uint32_t proof_len = r.u32();
        // 每个 sibling 32 字节，先用剩余长度挡住离谱的计数
        if (!r.ok() || proof_len > r.remaining() / sizeof(Hash))
            return malformed();
        m.proof.reserve(proof_len);
        for (std::uint32_t i = 0; i < proof_len; ++i) {
            m.proof.push_back(r.hash());
        }
        std::uint32_t data_len = r.u32();
        m.chunk.data = r.bytes(data_len);
        if (!r.at_end() || m.chunk.total == 0 || m.chunk.index >= m.chunk.total)
            return malformed();
        return m;
    }

    auto decode_ack(Reader& r) -> std::expected<Message, std::error_code>
    {
        AckMessage m;
        m.round_id = r.u64();
        m.index = r.u32();
        Byte status = r.u8();
        if (!r.at_end() || status > static_cast<Byte>(AckStatus::Corrupt))
            return malformed();
        m.status = static_cast<AckStatus>(status);
        return m;
    }

    auto decode_probe_request(Reader& r) -> std::expected<Message, std::error_code>
    {
        ProbeRequest m;
        m.round_id = r.u64();
        m.declared_size = r.u64();
        m.nonce = r.hash();
        if (!r.at_end())
            return malformed();
        return m;
    }

    auto decode_probe_response(Reader& r) -> std::expected<Message, std::error_code>
    {
        ProbeResponse m;
        m.round_id = r.u64();
        m.fingerprint = r.hash();
        std::uint64_t len = r.u64();
        m.payload = r.bytes(len);
        if (!r.at_end())
            return malformed();
        return m;
    }

} // namespace

std::vector<Byte> encode(const Message& msg)
{
    return std::visit([](const auto& m) -> std::vector<Byte> {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ChunkMessage>) {
            return encode_chunk(m);
        } else if constexpr (std::is_same_v<T, AckMessage>) {
            return encode_ack(m);
        } else if constexpr (std::is_same_v<T, ProbeRequest>) {
            return encode_probe_request(m);
        } else {
            return encode_probe_response(m);
        }
    },
        msg);
}

auto parse_header(BytesSpan header, size_t max_body)
    -> std::expected<FrameHeader, std::error_code>
{
    if (header.size() < FRAME_HEADER_SIZE) {
        return malformed();
    }
    std::uint32_t len = read_u32_le(header.data());
    Byte type = header[4];
    if (type < static_cast<Byte>(MessageType::Chunk) || type > static_cast<Byte>(MessageType::ProbeResponse)) {
        return malformed();
    }
    if (len > max_body) {
        return std::unexpected(make_error_code(Error::FrameTooLarge));
    }
    return FrameHeader { .type = static_cast<MessageType>(type), .body_length = len };
}

auto decode_body(MessageType type, BytesSpan body)
    -> std::expected<Message, std::error_code>
{
    Reader r(body);
    switch (type) {
    case MessageType::Chunk:
        return decode_chunk(r);
    case MessageType::Ack:
        return decode_ack(r);
    case MessageType::ProbeRequest:
        return decode_probe_request(r);
    case MessageType::ProbeResponse:
        return decode_probe_response(r);
    }
    return malformed();
}

auto decode(BytesSpan frame, size_t max_body)
    -> std::expected<Message, std::error_code>
{
    auto header = parse_header(frame, max_body);
    if (!header) {
        return std::unexpected(header.error());
    }
    if (frame.size() - FRAME_HEADER_SIZE != header->body_length) {
        return malformed();
    }
    return decode_body(header->type, frame.subspan(FRAME_HEADER_SIZE));
}

} // namespace TaoMap::Core::Wire
