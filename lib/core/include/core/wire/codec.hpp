#pragma once

#include "core/wire/messages.hpp"
#include <cstddef>
#include <expected>
#include <system_error>
#include <vector>

namespace TaoMap::Core::Wire {

// le32(body length) || u8(type)
constexpr size_t FRAME_HEADER_SIZE = 5;

/// ProbeResponse 的 body 中 payload 之外的部分：round(8) + fingerprint(32) + length(8)
constexpr size_t PROBE_RESPONSE_OVERHEAD = 8 + 32 + 8;

struct FrameHeader {
    MessageType type;
    std::uint32_t body_length;
};

[[nodiscard]] std::vector<Byte> encode(const Message& msg);

[[nodiscard]]
auto parse_header(BytesSpan header, size_t max_body)
    -> std::expected<FrameHeader, std::error_code>;

[[nodiscard]]
auto decode_body(MessageType type, BytesSpan body)
    -> std::expected<Message, std::error_code>;

/// Decodes one complete frame (header + body).
[[nodiscard]]
auto decode(BytesSpan frame, size_t max_body)
    -> std::expected<Message, std::error_code>;

} // namespace TaoMap::Core::Wire
