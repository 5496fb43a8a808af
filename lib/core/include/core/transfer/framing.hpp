#pragma once

#include "core/wire/codec.hpp"
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <expected>
#include <system_error>

namespace TaoMap::Core::Framing {

using tcp = boost::asio::ip::tcp;

/**
 * Reads one frame. IO failures (including a closed peer) come back as
 * Unreachable, bad headers as FrameTooLarge / Malformed.
 */
boost::asio::awaitable<std::expected<Wire::Message, std::error_code>>
read_message(tcp::socket& socket, size_t max_body);

boost::asio::awaitable<std::error_code>
write_message(tcp::socket& socket, const Wire::Message& msg);

// 已经编码好的帧
boost::asio::awaitable<std::error_code>
write_frame(tcp::socket& socket, BytesSpan frame);

} // namespace TaoMap::Core::Framing
