#include "core/transfer/framing.hpp"
#include "core/error.hpp"

#include <array>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <vector>

namespace TaoMap::Core::Framing {

namespace net = boost::asio;

net::awaitable<std::expected<Wire::Message, std::error_code>>
read_message(tcp::socket& socket, size_t max_body)
{
    std::array<Byte, Wire::FRAME_HEADER_SIZE> header {};
    boost::system::error_code ec;
    co_await net::async_read(socket, net::buffer(header), net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(make_error_code(Error::Unreachable));
    }

    auto parsed = Wire::parse_header(header, max_body);
    if (!parsed) {
        co_return std::unexpected(parsed.error());
    }

    std::vector<Byte> body(parsed->body_length);
    if (!body.empty()) {
        co_await net::async_read(socket, net::buffer(body), net::redirect_error(net::use_awaitable, ec));
        if (ec) {
            co_return std::unexpected(make_error_code(Error::Unreachable));
        }
    }
    co_return Wire::decode_body(parsed->type, body);
}

net::awaitable<std::error_code> write_frame(tcp::socket& socket, BytesSpan frame)
{
    boost::system::error_code ec;
    co_await net::async_write(socket, net::buffer(frame.data(), frame.size()), net::redirect_error(net::use_awaitable, ec));
    if (ec) {
        co_return make_error_code(Error::Unreachable);
    }
    co_return std::error_code {};
}

net::awaitable<std::error_code> write_message(tcp::socket& socket, const Wire::Message& msg)
{
    auto frame = Wire::encode(msg);
    co_return co_await write_frame(socket, frame);
}

} // namespace TaoMap::Core::Framing
