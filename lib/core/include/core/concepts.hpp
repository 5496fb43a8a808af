#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <concepts>
#include <type_traits>

namespace TaoMap::Core {

namespace net = boost::asio;

// --- net::awaitable 只能在 asio 协程里 co_await，所以不走 std 的 Awaiter 检查 ---
template <typename T>
struct awaitable_traits : std::false_type { };

template <typename T, typename Executor>
struct awaitable_traits<net::awaitable<T, Executor>> : std::true_type {
    using value_type = T;
};

template <typename T>
concept Awaitable = awaitable_traits<std::remove_cvref_t<T>>::value;

template <typename T, typename U>
concept AwaitableOf = Awaitable<T> && std::convertible_to<typename awaitable_traits<std::remove_cvref_t<T>>::value_type, U>;

} // namespace TaoMap::Core
