#pragma once

#include "core/common.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <cstddef>

namespace TaoMap::Core {

/**
 * @brief Joins a set of spawned coroutines, with a deadline.
 *
 * Not thread-safe: add/done/wait_until must run on the same strand.
 */
class WaitGroup {
public:
    explicit WaitGroup(boost::asio::any_io_executor ex)
        : timer_(std::move(ex), TimePoint::max())
    {
    }

    void add(std::size_t n = 1) { pending_ += n; }

    void done()
    {
        if (pending_ > 0 && --pending_ == 0) {
            timer_.cancel();
        }
    }

    [[nodiscard]] std::size_t pending() const { return pending_; }

    // wait_until 提前返回 true，剩下的任务不再等待
    void release()
    {
        released_ = true;
        timer_.cancel();
    }

    [[nodiscard]] bool released() const { return released_; }

    // true when every task finished or release() was called, false when the deadline came first
    boost::asio::awaitable<bool> wait_until(TimePoint deadline)
    {
        while (pending_ > 0 && !released_) {
            if (Clock::now() >= deadline) {
                co_return false;
            }
            timer_.expires_at(deadline);
            boost::system::error_code ec;
            co_await timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
        co_return true;
    }

private:
    boost::asio::steady_timer timer_;
    std::size_t pending_ = 0;
    bool released_ = false;
};

} // namespace TaoMap::Core
