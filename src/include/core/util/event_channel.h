#pragma once

#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <deque>
#include <optional>

namespace castscout {

/**
 * @brief Single-consumer event queue for coroutines running on one io_context.
 *
 * @details Push() and Close() must be called from the io_context's thread (post to it
 * from elsewhere). Receive() suspends until an event arrives or the channel is closed;
 * once closed it yields std::nullopt and pending events are dropped.
 */
template<typename T>
class EventChannel {
public:
    explicit EventChannel(boost::asio::io_context& ioc)
        : signal_(ioc) {
        signal_.expires_at(boost::asio::steady_timer::time_point::max());
    }

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    void Push(T event) {
        if (closed_) {
            return;
        }
        events_.push_back(std::move(event));
        signal_.cancel_one();
    }

    void Close() {
        closed_ = true;
        events_.clear();
        signal_.cancel();
    }

    bool IsClosed() const { return closed_; }

    boost::asio::awaitable<std::optional<T>> Receive() {
        while (events_.empty() && !closed_) {
            boost::system::error_code ec;
            co_await signal_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
        if (closed_) {
            co_return std::nullopt;
        }
        T event = std::move(events_.front());
        events_.pop_front();
        co_return event;
    }

private:
    boost::asio::steady_timer signal_;
    std::deque<T> events_;
    bool closed_{false};
};

} // namespace castscout
