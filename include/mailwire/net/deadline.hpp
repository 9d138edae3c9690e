/*

deadline.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

#include <mailwire/detail/asio_decl.hpp>

namespace mailwire::net
{

/**
Timer bound to a scope: when it fires before the scope ends, the expiry action cancels the
pending operation (closing a socket, cancelling a resolver). Leaving the scope disarms it.
**/
class deadline
{
public:
    using duration = std::chrono::steady_clock::duration;

    deadline(mailwire::asio::any_io_executor executor, std::optional<duration> timeout, std::function<void()> on_expire)
        : timer_(std::move(executor)), state_(std::make_shared<state>())
    {
        if (!timeout.has_value())
            return;
        timer_.expires_after(*timeout);
        timer_.async_wait([state = state_, action = std::move(on_expire)](mailwire::asio::error_code ec)
        {
            if (ec || !state->armed)
                return;
            state->expired = true;
            action();
        });
    }

    deadline(const deadline&) = delete;
    deadline& operator=(const deadline&) = delete;

    ~deadline()
    {
        state_->armed = false;
        timer_.cancel();
    }

    [[nodiscard]] bool expired() const noexcept
    {
        return state_->expired;
    }

private:
    struct state
    {
        bool armed{true};
        bool expired{false};
    };

    mailwire::asio::steady_timer timer_;
    std::shared_ptr<state> state_;
};

} // namespace mailwire::net
