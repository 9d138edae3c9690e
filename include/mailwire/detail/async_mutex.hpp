/*

async_mutex.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <deque>
#include <memory>
#include <mutex>
#include <utility>

#include <mailwire/detail/asio_decl.hpp>
#include <mailwire/detail/result.hpp>

namespace mailwire::detail
{

/**
FIFO mutex for coroutines. Waiters park on a timer that never expires and are woken by
cancelling it; ownership is handed over directly so no waiter can be overtaken.
**/
class async_mutex
{
public:
    class scoped_lock
    {
    public:
        scoped_lock() noexcept = default;

        scoped_lock(const scoped_lock&) = delete;
        scoped_lock& operator=(const scoped_lock&) = delete;

        scoped_lock(scoped_lock&& other) noexcept
            : mutex_(std::exchange(other.mutex_, nullptr))
        {
        }

        scoped_lock& operator=(scoped_lock&& other) noexcept
        {
            if (this != &other)
            {
                unlock();
                mutex_ = std::exchange(other.mutex_, nullptr);
            }
            return *this;
        }

        ~scoped_lock()
        {
            unlock();
        }

        [[nodiscard]] bool owns_lock() const noexcept
        {
            return mutex_ != nullptr;
        }

    private:
        friend class async_mutex;

        explicit scoped_lock(async_mutex& mutex) noexcept
            : mutex_(&mutex)
        {
        }

        void unlock() noexcept
        {
            if (mutex_ != nullptr)
            {
                mutex_->unlock();
                mutex_ = nullptr;
            }
        }

        async_mutex* mutex_{nullptr};
    };

    explicit async_mutex(mailwire::asio::any_io_executor executor)
        : executor_(std::move(executor))
    {
    }

    async_mutex(const async_mutex&) = delete;
    async_mutex& operator=(const async_mutex&) = delete;

    /// Lock asynchronously; a cancelled wait yields errc::net_cancelled.
    mailwire::asio::awaitable<result<scoped_lock>> lock()
    {
        auto waiter = std::make_shared<waiter_t>(executor_);
        {
            std::lock_guard<std::mutex> guard(waiters_mutex_);
            if (!locked_)
            {
                locked_ = true;
                co_return scoped_lock(*this);
            }
            waiter->timer.expires_at(mailwire::asio::steady_timer::time_point::max());
            waiters_.push_back(waiter);
        }

        auto [ec] = co_await waiter->timer.async_wait(mailwire::asio::use_nothrow_awaitable);

        std::lock_guard<std::mutex> guard(waiters_mutex_);
        if (waiter->ready)
            co_return scoped_lock(*this);

        auto it = std::find(waiters_.begin(), waiters_.end(), waiter);
        if (it != waiters_.end())
            waiters_.erase(it);
        co_return fail<scoped_lock>(errc::net_cancelled, "Waiting for the connection lock was cancelled.", {}, ec);
    }

    [[nodiscard]] bool is_locked() const
    {
        std::lock_guard<std::mutex> guard(waiters_mutex_);
        return locked_;
    }

private:
    struct waiter_t
    {
        explicit waiter_t(mailwire::asio::any_io_executor executor)
            : timer(std::move(executor))
        {
        }

        mailwire::asio::steady_timer timer;
        bool ready{false};
    };

    void unlock() noexcept
    {
        std::lock_guard<std::mutex> guard(waiters_mutex_);
        if (waiters_.empty())
        {
            locked_ = false;
            return;
        }

        // Ownership passes to the front waiter; locked_ stays true.
        auto waiter = waiters_.front();
        waiters_.pop_front();
        waiter->ready = true;
        waiter->timer.cancel();
    }

    mailwire::asio::any_io_executor executor_;
    mutable std::mutex waiters_mutex_;
    bool locked_{false};
    std::deque<std::shared_ptr<waiter_t>> waiters_;
};

} // namespace mailwire::detail
