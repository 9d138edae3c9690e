/*

dialog.hpp
----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <mailwire/detail/asio_decl.hpp>
#include <mailwire/detail/log.hpp>
#include <mailwire/detail/redact.hpp>
#include <mailwire/detail/result.hpp>
#include <mailwire/net/error_mapping.hpp>

namespace mailwire
{
namespace net
{

/// Default maximum line length: RFC 5321 allows 512 for replies, servers commonly send more.
inline constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 8192;

/// Absolute maximum line length to prevent excessive memory allocation (1 MB)
inline constexpr std::size_t MAX_ALLOWED_LINE_LENGTH = 1024 * 1024;

/**
Dealing with network in a line oriented fashion.
Wraps a Boost.Asio stream (socket, ssl stream, upgradable stream).

Every operation is bounded by the optional timeout; errors are mapped to `errc` by I/O stage.
**/
template<typename Stream>
class dialog
{
public:
    using duration = std::chrono::steady_clock::duration;

    explicit dialog(Stream stream, std::size_t max_line_length = DEFAULT_MAX_LINE_LENGTH,
        std::optional<duration> timeout = std::nullopt)
        : stream_(std::move(stream)), max_line_length_(std::min(max_line_length, MAX_ALLOWED_LINE_LENGTH)),
        timeout_(timeout)
    {
    }

    void set_trace_protocol(std::string protocol)
    {
        trace_protocol_ = std::move(protocol);
    }

    void set_trace_redaction(bool enabled) noexcept
    {
        redact_secrets_in_trace_ = enabled;
    }

    /**
    Sending a line, CRLF is added when missing.

    @param line Line to send.
    @return     Error on write failure or timeout.
    **/
    mailwire::asio::awaitable<result<void>> write_line(std::string_view line)
    {
        std::string payload = normalize_line(line);
        trace_line(log::direction::send, payload);
        co_return co_await write_payload(std::move(payload));
    }

    /**
    Announcing a payload of the given size in the protocol trace; the bytes themselves are not traced.
    **/
    void trace_payload(std::size_t size) const
    {
        if (log::logger::instance().is_trace_enabled())
            log::logger::instance().trace_protocol(trace_protocol_, log::direction::send,
                std::format("<{} bytes of message data>", size));
    }

    /**
    Sending raw bytes, e.g. one chunk of a DATA payload, under a timeout of its own.

    @param data Bytes to send as they are.
    **/
    mailwire::asio::awaitable<result<void>> write_raw(std::string data)
    {
        co_return co_await write_payload(std::move(data));
    }

    /**
    Receiving one line without its terminator.

    @return Line, or an error when the peer closes, the timer fires or the line is too long.
    **/
    mailwire::asio::awaitable<result<std::string>> read_line()
    {
        while (true)
        {
            const auto pos = read_buffer_.find('\n');
            if (pos != std::string::npos)
            {
                const std::size_t line_length = (pos > 0 && read_buffer_[pos - 1] == '\r') ? pos - 1 : pos;
                if (line_length > max_line_length_)
                    co_return line_too_long();
                std::string line = read_buffer_.substr(0, line_length);
                read_buffer_.erase(0, pos + 1);
                trace_line(log::direction::receive, line);
                co_return line;
            }
            if (read_buffer_.size() > max_line_length_ + 1)
                co_return line_too_long();

            const std::size_t max_size = max_line_length_ + 2;
            auto [ec, n] = co_await async_with_timeout<void(mailwire::asio::error_code, std::size_t)>(
                [this, max_size](auto handler) mutable
                {
                    auto buffer = mailwire::asio::dynamic_buffer(read_buffer_, max_size);
                    mailwire::asio::async_read_until(stream_, buffer, '\n', std::move(handler));
                }, mailwire::asio::use_nothrow_awaitable);
            if (ec == mailwire::asio::error::not_found)
                co_return line_too_long();
            if (ec)
                co_return std::unexpected(error_from_asio(io_stage::read, ec, ec == mailwire::asio::error::timed_out,
                    "Network read failed.", make_net_detail(trace_protocol_, {}, {}, io_stage::read, "read_line").add_ec("error", ec).str()));
        }
    }

    /**
    Checking for bytes the peer sent before we asked for them.
    **/
    [[nodiscard]] bool has_buffered_input() const noexcept
    {
        return !read_buffer_.empty();
    }

    void clear_buffered_input() noexcept
    {
        read_buffer_.clear();
    }

    template<typename Signature, typename Initiation, typename CompletionToken>
    auto async_with_timeout(Initiation initiation, CompletionToken&& token)
    {
        if (timeout_.has_value())
            return async_with_timeout<Signature>(*timeout_, std::move(initiation), std::forward<CompletionToken>(token));

        return mailwire::asio::async_compose<CompletionToken, Signature>(
            [initiation = std::move(initiation), started = false](auto& self, mailwire::asio::error_code ec = {},
                auto... results) mutable
            {
                if (!started)
                {
                    started = true;
                    initiation(std::move(self));
                    return;
                }
                self.complete(ec, std::move(results)...);
            }, token, stream_);
    }

    /// Runs the operation with a timer that cancels the socket; a cut operation reports `timed_out`.
    template<typename Signature, typename Initiation, typename CompletionToken>
    auto async_with_timeout(duration timeout, Initiation initiation, CompletionToken&& token)
    {
        struct timeout_state
        {
            std::atomic_bool timed_out{false};
        };

        return mailwire::asio::async_compose<CompletionToken, Signature>(
            [this, initiation = std::move(initiation), timeout, state = std::make_shared<timeout_state>(),
                timer = std::shared_ptr<mailwire::asio::steady_timer>(),
                started = false](auto& self, mailwire::asio::error_code ec = {}, auto... results) mutable
            {
                if (!started)
                {
                    started = true;
                    timer = std::make_shared<mailwire::asio::steady_timer>(stream_.get_executor());
                    timer->expires_after(timeout);
                    timer->async_wait([this, state](mailwire::asio::error_code timer_ec)
                    {
                        if (timer_ec)
                            return;
                        state->timed_out.store(true);
                        mailwire::asio::error_code ignore_ec;
                        mailwire::asio::get_lowest_layer(stream_).cancel(ignore_ec);
                    });
                    initiation(std::move(self));
                    return;
                }
                if (timer)
                    timer->cancel();
                if (state->timed_out.load() && ec == mailwire::asio::error::operation_aborted)
                    ec = mailwire::asio::error::timed_out;
                self.complete(ec, std::move(results)...);
            }, token, stream_);
    }

    [[nodiscard]] Stream& stream() noexcept { return stream_; }
    [[nodiscard]] const Stream& stream() const noexcept { return stream_; }

    void max_line_length(std::size_t value) noexcept { max_line_length_ = std::min(value, MAX_ALLOWED_LINE_LENGTH); }
    [[nodiscard]] std::size_t max_line_length() const noexcept { return max_line_length_; }

    void timeout(std::optional<duration> value) noexcept { timeout_ = value; }
    [[nodiscard]] std::optional<duration> timeout() const noexcept { return timeout_; }

private:
    static std::string normalize_line(std::string_view line)
    {
        std::string out(line);
        if (out.ends_with("\r\n"))
            return out;
        if (out.ends_with('\n'))
            out.pop_back();
        if (out.ends_with('\r'))
            out.pop_back();
        out += "\r\n";
        return out;
    }

    mailwire::asio::awaitable<result<void>> write_payload(std::string payload)
    {
        auto [ec, n] = co_await async_with_timeout<void(mailwire::asio::error_code, std::size_t)>(
            [this, &payload](auto handler) mutable
            {
                mailwire::asio::async_write(stream_, mailwire::asio::buffer(payload), std::move(handler));
            }, mailwire::asio::use_nothrow_awaitable);
        if (ec)
            co_return std::unexpected(error_from_asio(io_stage::write, ec, ec == mailwire::asio::error::timed_out,
                "Network write failed.", make_net_detail(trace_protocol_, {}, {}, io_stage::write, "write").add_ec("error", ec).str()));
        co_return ok();
    }

    result<std::string> line_too_long()
    {
        read_buffer_.clear();
        detail::error_detail info;
        info.add("proto", trace_protocol_).add_int("max_line_length", static_cast<std::int64_t>(max_line_length_));
        return fail<std::string>(errc::smtp_bad_reply, "Line exceeds the maximum length.", info.str());
    }

    void trace_line(log::direction dir, std::string_view data) const
    {
        auto& logger = log::logger::instance();
        if (!logger.is_trace_enabled())
            return;
        if (dir == log::direction::send && redact_secrets_in_trace_)
        {
            logger.trace_protocol(trace_protocol_, dir, detail::redact_line(data));
            return;
        }
        logger.trace_protocol(trace_protocol_, dir, data);
    }

    Stream stream_;
    std::string read_buffer_;
    std::size_t max_line_length_;
    std::optional<duration> timeout_;

    std::string trace_protocol_{"NET"};
    bool redact_secrets_in_trace_{true};
};

} // namespace net
} // namespace mailwire
