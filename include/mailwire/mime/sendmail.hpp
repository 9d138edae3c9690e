/*

sendmail.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <chrono>
#include <filesystem>
#include <format>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include <pthread.h>
#include <signal.h>
#include <time.h>

#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/write.hpp>
#include <boost/process/args.hpp>
#include <boost/process/async_pipe.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exception.hpp>
#include <boost/process/io.hpp>

#include <mailwire/detail/error_detail.hpp>
#include <mailwire/detail/log.hpp>
#include <mailwire/detail/result.hpp>
#include <mailwire/mime/message.hpp>

namespace mailwire::mime
{

/**
Local delivery through the sendmail binary.
**/
struct sendmail_options
{
    std::filesystem::path path{"/usr/sbin/sendmail"};

    /// Appended after `-oi -t`.
    std::vector<std::string> args;

    std::chrono::milliseconds timeout{std::chrono::seconds(5)};
};


/**
Piping the serialized message to `sendmail -oi -t`.

Recipients are taken from the headers by sendmail itself.

@param msg     Message to deliver.
@param options Binary path, extra arguments and timeout.
@return        Error `errc::sendmail_failed` on spawn failure, timeout, output on stderr or a
               non-zero exit status.
**/
namespace detail
{

/**
Blocking SIGPIPE on the calling thread, so a write to a pipe whose reader is gone fails with
EPIPE. A SIGPIPE raised while blocked is consumed before the old mask comes back.
**/
class sigpipe_block
{
public:
    sigpipe_block()
    {
        sigemptyset(&pipe_set_);
        sigaddset(&pipe_set_, SIGPIPE);
        sigset_t pending;
        sigemptyset(&pending);
        sigpending(&pending);
        was_pending_ = sigismember(&pending, SIGPIPE) == 1;
        blocked_ = pthread_sigmask(SIG_BLOCK, &pipe_set_, &old_mask_) == 0;
    }

    sigpipe_block(const sigpipe_block&) = delete;
    sigpipe_block& operator=(const sigpipe_block&) = delete;

    ~sigpipe_block()
    {
        if (!blocked_)
            return;
        if (!was_pending_)
        {
            const timespec zero{0, 0};
            while (sigtimedwait(&pipe_set_, nullptr, &zero) == SIGPIPE)
                ;
        }
        pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
    }

private:
    sigset_t pipe_set_{};
    sigset_t old_mask_{};
    bool was_pending_{false};
    bool blocked_{false};
};

} // namespace detail


/**
Piping the serialized message to `sendmail -oi -t`.

Recipients are taken from the headers by sendmail itself. Feeding stdin, draining stderr and the
timeout run together on a private `io_context`, so a child that stops reading or exits early
cannot block or signal the caller.

@param msg     Message to deliver.
@param options Binary path, extra arguments and timeout.
@return        Error `errc::sendmail_failed` on spawn failure, timeout, a closed stdin, output on
               stderr or a non-zero exit status.
**/
inline result<void> write_to_sendmail(message& msg, const sendmail_options& options = {})
{
    namespace bp = boost::process;
    using boost::system::error_code;

    std::string payload;
    MAILWIRE_TRY_ASSIGN(payload, msg.to_string());

    std::vector<std::string> args{"-oi", "-t"};
    args.insert(args.end(), options.args.begin(), options.args.end());

    boost::asio::io_context ctx;
    std::optional<bp::async_pipe> input;
    std::optional<bp::async_pipe> errors;
    try
    {
        input.emplace(ctx);
        errors.emplace(ctx);
    }
    catch (const bp::process_error& exc)
    {
        return fail(errc::sendmail_failed, "Cannot create the sendmail pipes.", {}, exc.code());
    }

    std::error_code ec;
    bp::child proc(options.path.string(), bp::args(args), bp::std_in < *input, bp::std_out > bp::null,
        bp::std_err > *errors, ec);
    if (ec)
    {
        detail::error_detail info;
        info.add("path", options.path.string());
        return fail(errc::sendmail_failed, "Cannot start sendmail.", info.str(), ec);
    }
    MAILWIRE_DEBUG(std::format("sendmail: piping {} bytes to {}", payload.size(), options.path.string()));

    detail::sigpipe_block no_sigpipe;
    boost::asio::steady_timer deadline(ctx, options.timeout);
    error_code write_ec;
    std::string stderr_text;
    int pending = 2;
    bool timed_out = false;

    const auto finished = [&]
    {
        if (--pending == 0)
            deadline.cancel();
    };
    boost::asio::async_write(*input, boost::asio::buffer(payload),
        [&](const error_code& res, std::size_t)
        {
            write_ec = res;
            error_code ignored;
            input->close(ignored);
            finished();
        });
    boost::asio::async_read(*errors, boost::asio::dynamic_buffer(stderr_text),
        [&](const error_code&, std::size_t)
        {
            finished();
        });
    deadline.async_wait(
        [&](const error_code& res)
        {
            if (res)
                return;
            timed_out = true;
            std::error_code kill_ec;
            proc.terminate(kill_ec);
            error_code ignored;
            input->close(ignored);
            errors->close(ignored);
        });
    ctx.run();

    if (timed_out)
        return fail(errc::sendmail_failed, std::format("sendmail did not finish within {}.", options.timeout));

    if (!proc.wait_for(options.timeout, ec) || ec)
    {
        std::error_code kill_ec;
        proc.terminate(kill_ec);
        if (ec)
            return fail(errc::sendmail_failed, "Waiting for sendmail failed.", {}, ec);
        return fail(errc::sendmail_failed, "sendmail closed its pipes but did not exit.");
    }

    const int status = proc.exit_code();
    if (write_ec)
    {
        detail::error_detail info;
        info.add("path", options.path.string()).add_int("exit_code", status).add("stderr", stderr_text);
        return fail(errc::sendmail_failed, "sendmail did not read the whole message.", info.str(),
            std::error_code(write_ec.value(), std::system_category()));
    }
    if (!stderr_text.empty() || status != 0)
    {
        detail::error_detail info;
        info.add("path", options.path.string()).add_int("exit_code", status).add("stderr", stderr_text);
        return fail(errc::sendmail_failed, std::format("sendmail exited with status {}.", status), info.str());
    }

    msg.record_delivery(delivery_state::delivered);
    return ok();
}

} // namespace mailwire::mime
