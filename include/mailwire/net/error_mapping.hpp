/*

error_mapping.hpp
-----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

Mapping between Asio error codes and mailwire::errc for network I/O.

*/

#pragma once

#include <string>
#include <string_view>
#include <system_error>

#include <mailwire/detail/asio_decl.hpp>
#include <mailwire/detail/error_detail.hpp>
#include <mailwire/detail/result.hpp>

namespace mailwire::net
{

enum class io_stage
{
    resolve,
    connect,
    read,
    write,
    handshake
};

[[nodiscard]] constexpr std::string_view stage_name(io_stage stage) noexcept
{
    switch (stage)
    {
        case io_stage::resolve: return "resolve";
        case io_stage::connect: return "connect";
        case io_stage::read: return "read";
        case io_stage::write: return "write";
        case io_stage::handshake: return "handshake";
    }
    return "unknown";
}

[[nodiscard]] inline errc map_net_error(io_stage stage, std::error_code ec, bool timeout_triggered) noexcept
{
    if (timeout_triggered || ec == mailwire::asio::error::timed_out)
        return errc::net_timeout;
    if (ec == mailwire::asio::error::operation_aborted)
        return errc::net_cancelled;
    if (ec == mailwire::asio::error::eof)
        return errc::net_eof;
    if (ec == mailwire::asio::error::connection_refused)
        return errc::net_connection_refused;
    if (ec == mailwire::asio::error::connection_reset ||
        ec == mailwire::asio::error::broken_pipe)
        return errc::net_connection_reset;
    if (ec == mailwire::asio::error::host_not_found ||
        ec == mailwire::asio::error::host_not_found_try_again)
        return errc::net_resolve_failed;

    switch (stage)
    {
        case io_stage::resolve: return errc::net_resolve_failed;
        case io_stage::connect: return errc::net_connect_failed;
        case io_stage::read: return errc::net_io_failed;
        case io_stage::write: return errc::net_io_failed;
        case io_stage::handshake: return errc::tls_handshake_failed;
    }
    return errc::net_io_failed;
}

[[nodiscard]] inline detail::error_detail make_net_detail(
    std::string_view proto,
    std::string_view host,
    std::string_view service,
    io_stage stage,
    std::string_view op)
{
    detail::error_detail info;
    info.add("proto", proto);
    info.add("host", host);
    info.add("service", service);
    info.add("stage", stage_name(stage));
    info.add("op", op);
    return info;
}

/**
Building the error value of a failed network operation.

@param stage   Stage the operation was in.
@param ec      Asio error code.
@param timeout True when the operation was cut by a timer.
@param message Human readable summary.
@param detail  Structured detail, usually from `make_net_detail`.
**/
[[nodiscard]] inline error_info error_from_asio(io_stage stage, const mailwire::asio::error_code& ec, bool timeout,
    std::string message, std::string detail = {})
{
    const std::error_code sys = ec;
    return error_info{map_net_error(stage, sys, timeout), std::move(message), std::move(detail), sys, 0};
}

} // namespace mailwire::net
