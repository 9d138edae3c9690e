/*

tls_trust_store.hpp
-------------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/

#pragma once

#include <mailwire/detail/asio_decl.hpp>
#include <mailwire/detail/error_detail.hpp>
#include <mailwire/detail/result.hpp>
#include <mailwire/net/tls_options.hpp>

namespace mailwire::net
{

/**
Loading the trusted CAs and the protocol floor into a context.
**/
inline result<void> configure_context(mailwire::asio::ssl::context& ctx, const tls_options& options)
{
    mailwire::asio::error_code ec;
    if (options.use_default_verify_paths)
    {
        ctx.set_default_verify_paths(ec);
        if (ec)
            return fail(errc::tls_verify_failed, "TLS trust store configuration failed.", ec.message(), ec);
    }

    for (const auto& file : options.ca_files)
    {
        if (file.empty())
            continue;
        ctx.load_verify_file(file, ec);
        if (ec)
        {
            detail::error_detail info;
            info.add("ca_file", file).add_ec("error", ec);
            return fail(errc::tls_verify_failed, "Cannot load CA file.", info.str(), ec);
        }
    }

    for (const auto& path : options.ca_paths)
    {
        if (path.empty())
            continue;
        ctx.add_verify_path(path, ec);
        if (ec)
        {
            detail::error_detail info;
            info.add("ca_path", path).add_ec("error", ec);
            return fail(errc::tls_verify_failed, "Cannot add CA path.", info.str(), ec);
        }
    }

    if (options.min_tls_version && SSL_CTX_set_min_proto_version(ctx.native_handle(), *options.min_tls_version) != 1)
        return fail(errc::tls_handshake_failed, "Cannot set the minimum TLS version.");
    if (!options.cipher_list.empty() && SSL_CTX_set_cipher_list(ctx.native_handle(), options.cipher_list.c_str()) != 1)
        return fail(errc::tls_handshake_failed, "Invalid TLS cipher list.");

    ctx.set_verify_mode(options.verify == verify_mode::peer ? mailwire::asio::ssl::verify_peer : mailwire::asio::ssl::verify_none, ec);
    if (ec)
        return fail(errc::tls_verify_failed, "Cannot set the TLS verify mode.", ec.message(), ec);
    return ok();
}

} // namespace mailwire::net
