/*

smtp_insecure_local_dev.cpp
---------------------------

Local dev SMTP example with relaxed security settings.
DEV ONLY: do not use these settings in production.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <mailwire/detail/log.hpp>
#include <mailwire/mime/message.hpp>
#include <mailwire/smtp/client.hpp>
#include "example_util.hpp"


using mailwire::mime::message;
using mailwire::smtp::client;


int main()
{
    // Protocol trace on stderr, secrets redacted.
    mailwire::log::logger::instance().set_level(mailwire::log::level::trace);
    mailwire::log::logger::instance().set_trace_enabled(true);

    boost::asio::io_context io_ctx;

    boost::asio::co_spawn(io_ctx,
        [&]() -> boost::asio::awaitable<void>
        {
            message msg;
            if (auto res = msg.set_from("dev@example.test"); !res)
            {
                print_error(res.error());
                co_return;
            }
            if (auto res = msg.add_to("dev@example.test"); !res)
            {
                print_error(res.error());
                co_return;
            }
            msg.set_subject("local dev smtp");
            msg.set_body("text/plain", "Hello from local dev.");

            mailwire::smtp::options options;
            options.host = "localhost";
            options.port = 1025;
            options.tls_policy = mailwire::net::tls_policy::opportunistic;
            options.tls.verify = mailwire::net::verify_mode::none; // DEV ONLY: disable cert checks.
            options.allow_cleartext_auth = true; // DEV ONLY: allow auth without TLS.
            // modify username/password to use real credentials if needed
            options.credentials.username = "user";
            options.credentials.password = "pass";
            options.mechanism = mailwire::sasl::mechanism::login;

            client conn(io_ctx.get_executor(), options);
            if (auto res = co_await conn.dial(); !res)
            {
                print_error(res.error());
                co_return;
            }
            if (auto res = co_await conn.send(msg); !res)
                print_error(res.error());
            if (auto res = co_await conn.close(); !res)
                print_error(res.error());
            co_return;
        },
        boost::asio::detached);

    io_ctx.run();
    return EXIT_SUCCESS;
}
