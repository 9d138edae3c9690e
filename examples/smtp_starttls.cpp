/*

smtp_starttls.cpp
-----------------

Sending a message on the submission port, upgrading with STARTTLS and authenticating with the
strongest mechanism the server offers.


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
#include <mailwire/mime/message.hpp>
#include <mailwire/smtp/client.hpp>
#include "example_util.hpp"


using mailwire::mime::message;
using mailwire::smtp::client;


boost::asio::awaitable<void> send_email(boost::asio::io_context& io_ctx)
{
    mailwire::smtp::options options;
    options.host = "smtp.gmail.com";
    options.port = mailwire::smtp::DEFAULT_SUBMISSION_PORT;
    options.tls_policy = mailwire::net::tls_policy::mandatory;
    options.credentials.username = "user@gmail.com";
    options.credentials.password = "password";

    message msg;
    if (auto res = msg.set_from_format("Sender", "user@gmail.com"); !res)
    {
        print_error(res.error());
        co_return;
    }
    if (auto res = msg.add_to("recipient@example.com"); !res)
    {
        print_error(res.error());
        co_return;
    }
    msg.set_subject("Test from mailwire");
    msg.set_body("text/plain", "Hello, World!");

    client conn(io_ctx.get_executor(), options);
    if (auto res = co_await conn.dial(); !res)
    {
        print_error(res.error());
        co_return;
    }
    std::cout << "Connected, TLS " << (conn.is_tls() ? "on" : "off");
    if (conn.auth_mechanism())
        std::cout << ", authenticated with " << mailwire::sasl::mechanism_name(*conn.auth_mechanism());
    std::cout << std::endl;

    if (auto res = co_await conn.send(msg); !res)
        print_error(res.error());
    else
        std::cout << "Email sent successfully!" << std::endl;

    if (auto res = co_await conn.close(); !res)
        print_error(res.error());
}

int main()
{
    boost::asio::io_context io_ctx;
    boost::asio::co_spawn(io_ctx, send_email(io_ctx), boost::asio::detached);
    io_ctx.run();
    return EXIT_SUCCESS;
}
