/*

smtp_simple_msg.cpp
-------------------

Connecting to an SMTPS server (implicit TLS on port 465), sending a simple text message and
closing the connection in one call.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <span>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <mailwire/mime/message.hpp>
#include <mailwire/smtp/client.hpp>
#include "example_util.hpp"


using mailwire::mime::message;
using mailwire::smtp::client;
using std::cout;
using std::endl;


int main()
{
    message msg;
    if (!msg.set_from_format("mail io", "contact@mailwire.dev") || !msg.add_to_format("mail io", "contact@mailwire.dev"))
    {
        cout << "Invalid address." << endl;
        return EXIT_FAILURE;
    }
    msg.set_subject("smtps simple message");
    msg.set_body("text/plain", "Hello, World!");

    mailwire::smtp::options options;
    options.host = "smtp.mailserver.com";
    options.port = mailwire::smtp::DEFAULT_SMTPS_PORT;
    options.tls_policy = mailwire::net::tls_policy::implicit;
    options.credentials.username = "mailwire@mailserver.com";
    options.credentials.password = "mailwire_pass";

    boost::asio::io_context io_ctx;
    client conn(io_ctx, options);

    boost::asio::co_spawn(io_ctx,
        [&]() -> boost::asio::awaitable<void>
        {
            auto res = co_await conn.dial_and_send(std::span<message>(&msg, 1));
            if (!res)
            {
                print_error(res.error());
                co_return;
            }
            cout << "Delivered: " << std::boolalpha << msg.is_delivered() << endl;
        },
        boost::asio::detached);

    io_ctx.run();
    return msg.is_delivered() ? EXIT_SUCCESS : EXIT_FAILURE;
}
