/*

smtp_attachment.cpp
-------------------

Sending a message with attachments through a STARTTLS server.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <sstream>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <mailwire/mime/message.hpp>
#include <mailwire/smtp/client.hpp>
#include "example_util.hpp"


using mailwire::mime::message;
using mailwire::mime::file_options;
using mailwire::smtp::client;
using std::cout;
using std::endl;


int main()
{
    message msg;
    if (!msg.set_from_format("mail io", "contact@mailwire.dev") || !msg.add_to("contact@mailwire.dev"))
    {
        cout << "Invalid address." << endl;
        return EXIT_FAILURE;
    }
    msg.set_subject("smtp message with attachments");
    msg.set_body("text/plain", "Two files are attached.");

    // Files from disk get their content type from the extension.
    if (auto res = msg.attach_file("a0.png"); !res)
    {
        print_error(res.error());
        return EXIT_FAILURE;
    }

    file_options csv;
    csv.content_type = "text/csv";
    csv.description = "Quarterly numbers";
    std::istringstream numbers("quarter,amount\nQ1,100\nQ2,150\n");
    if (auto res = msg.attach_stream("numbers.csv", numbers, csv); !res)
    {
        print_error(res.error());
        return EXIT_FAILURE;
    }

    mailwire::smtp::options options;
    options.host = "smtp.mailserver.com";
    options.credentials.username = "mailwire@mailserver.com";
    options.credentials.password = "mailwire_pass";

    boost::asio::io_context io_ctx;
    client conn(io_ctx, options);

    boost::asio::co_spawn(io_ctx,
        [&]() -> boost::asio::awaitable<void>
        {
            if (auto res = co_await conn.dial(); !res)
            {
                print_error(res.error());
                co_return;
            }
            if (auto res = co_await conn.send(msg); !res)
                print_error(res.error());
            if (auto res = co_await conn.close(); !res)
                print_error(res.error());
        },
        boost::asio::detached);

    io_ctx.run();
    return msg.is_delivered() ? EXIT_SUCCESS : EXIT_FAILURE;
}
