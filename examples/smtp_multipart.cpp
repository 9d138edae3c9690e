/*

smtp_multipart.cpp
------------------

Sending a batch of HTML messages with a plain text alternative and an embedded image, accepting
partial delivery when some recipients are rejected.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
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
    const std::vector<std::string> newsletter_to{"alice@example.com", "bob@example.com"};
    std::vector<message> batch(newsletter_to.size());
    for (std::size_t i = 0; i < batch.size(); ++i)
    {
        message& msg = batch[i];
        if (!msg.set_from_format("mailwire news", "news@mailwire.dev") || !msg.add_to(newsletter_to[i])
            || !msg.add_cc("archive@mailwire.dev"))
        {
            cout << "Invalid address." << endl;
            return EXIT_FAILURE;
        }
        msg.set_subject("Monthly news");
        msg.set_body("text/plain", "Hello,\r\nthe HTML version shows our logo.");
        msg.add_alternative("text/html", "<p>Hello,</p><img src=\"cid:logo.png\">");
        if (auto res = msg.embed_file("logo.png"); !res)
        {
            print_error(res.error());
            return EXIT_FAILURE;
        }
    }

    mailwire::smtp::options options;
    options.host = "smtp.mailserver.com";
    options.credentials.username = "mailwire@mailserver.com";
    options.credentials.password = "mailwire_pass";
    options.recipients = mailwire::smtp::rcpt_policy::lenient;
    options.dsn = mailwire::smtp::dsn_options::on_failure();

    boost::asio::io_context io_ctx;
    client conn(io_ctx, options);

    boost::asio::co_spawn(io_ctx,
        [&]() -> boost::asio::awaitable<void>
        {
            if (auto res = co_await conn.dial_and_send(batch); !res)
                print_error(res.error());
        },
        boost::asio::detached);

    io_ctx.run();

    for (const auto& msg : batch)
    {
        if (msg.is_partially_delivered())
        {
            for (const auto& failure : msg.rejected_recipients())
                cout << "Rejected " << failure.address << ": " << failure.error.message << endl;
        }
        else if (msg.has_send_error())
            cout << "Failed: " << msg.last_send_error()->to_string() << endl;
    }
    return EXIT_SUCCESS;
}
