/*

message.cpp
-----------

Building messages in the various transfer encodings and printing them, then handing one to the
local sendmail binary.


Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <cstdlib>
#include <iostream>
#include <string>
#include <mailwire/detail/output_sink.hpp>
#include <mailwire/mime/message.hpp>
#include <mailwire/mime/sendmail.hpp>
#include "example_util.hpp"


using std::cout;
using std::endl;
using std::string;
using mailwire::mime::message;
using mailwire::mime::transfer_encoding;


int main()
{
    auto require_ok = [](auto&& res, const char* action) {
        if (!res)
        {
            std::cerr << action << " error:\n";
            print_error(res.error());
            return false;
        }
        return true;
    };

    // Quoted-printable by default: the non-ASCII subject becomes an encoded word.
    {
        message msg;
        if (!require_ok(msg.set_from_format("mail io", "contact@mailwire.dev"), "from")
            || !require_ok(msg.add_to("contact@mailwire.dev"), "to"))
            return EXIT_FAILURE;
        msg.set_subject("Grüße aus Zürich");
        msg.set_body("text/plain", "Größere Zeilen werden als quoted-printable kodiert.");
        auto text = msg.to_string();
        if (!require_ok(text, "format"))
            return EXIT_FAILURE;
        cout << *text << endl;
        // The subject is printed as `=?UTF-8?q?Gr=C3=BC=C3=9Fe_aus_Z=C3=BCrich?=`.
    }

    // Base64 for the whole message, headers use B encoded words.
    {
        message msg;
        msg.set_encoding(transfer_encoding::base64);
        if (!require_ok(msg.set_from("contact@mailwire.dev"), "from")
            || !require_ok(msg.add_to("contact@mailwire.dev"), "to"))
            return EXIT_FAILURE;
        msg.set_subject("Привет, мир!");
        msg.set_body("text/plain", "Привет, мир!");
        auto text = msg.to_string();
        if (!require_ok(text, "format"))
            return EXIT_FAILURE;
        cout << *text << endl;
    }

    // Alternatives and an attachment, streamed to stdout.
    {
        message msg;
        if (!require_ok(msg.set_from("contact@mailwire.dev"), "from")
            || !require_ok(msg.add_to("contact@mailwire.dev"), "to"))
            return EXIT_FAILURE;
        msg.set_subject("Report");
        msg.set_body("text/plain", "See the report.");
        msg.add_alternative("text/html", "<p>See the <b>report</b>.</p>");
        msg.attach_string("report.txt", "all good\n");
        mailwire::detail::ostream_sink sink(cout);
        if (!require_ok(msg.write_to(sink), "write"))
            return EXIT_FAILURE;
        cout << endl;

        // Local delivery, recipients are read from the headers.
        if (auto res = mailwire::mime::write_to_sendmail(msg); !res)
            print_error(res.error());
    }

    return EXIT_SUCCESS;
}
