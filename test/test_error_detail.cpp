/*

test_error_detail.cpp
---------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE error_detail_test

#include <boost/test/unit_test.hpp>

#include <string>
#include <vector>

#include <mailwire/detail/error_detail.hpp>
#include <mailwire/detail/result.hpp>
#include <mailwire/mime/send_error.hpp>


BOOST_AUTO_TEST_CASE(error_detail_add_lines)
{
    mailwire::detail::error_detail detail;
    std::vector<std::string> lines = {"alpha", "beta"};
    detail.add_lines("line", lines);
    BOOST_TEST(detail.str() == "line0=alpha\nline1=beta\n");
}

BOOST_AUTO_TEST_CASE(error_detail_add_lines_redact)
{
    mailwire::detail::error_detail detail;
    std::vector<std::string> lines = {"AUTH PLAIN AGFsaWNlAHNlY3JldA==", "dXNlcm5hbWU6cGFzc3dvcmQ="};
    detail.add_lines("line", lines, true);
    BOOST_TEST(detail.str() == "line0=AUTH PLAIN <redacted>\nline1=<redacted>\n");
}

BOOST_AUTO_TEST_CASE(error_detail_values)
{
    mailwire::detail::error_detail detail;
    detail.add("host", "mail.example.com").add_int("reply.code", 550).add_ec("ec", {});
    BOOST_TEST(detail.str() == "host=mail.example.com\nreply.code=550\n");
    BOOST_TEST(!detail.empty());
}

BOOST_AUTO_TEST_CASE(error_info_formatting)
{
    mailwire::error_info err;
    err.code = mailwire::errc::smtp_rejected_recipient;
    err.message = "Recipient rejected";
    err.reply_code = 550;
    BOOST_TEST(err.to_string() == "[505] Recipient rejected (reply 550)");

    mailwire::error_info bare;
    bare.code = mailwire::errc::net_timeout;
    BOOST_TEST(bare.to_string() == "[305] Timeout");
}

BOOST_AUTO_TEST_CASE(temporary_classification)
{
    mailwire::error_info busy;
    busy.code = mailwire::errc::smtp_rejected_recipient;
    busy.reply_code = 450;
    BOOST_TEST(mailwire::is_temporary(busy));

    mailwire::error_info unknown_user = busy;
    unknown_user.reply_code = 550;
    BOOST_TEST(!mailwire::is_temporary(unknown_user));

    BOOST_TEST(mailwire::is_temporary(mailwire::errc::net_connection_reset));
    BOOST_TEST(!mailwire::is_temporary(mailwire::errc::invalid_address));
}

BOOST_AUTO_TEST_CASE(send_error_text_and_temporariness)
{
    mailwire::error_info busy{mailwire::errc::smtp_rejected_recipient, "450 mailbox busy", {}, {}, 450};
    mailwire::error_info full{mailwire::errc::smtp_rejected_recipient, "452 mailbox full", {}, {}, 452};
    mailwire::error_info unknown{mailwire::errc::smtp_rejected_recipient, "550 no such user", {}, {}, 550};

    const mailwire::mime::send_error temp(mailwire::mime::send_error_reason::rcpt_to, {busy, full},
        {"a@example.com", "b@example.com"});
    BOOST_TEST(temp.is_temp());
    BOOST_TEST(temp.to_string() == "sending SMTP RCPT TO command: 450 mailbox busy, 452 mailbox full, "
        "affected recipient(s): a@example.com, b@example.com");

    const mailwire::mime::send_error mixed(mailwire::mime::send_error_reason::rcpt_to, {busy, unknown});
    BOOST_TEST(!mixed.is_temp());

    const mailwire::mime::send_error none(mailwire::mime::send_error_reason::conn_check, {});
    BOOST_TEST(!none.is_temp());
    BOOST_TEST(none.to_string() == "checking SMTP connection");
}
