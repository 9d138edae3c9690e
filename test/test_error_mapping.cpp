/*

test_error_mapping.cpp
----------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE error_mapping_test

#include <boost/test/unit_test.hpp>

#include <mailwire/net/error_mapping.hpp>
#include <mailwire/smtp/error_mapping.hpp>


BOOST_AUTO_TEST_CASE(net_error_mapping)
{
    BOOST_TEST(mailwire::net::map_net_error(
        mailwire::net::io_stage::read,
        mailwire::asio::error::operation_aborted,
        true) == mailwire::errc::net_timeout);

    BOOST_TEST(mailwire::net::map_net_error(
        mailwire::net::io_stage::read,
        mailwire::asio::error::operation_aborted,
        false) == mailwire::errc::net_cancelled);

    BOOST_TEST(mailwire::net::map_net_error(
        mailwire::net::io_stage::read,
        mailwire::asio::error::eof,
        false) == mailwire::errc::net_eof);

    BOOST_TEST(mailwire::net::map_net_error(
        mailwire::net::io_stage::connect,
        mailwire::asio::error::connection_refused,
        false) == mailwire::errc::net_connection_refused);

    BOOST_TEST(mailwire::net::map_net_error(
        mailwire::net::io_stage::resolve,
        mailwire::asio::error::host_not_found,
        false) == mailwire::errc::net_resolve_failed);
}

BOOST_AUTO_TEST_CASE(smtp_error_mapping)
{
    using mailwire::smtp::command_kind;

    BOOST_TEST(mailwire::smtp::map_smtp_reply(command_kind::rcpt_to, 550) ==
        mailwire::errc::smtp_rejected_recipient);

    BOOST_TEST(mailwire::smtp::map_smtp_reply(command_kind::mail_from, 553) ==
        mailwire::errc::smtp_mail_from_rejected);

    BOOST_TEST(mailwire::smtp::map_smtp_reply(command_kind::auth, 535) ==
        mailwire::errc::smtp_auth_failed);

    BOOST_TEST(mailwire::smtp::map_smtp_reply(command_kind::data_cmd, 503) ==
        mailwire::errc::smtp_data_rejected);

    BOOST_TEST(mailwire::smtp::map_smtp_reply(command_kind::other, 421) ==
        mailwire::errc::smtp_service_not_available);

    BOOST_TEST(mailwire::smtp::map_smtp_reply(command_kind::other, 450) ==
        mailwire::errc::smtp_temporary_failure);

    BOOST_TEST(mailwire::smtp::map_smtp_reply(command_kind::other, 550) ==
        mailwire::errc::smtp_permanent_failure);

    BOOST_TEST(mailwire::smtp::map_smtp_reply(command_kind::ehlo, 999) ==
        mailwire::errc::smtp_bad_reply);
}

BOOST_AUTO_TEST_CASE(smtp_enhanced_status)
{
    BOOST_TEST(mailwire::smtp::find_enhanced_status({"5.1.1 <nobody@example.com>: Recipient address rejected"}) == "5.1.1");
    BOOST_TEST(mailwire::smtp::find_enhanced_status({"mx.example.com", "4.7.10 try later"}) == "4.7.10");
    BOOST_TEST(mailwire::smtp::find_enhanced_status({"version 1.2.3 here"}).empty());
}

BOOST_AUTO_TEST_CASE(smtp_error_from_reply)
{
    mailwire::smtp::reply r;
    r.status = 452;
    r.lines = {"4.2.2 Mailbox full"};
    const auto err = mailwire::smtp::error_from_reply(mailwire::smtp::command_kind::rcpt_to, r, "RCPT TO failed.");
    BOOST_TEST(err.code == mailwire::errc::smtp_rejected_recipient);
    BOOST_TEST(err.reply_code == 452);
    BOOST_TEST(err.message == "RCPT TO failed. 452 4.2.2 Mailbox full");
    BOOST_TEST(mailwire::is_temporary(err));
}
