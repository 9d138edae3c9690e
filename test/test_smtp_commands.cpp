/*

test_smtp_commands.cpp
----------------------

Envelope commands, DATA framing and reply classification of the SMTP client.

*/


#define BOOST_TEST_MODULE smtp_commands_test

#include <boost/test/unit_test.hpp>
#include <mailwire/smtp/client.hpp>
#include <mailwire/smtp/types.hpp>
#include <string>

namespace smtp = mailwire::smtp;
using mailwire::errc;
using mailwire::error_info;


BOOST_AUTO_TEST_CASE(mail_from_extensions_all)
{
    smtp::detail::mail_extension_flags flags;
    flags.body_8bitmime = true;
    flags.smtputf8 = true;
    flags.size = 123;
    flags.ret = "HDRS";
    flags.envid = "QQ314159";

    auto cmd = smtp::detail::build_mail_from_command("alice@example.com", flags);
    BOOST_REQUIRE(cmd);
    BOOST_TEST(*cmd == "MAIL FROM:<alice@example.com> BODY=8BITMIME SMTPUTF8 SIZE=123 RET=HDRS ENVID=QQ314159");
}

BOOST_AUTO_TEST_CASE(mail_from_without_extensions)
{
    auto cmd = smtp::detail::build_mail_from_command("bob@example.com", {});
    BOOST_REQUIRE(cmd);
    BOOST_TEST(*cmd == "MAIL FROM:<bob@example.com>");

    auto null_sender = smtp::detail::build_mail_from_command("", {});
    BOOST_REQUIRE(null_sender);
    BOOST_TEST(*null_sender == "MAIL FROM:<>");
}

BOOST_AUTO_TEST_CASE(envelope_commands_reject_injection)
{
    BOOST_TEST(!smtp::detail::build_mail_from_command("a@example.com>\r\nRCPT TO:<x@example.com", {}));
    BOOST_TEST(!smtp::detail::build_rcpt_to_command("a@example.com\nDATA", ""));
}

BOOST_AUTO_TEST_CASE(envid_is_xtext_encoded)
{
    BOOST_TEST(smtp::detail::xtext_encode("QQ314159") == "QQ314159");
    BOOST_TEST(smtp::detail::xtext_encode("a+b=c d") == "a+2Bb+3Dc+20d");
    BOOST_TEST(smtp::detail::xtext_encode("\xC3\xA9") == "+C3+A9");

    smtp::detail::mail_extension_flags flags;
    flags.envid = "id AUTH=<>\r\nQUIT";
    auto cmd = smtp::detail::build_mail_from_command("a@example.com", flags);
    BOOST_REQUIRE(cmd);
    BOOST_TEST(*cmd == "MAIL FROM:<a@example.com> ENVID=id+20AUTH+3D<>+0D+0AQUIT");
}

BOOST_AUTO_TEST_CASE(rcpt_to_notify)
{
    BOOST_TEST(*smtp::detail::build_rcpt_to_command("carol@example.com", "") == "RCPT TO:<carol@example.com>");
    BOOST_TEST(*smtp::detail::build_rcpt_to_command("carol@example.com", "SUCCESS,FAILURE")
        == "RCPT TO:<carol@example.com> NOTIFY=SUCCESS,FAILURE");
}

BOOST_AUTO_TEST_CASE(dsn_option_strings)
{
    auto opts = smtp::dsn_options::on_success_or_failure();
    BOOST_TEST(opts.enabled());
    BOOST_TEST(opts.notify_string() == "SUCCESS,FAILURE");
    BOOST_TEST(opts.ret_string() == "HDRS");

    smtp::dsn_options never;
    never.notify = smtp::dsn_notify::never | smtp::dsn_notify::delay;
    BOOST_TEST(never.notify_string() == "NEVER");
    BOOST_TEST(!smtp::dsn_options{}.enabled());
}

BOOST_AUTO_TEST_CASE(data_payload_dot_stuffing)
{
    BOOST_TEST(smtp::detail::frame_data_payload("Hello\r\n.\r\n..two\r\nend") == "Hello\r\n..\r\n...two\r\nend\r\n.\r\n");
    BOOST_TEST(smtp::detail::frame_data_payload(".first line\r\n") == "..first line\r\n.\r\n");
    BOOST_TEST(smtp::detail::frame_data_payload("") == ".\r\n");
    BOOST_TEST(smtp::detail::frame_data_payload("a.b\r\n") == "a.b\r\n.\r\n");
}

BOOST_AUTO_TEST_CASE(data_framing_in_chunks)
{
    std::string payload;
    for (int i = 0; i < 300; ++i)
        payload += (i % 3 == 0 ? ".dotted line " : "plain line ") + std::to_string(i) + "\r\n";
    payload += "tail";

    smtp::detail::data_framer framer(payload);
    std::string joined;
    std::size_t chunks = 0;
    while (!framer.done())
    {
        const std::string chunk = framer.next_chunk(512);
        BOOST_TEST(!chunk.empty());
        joined += chunk;
        ++chunks;
    }
    BOOST_TEST(chunks > 1u);
    BOOST_TEST(joined == smtp::detail::frame_data_payload(payload));
    BOOST_TEST(framer.next_chunk(512).empty());
}

BOOST_AUTO_TEST_CASE(data_framing_keeps_line_state_across_chunks)
{
    smtp::detail::data_framer framer("ab\r\n.c\r\n");
    std::string joined;
    while (!framer.done())
        joined += framer.next_chunk(4);
    BOOST_TEST(joined == "ab\r\n..c\r\n.\r\n");
}

BOOST_AUTO_TEST_CASE(localhost_detection)
{
    BOOST_TEST(smtp::detail::is_localhost("localhost"));
    BOOST_TEST(smtp::detail::is_localhost("127.0.0.1"));
    BOOST_TEST(smtp::detail::is_localhost("::1"));
    BOOST_TEST(!smtp::detail::is_localhost("mail.example.com"));
}

BOOST_AUTO_TEST_CASE(connection_breaking_errors)
{
    error_info timeout;
    timeout.code = errc::net_timeout;
    BOOST_TEST(smtp::detail::breaks_connection(timeout));

    error_info shutdown;
    shutdown.code = errc::smtp_temporary_failure;
    shutdown.reply_code = 421;
    BOOST_TEST(smtp::detail::breaks_connection(shutdown));

    error_info mailbox_busy;
    mailbox_busy.code = errc::smtp_temporary_failure;
    mailbox_busy.reply_code = 450;
    BOOST_TEST(!smtp::detail::breaks_connection(mailbox_busy));

    error_info rejected;
    rejected.code = errc::smtp_rejected_recipient;
    rejected.reply_code = 550;
    BOOST_TEST(!smtp::detail::breaks_connection(rejected));
}
