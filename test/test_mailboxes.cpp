/*

test_mailboxes.cpp
------------------

RFC 5322 mailbox parsing and formatting.

*/

#define BOOST_TEST_MODULE mailboxes_test

#include <boost/test/unit_test.hpp>
#include <mailwire/codec/base64.hpp>
#include <mailwire/mime/mailboxes.hpp>
#include <string>

using mailwire::mime::mail_address;
using mailwire::mime::parse_address;
using mailwire::mime::parse_address_list;


BOOST_AUTO_TEST_CASE(parse_bare_addr_spec)
{
    auto addr = parse_address("toni@example.com");
    BOOST_REQUIRE(addr);
    BOOST_TEST(addr->name.empty());
    BOOST_TEST(addr->address == "toni@example.com");
}

BOOST_AUTO_TEST_CASE(parse_name_addr)
{
    auto addr = parse_address("Toni Tester <toni@example.com>");
    BOOST_REQUIRE(addr);
    BOOST_TEST(addr->name == "Toni Tester");
    BOOST_TEST(addr->address == "toni@example.com");

    auto quoted = parse_address("\"Tester, Toni\" <toni@example.com>");
    BOOST_REQUIRE(quoted);
    BOOST_TEST(quoted->name == "Tester, Toni");
}

BOOST_AUTO_TEST_CASE(parse_comments_and_encoded_words)
{
    auto commented = parse_address("toni@example.com (Toni Tester)");
    BOOST_REQUIRE(commented);
    BOOST_TEST(commented->address == "toni@example.com");

    auto encoded = parse_address("=?UTF-8?Q?J=C3=B6rg?= <joerg@example.de>");
    BOOST_REQUIRE(encoded);
    BOOST_TEST(encoded->name == "J\xC3\xB6rg");

    auto literal = parse_address("<postmaster@[192.168.0.1]>");
    BOOST_REQUIRE(literal);
    BOOST_TEST(literal->address == "postmaster@[192.168.0.1]");
}

BOOST_AUTO_TEST_CASE(parse_rejects_invalid)
{
    for (const char* text : {"", "plainaddress", "a@", "@example.com", "Toni <toni@example.com", "a..b@example.com",
        "<toni@example.com> trailing"})
    {
        auto addr = parse_address(text);
        BOOST_TEST(!addr, "accepted: " << text);
        if (!addr)
            BOOST_TEST(static_cast<int>(addr.error().code) == static_cast<int>(mailwire::errc::invalid_address));
    }
}

BOOST_AUTO_TEST_CASE(parse_list_respects_quotes)
{
    auto list = parse_address_list("\"Doe, John\" <john@example.com>, jane@example.com,, <bob@example.com>");
    BOOST_REQUIRE(list);
    BOOST_REQUIRE(list->size() == 3u);
    BOOST_TEST((*list)[0].name == "Doe, John");
    BOOST_TEST((*list)[1].address == "jane@example.com");
    BOOST_TEST((*list)[2].address == "bob@example.com");

    BOOST_TEST(!parse_address_list("john@example.com, broken@"));
}

BOOST_AUTO_TEST_CASE(format_mailboxes)
{
    BOOST_TEST(mail_address("", "toni@example.com").format() == "<toni@example.com>");
    BOOST_TEST(mail_address("Toni Tester", "toni@example.com").format() == "\"Toni Tester\" <toni@example.com>");
    BOOST_TEST(mail_address("Say \"hi\"", "a@example.com").format() == "\"Say \\\"hi\\\"\" <a@example.com>");
    BOOST_TEST(mail_address("J\xC3\xB6rg", "joerg@example.de").format() == "=?utf-8?q?J=C3=B6rg?= <joerg@example.de>");

    const std::string name = "M\xC3\xBCller, Hans";
    BOOST_TEST(mail_address(name, "hm@example.de").format()
        == "=?utf-8?b?" + mailwire::codec::base64_encode(name) + "?= <hm@example.de>");
}

BOOST_AUTO_TEST_CASE(format_then_parse_keeps_the_mailbox)
{
    const mail_address original("M\xC3\xBCller, Hans", "hm@example.de");
    auto parsed = parse_address(original.format());
    BOOST_REQUIRE(parsed);
    BOOST_TEST((*parsed == original));
}

BOOST_AUTO_TEST_CASE(format_address_list_joins)
{
    BOOST_TEST(mailwire::mime::format_address_list({mail_address("", "a@example.com"), mail_address("B", "b@example.com")})
        == "<a@example.com>, \"B\" <b@example.com>");
}
