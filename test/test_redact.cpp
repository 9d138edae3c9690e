/*

test_redact.cpp
---------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE redact_test

#include <boost/test/unit_test.hpp>
#include <mailwire/detail/redact.hpp>


BOOST_AUTO_TEST_CASE(redact_auth_initial_response)
{
    BOOST_TEST(mailwire::detail::redact_line("AUTH PLAIN AGFsaWNlAHNlY3JldA==") == "AUTH PLAIN <redacted>");
    BOOST_TEST(mailwire::detail::redact_line("AUTH LOGIN") == "AUTH LOGIN");
}

BOOST_AUTO_TEST_CASE(redact_sasl_continuation)
{
    BOOST_TEST(mailwire::detail::redact_line("c2VjcmV0LXBhc3N3b3Jk\r\n") == "<redacted>\r\n");
    BOOST_TEST(mailwire::detail::redact_line("*") == "*");
}

BOOST_AUTO_TEST_CASE(redact_keeps_commands)
{
    BOOST_TEST(mailwire::detail::redact_line("MAIL FROM:<a@example.com>") == "MAIL FROM:<a@example.com>");
    BOOST_TEST(mailwire::detail::redact_line("QUIT") == "QUIT");
    BOOST_TEST(mailwire::detail::redact_if_needed("AUTH PLAIN AGFsaWNl", false) == "AUTH PLAIN AGFsaWNl");
}
