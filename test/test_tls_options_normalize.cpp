/*

test_tls_options_normalize.cpp
------------------------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE tls_options_normalize_test

#include <boost/test/unit_test.hpp>
#include <mailwire/net/tls_options.hpp>
#include <sstream>


BOOST_AUTO_TEST_CASE(normalize_hex_fingerprint)
{
    BOOST_TEST(mailwire::net::normalize_fingerprint("AA:bb:cc") == "aabbcc");
    BOOST_TEST(mailwire::net::normalize_fingerprint(" 0A-1b ") == "0a1b");
}

BOOST_AUTO_TEST_CASE(normalize_base64_fingerprint)
{
    BOOST_TEST(mailwire::net::normalize_fingerprint("YWJjYQ") == "YWJjYQ==");
}

BOOST_AUTO_TEST_CASE(constant_time_compare)
{
    BOOST_TEST(mailwire::net::constant_time_equals("aabbcc", "aabbcc"));
    BOOST_TEST(!mailwire::net::constant_time_equals("aabbcc", "aabbcd"));
    BOOST_TEST(!mailwire::net::constant_time_equals("aabb", "aabbcc"));
}

BOOST_AUTO_TEST_CASE(tls_policy_names)
{
    std::ostringstream os;
    os << mailwire::net::tls_policy::opportunistic;
    BOOST_TEST(os.str() == "opportunistic");
}
