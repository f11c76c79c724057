/*

test_address.cpp
----------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE address_test

#include <string>
#include <boost/test/unit_test.hpp>
#include <mxprobe/address.hpp>

using mxprobe::errc;
using mxprobe::error;
using mxprobe::extract_domain;
using mxprobe::parse_address;


namespace
{

bool is_malformed(const error& exc)
{
    return exc.kind() == errc::malformed_address;
}

} // namespace


BOOST_AUTO_TEST_CASE(extract_domain_single_separator)
{
    BOOST_CHECK_EQUAL(extract_domain("user@example.com"), "example.com");
    BOOST_CHECK_EQUAL(extract_domain("first.last+tag@mail.example.org"), "mail.example.org");
}

BOOST_AUTO_TEST_CASE(parse_address_parts)
{
    const auto addr = parse_address("user@example.com");
    BOOST_CHECK_EQUAL(addr.local_part, "user");
    BOOST_CHECK_EQUAL(addr.domain, "example.com");
    BOOST_CHECK_EQUAL(addr.str(), "user@example.com");
}

BOOST_AUTO_TEST_CASE(extract_domain_no_separator)
{
    BOOST_CHECK_EXCEPTION(extract_domain("user.example.com"), error, is_malformed);
    BOOST_CHECK_EXCEPTION(extract_domain(""), error, is_malformed);
}

BOOST_AUTO_TEST_CASE(extract_domain_several_separators)
{
    BOOST_CHECK_EXCEPTION(extract_domain("user@@example.com"), error, is_malformed);
    BOOST_CHECK_EXCEPTION(extract_domain("a@b@example.com"), error, is_malformed);
    BOOST_CHECK_EXCEPTION(extract_domain("@@"), error, is_malformed);
}

BOOST_AUTO_TEST_CASE(extract_domain_empty_part)
{
    BOOST_CHECK_EXCEPTION(extract_domain("user@"), error, is_malformed);
    BOOST_CHECK_EXCEPTION(extract_domain("@example.com"), error, is_malformed);
}

BOOST_AUTO_TEST_CASE(extract_domain_control_characters)
{
    BOOST_CHECK_EXCEPTION(extract_domain("user@example.com\r\nRCPT TO:<other@example.com>"), error, is_malformed);
    BOOST_CHECK_EXCEPTION(extract_domain(std::string("user@exa\0mple.com", 17)), error, is_malformed);
}

BOOST_AUTO_TEST_CASE(malformed_address_error_code)
{
    try
    {
        extract_domain("nobody");
        BOOST_FAIL("malformed address accepted");
    }
    catch (const error& exc)
    {
        BOOST_CHECK(exc.code() == errc::malformed_address);
        BOOST_CHECK_EQUAL(exc.details(), "nobody");
        BOOST_CHECK(!exc.cause());
    }
}
