/*

address.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <mxprobe/error.hpp>

namespace mxprobe
{

struct address
{
    std::string local_part;
    std::string domain;

    std::string str() const
    {
        return local_part + "@" + domain;
    }
};

namespace detail
{

/**
Rejecting values that would end an SMTP command line early.
**/
inline void ensure_no_crlf_or_nul(std::string_view value, std::string_view field)
{
    static constexpr std::string_view forbidden("\r\n\0", 3);
    if (value.find_first_of(forbidden) != std::string_view::npos)
        throw error(errc::malformed_address, "Illegal control character.", std::string(field));
}

} // namespace detail


/**
Splitting an email address into local part and domain.

@param input Address as given by the caller.
@throw error `malformed_address` unless there is exactly one `@` with a non-empty part on each side.
**/
inline address parse_address(std::string_view input)
{
    if (std::count(input.begin(), input.end(), '@') != 1)
        throw error(errc::malformed_address, "Invalid email address.", std::string(input));
    detail::ensure_no_crlf_or_nul(input, "address");

    const auto at = input.find('@');
    address out{std::string(input.substr(0, at)), std::string(input.substr(at + 1))};
    if (out.local_part.empty() || out.domain.empty())
        throw error(errc::malformed_address, "Invalid email address.", std::string(input));
    return out;
}

inline std::string extract_domain(std::string_view input)
{
    return parse_address(input).domain;
}

} // namespace mxprobe
