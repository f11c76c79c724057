/*

error.hpp
---------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <stdexcept>
#include <type_traits>
#include <boost/system/error_code.hpp>

namespace mxprobe
{

/**
Kinds of failure a verification can end with.
**/
enum class errc
{
    malformed_address = 1,
    resolution_failed,
    no_usable_server,
    handshake_failed,
    sender_rejected,
    protocol_error,
    cancelled
};

} // namespace mxprobe


namespace boost::system
{

template<>
struct is_error_code_enum<mxprobe::errc>
{
    static const bool value = true;
};

} // namespace boost::system


namespace mxprobe
{

namespace detail
{

class error_category : public boost::system::error_category
{
public:
    const char* name() const noexcept override
    {
        return "mxprobe";
    }

    std::string message(int ev) const override
    {
        switch (static_cast<errc>(ev))
        {
            case errc::malformed_address: return "malformed address";
            case errc::resolution_failed: return "mail exchange resolution failed";
            case errc::no_usable_server: return "no usable mail server";
            case errc::handshake_failed: return "handshake failed";
            case errc::sender_rejected: return "sender rejected";
            case errc::protocol_error: return "protocol error";
            case errc::cancelled: return "cancelled";
        }
        return "mxprobe error";
    }
};

inline const boost::system::error_category& get_error_category()
{
    static const error_category cat{};
    return cat;
}

} // namespace detail


inline boost::system::error_code make_error_code(errc ev)
{
    return boost::system::error_code{static_cast<std::underlying_type<errc>::type>(ev), detail::get_error_category()};
}


class dialog_error : public std::runtime_error
{
public:
    dialog_error(const std::string& msg, const std::string& details) : std::runtime_error(msg), details_(details)
    {
    }

    dialog_error(const char* msg, const std::string& details) : std::runtime_error(msg), details_(details)
    {
    }

    std::string details() const { return details_; }

protected:
    std::string details_;
};


/**
Error thrown by the verification API.

Carries the failure kind and, when the failure came from the transport or the name service, the underlying error code.
A rejection by the server has no cause code; its reply text is in the details.
**/
class error : public dialog_error
{
public:
    error(errc kind, const std::string& msg, const std::string& details, boost::system::error_code cause = {})
        : dialog_error(msg, details), kind_(kind), cause_(cause)
    {
    }

    error(errc kind, const char* msg, const std::string& details, boost::system::error_code cause = {})
        : dialog_error(msg, details), kind_(kind), cause_(cause)
    {
    }

    errc kind() const noexcept { return kind_; }

    boost::system::error_code code() const { return make_error_code(kind_); }

    const boost::system::error_code& cause() const noexcept { return cause_; }

private:
    errc kind_;
    boost::system::error_code cause_;
};

} // namespace mxprobe
