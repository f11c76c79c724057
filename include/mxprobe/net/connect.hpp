/*

net/connect.hpp
---------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <mxprobe/cancellation.hpp>
#include <mxprobe/net/deadline.hpp>
#include <mxprobe/options.hpp>

namespace mxprobe::net
{

/**
Opening a plain TCP connection.

The host name lookup and the connect are each bounded by the timeout. Failures are reported through the error code,
never thrown, so that a caller walking through several servers can move on to the next one.

@param executor Executor the socket is bound to.
@param host     Host name or address literal.
@param port     Port to connect to.
@param timeout  Bound of each step.
@param cancel   Cancellation token.
@param ec       Error of the first failing step.
@return         Connected socket, or a closed one on failure.
**/
inline boost::asio::awaitable<boost::asio::ip::tcp::socket> open_connection(boost::asio::any_io_executor executor,
    const std::string& host, unsigned short port, duration timeout, cancellation_token cancel,
    boost::system::error_code& ec)
{
    using tcp = boost::asio::ip::tcp;

    ec.clear();
    tcp::socket socket(executor);
    if (cancel.cancelled())
    {
        ec = boost::asio::error::operation_aborted;
        co_return std::move(socket);
    }

    tcp::resolver resolver(executor);
    const std::string service = std::to_string(port);
    auto endpoints = co_await async_with_deadline<void(boost::system::error_code, tcp::resolver::results_type)>(
        resolver, timeout, cancel,
        [&resolver, &host, &service](auto handler)
        {
            resolver.async_resolve(host, service, std::move(handler));
        }, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec)
        co_return std::move(socket);

    co_await async_with_deadline<void(boost::system::error_code, tcp::endpoint)>(
        socket, timeout, cancel,
        [&socket, &endpoints](auto handler)
        {
            boost::asio::async_connect(socket, endpoints, std::move(handler));
        }, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec)
    {
        boost::system::error_code ignore_ec;
        socket.close(ignore_ec);
    }
    co_return std::move(socket);
}

} // namespace mxprobe::net
