/*

options.hpp
-----------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace mxprobe
{

using duration = std::chrono::steady_clock::duration;

/**
Name server used for the mail exchange lookup. The system resolver configuration is never consulted.
**/
struct resolver_options
{
    std::string server = "1.1.1.1";
    unsigned short port = 53;
    duration timeout = std::chrono::seconds(5);
    bool sort_by_preference = true;
};

/**
Setting the name server from `HOST`, `HOST:PORT`, a bare IPv6 address or `[IPV6]:PORT`.

@param opts  Options to update; left untouched on failure.
@param value Name server as given on the command line.
@throw std::invalid_argument If the host is empty or the port is not a number between 1 and 65535.
**/
inline void set_name_server(resolver_options& opts, const std::string& value)
{
    std::string host;
    std::string port;
    if (!value.empty() && value.front() == '[')
    {
        const auto bracket = value.find(']');
        if (bracket == std::string::npos)
            throw std::invalid_argument("Unterminated IPv6 address: " + value);
        host = value.substr(1, bracket - 1);
        if (bracket + 1 < value.size())
        {
            if (value[bracket + 1] != ':')
                throw std::invalid_argument("Invalid name server: " + value);
            port = value.substr(bracket + 2);
            if (port.empty())
                throw std::invalid_argument("Missing name server port: " + value);
        }
    }
    else if (std::count(value.begin(), value.end(), ':') == 1)
    {
        const auto colon = value.find(':');
        host = value.substr(0, colon);
        port = value.substr(colon + 1);
        if (port.empty())
            throw std::invalid_argument("Missing name server port: " + value);
    }
    else
        host = value;

    if (host.empty())
        throw std::invalid_argument("Missing name server host: " + value);

    unsigned long port_number = opts.port;
    if (!port.empty())
    {
        const bool digits = port.size() <= 5 &&
            std::all_of(port.begin(), port.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
        if (!digits)
            throw std::invalid_argument("Invalid name server port: " + port);
        port_number = std::stoul(port);
        if (port_number == 0 || port_number > 65535)
            throw std::invalid_argument("Invalid name server port: " + port);
    }

    opts.server = host;
    opts.port = static_cast<unsigned short>(port_number);
}


struct session_options
{
    unsigned short port = 25;
    duration connect_timeout = std::chrono::seconds(5);
    duration command_timeout = std::chrono::seconds(5);
    std::size_t max_line_length = 8192;
};

/**
Identity presented to the probed servers and the network settings.

An empty `helo_domain` stands for the local host name, an empty `mail_from` for `verify@<helo_domain>`.
**/
struct options
{
    std::string helo_domain;
    std::string mail_from;
    resolver_options dns;
    session_options smtp;
};

} // namespace mxprobe
