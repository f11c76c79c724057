/*

smtp/reply.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <cctype>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mxprobe::smtp
{

namespace codes
{

inline constexpr int service_ready = 220;
inline constexpr int service_closing = 221;
inline constexpr int completed = 250;
inline constexpr int mailbox_unavailable = 550;
inline constexpr int transaction_failed = 554;

} // namespace codes


struct reply
{
    int status = 0;
    std::vector<std::string> lines;

    bool is_positive_completion() const { return status / 100 == 2; }
    bool is_positive_intermediate() const { return status / 100 == 3; }
    bool is_transient_negative() const { return status / 100 == 4; }
    bool is_permanent_negative() const { return status / 100 == 5; }

    std::string message() const
    {
        if (lines.empty())
            return std::string();

        std::string out = lines.front();
        for (std::size_t i = 1; i < lines.size(); ++i)
        {
            out += "\n";
            out += lines[i];
        }
        return out;
    }
};


/**
One line of a possibly multi-line reply.
**/
struct reply_line
{
    int status = 0;
    bool last = true;
    std::string text;
};


/**
Splitting a reply line into its code, continuation flag and text.

@param line Line without the terminating CRLF.
@return     Parsed line, or nothing if the line is not of the form `DDD`, `DDD text` or `DDD-text`.
**/
inline std::optional<reply_line> parse_reply_line(std::string_view line)
{
    if (line.size() < 3)
        return std::nullopt;

    if (!std::isdigit(static_cast<unsigned char>(line[0])) ||
        !std::isdigit(static_cast<unsigned char>(line[1])) ||
        !std::isdigit(static_cast<unsigned char>(line[2])))
        return std::nullopt;

    reply_line out;
    out.status = (line[0] - '0') * 100 + (line[1] - '0') * 10 + (line[2] - '0');

    if (line.size() >= 4)
    {
        if (line[3] == '-')
            out.last = false;
        else if (line[3] != ' ')
            return std::nullopt;
    }

    if (line.size() > 4)
        out.text = std::string(line.substr(4));
    return out;
}

} // namespace mxprobe::smtp
