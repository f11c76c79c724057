/*

smtp/verdict.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <utility>
#include <mxprobe/smtp/reply.hpp>

namespace mxprobe::smtp
{

enum class verdict_kind
{
    valid,
    invalid,
    blocked,
    indeterminate
};

inline const char* to_string(verdict_kind kind) noexcept
{
    switch (kind)
    {
        case verdict_kind::valid: return "valid";
        case verdict_kind::invalid: return "invalid";
        case verdict_kind::blocked: return "blocked";
        case verdict_kind::indeterminate: return "indeterminate";
    }
    return "indeterminate";
}

/**
What the probed server disclosed about the recipient.

`code` is the reply to the recipient probe, `reason` its text and `host` the server that gave it.
**/
struct verdict
{
    verdict_kind kind = verdict_kind::indeterminate;
    int code = 0;
    std::string reason;
    std::string host;
};

inline verdict interpret(int code, std::string reason = {})
{
    verdict out;
    out.code = code;
    out.reason = std::move(reason);
    switch (code)
    {
        case codes::completed:
            out.kind = verdict_kind::valid;
            break;
        case codes::mailbox_unavailable:
            out.kind = verdict_kind::invalid;
            break;
        case codes::transaction_failed:
            out.kind = verdict_kind::blocked;
            break;
        default:
            out.kind = verdict_kind::indeterminate;
            break;
    }
    return out;
}

inline verdict interpret(const reply& rep)
{
    return interpret(rep.status, rep.message());
}

} // namespace mxprobe::smtp
