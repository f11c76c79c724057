/*

dns/resolver.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

#include <netinet/in.h>
#include <arpa/nameser.h>
#include <resolv.h>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <mxprobe/cancellation.hpp>
#include <mxprobe/detail/log.hpp>
#include <mxprobe/error.hpp>
#include <mxprobe/net/deadline.hpp>
#include <mxprobe/options.hpp>

namespace mxprobe::dns
{

struct mx_record
{
    unsigned short preference = 0;
    std::string host;
};

namespace detail
{

/**
Owning wrapper of a libresolv state, used only to build queries.
**/
class resolver_state
{
public:
    resolver_state()
    {
        std::memset(&state_, 0, sizeof(state_));
        if (res_ninit(&state_) != 0)
            throw error(errc::resolution_failed, "Resolver initialization failure.", "");
    }

    resolver_state(const resolver_state&) = delete;
    resolver_state& operator=(const resolver_state&) = delete;

    ~resolver_state()
    {
        res_nclose(&state_);
    }

    res_state get() { return &state_; }

private:
    struct __res_state state_;
};


inline std::vector<unsigned char> make_mx_query(const std::string& domain)
{
    resolver_state state;
    std::vector<unsigned char> query(NS_PACKETSZ);
    const int length = res_nmkquery(state.get(), ns_o_query, domain.c_str(), ns_c_in, ns_t_mx, nullptr, 0, nullptr,
        query.data(), static_cast<int>(query.size()));
    if (length < 0)
        throw error(errc::resolution_failed, "Query construction failure.", domain);
    query.resize(static_cast<std::size_t>(length));
    return query;
}


inline std::uint16_t query_id(const std::vector<unsigned char>& message)
{
    return static_cast<std::uint16_t>((message[0] << 8) | message[1]);
}


/**
Extracting the mail exchange records of a response.

Records of other types (a CNAME chain, for instance) are skipped, and so is a null MX, which announces that the domain
accepts no mail.

@param message  Response datagram.
@param length   Size of the response.
@param id       Identifier of the query being answered.
@param domain   Domain queried, for the error details.
@return         Records in the order of the response, or nothing if the response answers another query.
@throw error    `resolution_failed` if the response is malformed or reports a failure.
**/
inline std::optional<std::vector<mx_record>> parse_mx_response(const unsigned char* message, std::size_t length,
    std::uint16_t id, const std::string& domain)
{
    ns_msg handle;
    if (ns_initparse(message, static_cast<int>(length), &handle) < 0)
        throw error(errc::resolution_failed, "Malformed name server response.", domain);
    if (ns_msg_id(handle) != id || ns_msg_getflag(handle, ns_f_qr) == 0)
        return std::nullopt;

    const int rcode = ns_msg_getflag(handle, ns_f_rcode);
    if (rcode == ns_r_nxdomain)
        throw error(errc::resolution_failed, "No such domain.", domain);
    if (rcode != ns_r_noerror)
        throw error(errc::resolution_failed, "Name server failure.", domain + ": rcode " + std::to_string(rcode));

    const bool truncated = ns_msg_getflag(handle, ns_f_tc) != 0;
    if (truncated)
        MXPROBE_WARN("Truncated name server response for " + domain);

    std::vector<mx_record> records;
    const int count = ns_msg_count(handle, ns_s_an);
    for (int i = 0; i < count; ++i)
    {
        ns_rr rr;
        if (ns_parserr(&handle, ns_s_an, i, &rr) < 0)
        {
            if (truncated)
                break;
            throw error(errc::resolution_failed, "Malformed resource record.", domain);
        }
        if (ns_rr_type(rr) != ns_t_mx || ns_rr_class(rr) != ns_c_in)
            continue;
        if (ns_rr_rdlen(rr) < NS_INT16SZ + 1)
            throw error(errc::resolution_failed, "Malformed mail exchange record.", domain);

        const unsigned char* rdata = ns_rr_rdata(rr);
        char name[NS_MAXDNAME];
        if (dn_expand(ns_msg_base(handle), ns_msg_end(handle), rdata + NS_INT16SZ, name, sizeof(name)) < 0)
            throw error(errc::resolution_failed, "Malformed mail exchange record.", domain);

        mx_record record;
        record.preference = static_cast<unsigned short>(ns_get16(rdata));
        record.host = name;
        boost::algorithm::trim_right_if(record.host, boost::algorithm::is_any_of("."));
        if (record.host.empty())
        {
            MXPROBE_DEBUG("Null mail exchange for " + domain);
            continue;
        }
        records.push_back(std::move(record));
    }
    return records;
}

} // namespace detail


/**
Mail exchange lookup against one fixed name server over UDP.

The name server comes from the options; the system resolver configuration is only used for the query defaults.
**/
class resolver
{
public:
    using executor_type = boost::asio::any_io_executor;
    using udp = boost::asio::ip::udp;

    explicit resolver(executor_type executor, resolver_options options = {})
        : executor_(executor), options_(std::move(options))
    {
    }

    explicit resolver(boost::asio::io_context& context, resolver_options options = {})
        : resolver(context.get_executor(), std::move(options))
    {
    }

    executor_type get_executor() const { return executor_; }

    const resolver_options& options() const { return options_; }

    /**
    Querying the mail exchange records of a domain.

    An empty result is not an error: the domain exists but accepts no mail.

    @param domain Domain to query.
    @param cancel Cancellation token.
    @return       Records, sorted by preference if so configured.
    @throw error  `resolution_failed` if the query times out, cannot be sent or is answered with a failure;
                  `cancelled` if the query is cancelled.
    **/
    boost::asio::awaitable<std::vector<mx_record>> query_mx(const std::string& domain, cancellation_token cancel = {})
    {
        if (cancel.cancelled())
            throw error(errc::cancelled, "Name resolution cancelled.", domain);

        const std::vector<unsigned char> query = detail::make_mx_query(domain);
        const std::uint16_t id = detail::query_id(query);
        const udp::endpoint server = server_endpoint();

        udp::socket socket(executor_);
        boost::system::error_code ec;
        socket.open(server.protocol(), ec);
        if (ec)
            throw error(errc::resolution_failed, "Name server socket failure.", domain, ec);

        MXPROBE_DEBUG("Querying " + server.address().to_string() + " for mail exchanges of " + domain);
        co_await net::async_with_deadline<void(boost::system::error_code, std::size_t)>(socket, options_.timeout, cancel,
            [&socket, &query, &server](auto handler)
            {
                socket.async_send_to(boost::asio::buffer(query), server, std::move(handler));
            }, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec)
            throw transport_failure(domain, ec, cancel);

        const auto deadline = std::chrono::steady_clock::now() + options_.timeout;
        std::vector<unsigned char> response(NS_MAXMSG);
        while (true)
        {
            const auto remaining = deadline - std::chrono::steady_clock::now();
            if (remaining <= duration::zero())
                throw transport_failure(domain, boost::asio::error::timed_out, cancel);

            udp::endpoint sender;
            const std::size_t length = co_await net::async_with_deadline<void(boost::system::error_code, std::size_t)>(
                socket, remaining, cancel,
                [&socket, &response, &sender](auto handler)
                {
                    socket.async_receive_from(boost::asio::buffer(response), sender, std::move(handler));
                }, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec)
                throw transport_failure(domain, ec, cancel);

            if (sender != server)
            {
                MXPROBE_DEBUG("Discarding datagram from " + sender.address().to_string());
                continue;
            }

            auto records = detail::parse_mx_response(response.data(), length, id, domain);
            if (!records.has_value())
            {
                MXPROBE_DEBUG("Discarding response to another query for " + domain);
                continue;
            }

            if (options_.sort_by_preference)
            {
                std::stable_sort(records->begin(), records->end(), [](const mx_record& a, const mx_record& b)
                {
                    return a.preference < b.preference;
                });
            }
            co_return std::move(*records);
        }
    }

    /**
    Looking up the mail exchange host names of a domain, in the order they should be tried.

    @see query_mx
    **/
    boost::asio::awaitable<std::vector<std::string>> lookup_mx(const std::string& domain, cancellation_token cancel = {})
    {
        const std::vector<mx_record> records = co_await query_mx(domain, std::move(cancel));

        std::vector<std::string> hosts;
        hosts.reserve(records.size());
        for (const auto& record : records)
            hosts.push_back(record.host);
        MXPROBE_DEBUG(std::to_string(hosts.size()) + " mail exchanges found for " + domain);
        co_return hosts;
    }

private:
    udp::endpoint server_endpoint() const
    {
        boost::system::error_code ec;
        const auto address = boost::asio::ip::make_address(options_.server, ec);
        if (ec)
            throw error(errc::resolution_failed, "Invalid name server address.", options_.server, ec);
        return udp::endpoint(address, options_.port);
    }

    static error transport_failure(const std::string& domain, const boost::system::error_code& ec,
        const cancellation_token& cancel)
    {
        if (ec == boost::asio::error::operation_aborted && cancel.cancelled())
            return error(errc::cancelled, "Name resolution cancelled.", domain, ec);
        return error(errc::resolution_failed, "Name server query failure.", domain, ec);
    }

    executor_type executor_;
    resolver_options options_;
};

} // namespace mxprobe::dns
