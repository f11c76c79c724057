/*

verifier.hpp
------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <exception>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <boost/algorithm/string/join.hpp>
#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/ip/host_name.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <mxprobe/address.hpp>
#include <mxprobe/cancellation.hpp>
#include <mxprobe/detail/log.hpp>
#include <mxprobe/dns/resolver.hpp>
#include <mxprobe/error.hpp>
#include <mxprobe/net/connect.hpp>
#include <mxprobe/options.hpp>
#include <mxprobe/smtp/session.hpp>
#include <mxprobe/smtp/verdict.hpp>

namespace mxprobe
{

/**
Outcome of verifying one address.

Without a verdict and with no servers, the domain accepts no mail.
**/
struct verification
{
    std::string address;
    std::string domain;
    std::vector<std::string> servers;
    // Server that gave the verdict, empty without one.
    std::string server;
    std::optional<smtp::verdict> verdict;

    bool accepts_mail() const noexcept { return !servers.empty(); }
};


/**
Verifies addresses by probing their mail exchanges.

A verifier holds no state between calls besides its configuration, several verifications may run at once on
separate coroutines.
**/
class verifier
{
public:
    using executor_type = boost::asio::any_io_executor;

    explicit verifier(executor_type executor, options opts = {}, cancellation_token cancel = {})
        : executor_(executor),
          options_(std::move(opts)),
          cancel_(std::move(cancel))
    {
    }

    explicit verifier(boost::asio::io_context& context, options opts = {}, cancellation_token cancel = {})
        : verifier(context.get_executor(), std::move(opts), std::move(cancel))
    {
    }

    executor_type get_executor() const { return executor_; }

    const options& config() const { return options_; }

    boost::asio::awaitable<std::vector<std::string>> lookup_mx(const std::string& domain)
    {
        dns::resolver resolver(executor_, options_.dns);
        co_return co_await resolver.lookup_mx(domain, cancel_);
    }

    /**
    Opening a session with the first candidate that accepts a connection and greets.

    Candidates that refuse, time out or greet with anything but `220` are skipped; their connections are released
    before the next one is tried.

    @param servers Candidates, in the order to try them.
    @return        Session in the `connected` state.
    @throw error   `no_usable_server` if every candidate fails, `cancelled` if cancelled.
    **/
    boost::asio::awaitable<smtp::session> select_server(const std::vector<std::string>& servers)
    {
        for (const auto& host : servers)
        {
            boost::system::error_code ec;
            std::optional<smtp::session> session = co_await open_session(host, ec);
            if (session.has_value())
            {
                MXPROBE_DEBUG("Using mail exchange " + host);
                co_return std::move(*session);
            }
            if (cancel_.cancelled())
                throw error(errc::cancelled, "Server selection cancelled.", host, ec);
        }
        throw error(errc::no_usable_server, "No working mail servers could be found.",
            boost::algorithm::join(servers, ", "));
    }

    /**
    Probing whether a server accepts the address as recipient.

    @param helo_domain Identity announced with `EHLO`.
    @param mail_from   Envelope sender.
    @param address     Address to check.
    @param servers     Candidate servers, in the order to try them.
    @return            Verdict on the recipient probe.
    @throw error       `malformed_address` for an unusable address, sender or identity; `no_usable_server`,
                       `handshake_failed`, `sender_rejected`, `protocol_error` or `cancelled` if no verdict could be
                       obtained.
    **/
    boost::asio::awaitable<smtp::verdict> check_mailbox(const std::string& helo_domain, const std::string& mail_from,
        const std::string& address, const std::vector<std::string>& servers)
    {
        parse_address(address);
        detail::ensure_no_crlf_or_nul(helo_domain, "helo domain");
        detail::ensure_no_crlf_or_nul(mail_from, "sender");

        smtp::session session = co_await select_server(servers);

        std::exception_ptr failure;
        smtp::verdict result;
        try
        {
            co_await session.hello(helo_domain);
            co_await session.mail_from(mail_from);
            const smtp::reply rep = co_await session.probe_recipient(address);
            result = smtp::interpret(rep);
            result.host = session.host();
        }
        catch (...)
        {
            failure = std::current_exception();
        }
        co_await session.close();
        if (failure)
            std::rethrow_exception(failure);

        if (result.kind == smtp::verdict_kind::indeterminate)
            MXPROBE_WARN("Unknown code returned by " + result.host + ": " + std::to_string(result.code));
        else
            MXPROBE_DEBUG("Recipient probe on " + result.host + " answered " + std::to_string(result.code));
        co_return result;
    }

    /**
    Verifying an address from scratch: domain, mail exchanges, recipient probe.

    @param address Address to check.
    @return        Verification; without verdict if the domain has no mail exchange.
    @throw error   Any of the errors of `parse_address`, `lookup_mx` and `check_mailbox`.
    **/
    boost::asio::awaitable<verification> verify(const std::string& address)
    {
        verification out;
        out.address = address;
        out.domain = extract_domain(address);
        out.servers = co_await lookup_mx(out.domain);
        if (out.servers.empty())
        {
            MXPROBE_DEBUG("No mail servers found for " + out.domain);
            co_return out;
        }

        const std::string helo = options_.helo_domain.empty() ? default_hostname() : options_.helo_domain;
        const std::string sender = options_.mail_from.empty() ? "verify@" + helo : options_.mail_from;
        out.verdict = co_await check_mailbox(helo, sender, address, out.servers);
        out.server = out.verdict->host;
        co_return out;
    }

private:
    boost::asio::awaitable<std::optional<smtp::session>> open_session(const std::string& host,
        boost::system::error_code& ec)
    {
        auto socket = co_await net::open_connection(executor_, host, options_.smtp.port, options_.smtp.connect_timeout,
            cancel_, ec);
        if (ec)
        {
            MXPROBE_DEBUG("Skipping " + host + ": " + ec.message());
            co_return std::nullopt;
        }

        smtp::session session(std::move(socket), host, options_.smtp, cancel_);
        const smtp::reply greeting = co_await session.read_greeting(ec);
        if (ec)
        {
            std::string reason = ec.message();
            if (greeting.status != 0)
                reason += " (" + std::to_string(greeting.status) + " " + greeting.message() + ")";
            MXPROBE_WARN("Could not set up SMTP session with " + host + ": " + reason);
            session.abort();
            co_return std::nullopt;
        }
        co_return std::optional<smtp::session>(std::move(session));
    }

    static std::string default_hostname()
    {
        try
        {
            return boost::asio::ip::host_name();
        }
        catch (const boost::system::system_error&)
        {
            return "localhost";
        }
    }

    executor_type executor_;
    options options_;
    cancellation_token cancel_;
};

} // namespace mxprobe
