/*

smtp/session.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <mxprobe/cancellation.hpp>
#include <mxprobe/detail/log.hpp>
#include <mxprobe/error.hpp>
#include <mxprobe/net/dialog.hpp>
#include <mxprobe/options.hpp>
#include <mxprobe/smtp/reply.hpp>

namespace mxprobe::smtp
{

/**
SMTP session used to probe one recipient.

The session owns the connection. It walks through the envelope commands in a fixed order and never sends `DATA`.
Once a step fails the session quits and releases the connection before the error is thrown, so a failed session is
always closed. The destructor releases a connection that was never closed.
**/
class session
{
public:
    using tcp = boost::asio::ip::tcp;
    using dialog_type = mxprobe::net::dialog<tcp::socket>;

    enum class state
    {
        connected,
        greeted,
        sender_declared,
        recipient_probed,
        closed
    };

    /**
    Binding a session to an established connection.

    @param socket Connected socket.
    @param host   Name of the server the socket is connected to.
    @param opts   Line length and command timeout.
    @param cancel Cancellation token for all of the session's commands.
    **/
    session(tcp::socket socket, std::string host, const session_options& opts = {}, cancellation_token cancel = {})
        : dialog_(std::move(socket), opts.max_line_length, opts.command_timeout, cancel),
          host_(std::move(host)),
          cancel_(std::move(cancel))
    {
    }

    session(session&&) = default;
    session& operator=(session&&) = delete;
    session(const session&) = delete;
    session& operator=(const session&) = delete;

    ~session()
    {
        dialog_.close();
    }

    /**
    Reading the server greeting; the session is usable only if it is `220`.

    Failures come back through the error code so that a caller can move on to another server.
    **/
    boost::asio::awaitable<reply> read_greeting(boost::system::error_code& ec)
    {
        reply rep = co_await read_reply(ec);
        if (!ec && rep.status != codes::service_ready)
            ec = make_error_code(errc::handshake_failed);
        co_return rep;
    }

    /**
    Sending `EHLO`, falling back to `HELO` if the server rejects it.

    @param domain Identity of the client.
    @throw error  `handshake_failed` if the server rejects both or the connection fails.
    **/
    boost::asio::awaitable<reply> hello(const std::string& domain)
    {
        require_state(state::connected, "EHLO");
        boost::system::error_code ec;
        reply rep = co_await command("EHLO " + domain, ec);
        if (!ec && !rep.is_positive_completion())
        {
            MXPROBE_DEBUG("EHLO rejected by " + host_ + ", trying HELO");
            rep = co_await command("HELO " + domain, ec);
        }

        if (ec || !rep.is_positive_completion())
        {
            co_await close();
            throw failure(errc::handshake_failed, ec ? "Handshake failure." : "Initial message rejection.", rep, ec);
        }
        state_ = state::greeted;
        co_return rep;
    }

    /**
    Declaring the envelope sender.

    @param address Sender address, without angle brackets.
    @throw error   `sender_rejected` on any reply but a positive completion, or if the connection fails.
    **/
    boost::asio::awaitable<reply> mail_from(const std::string& address)
    {
        require_state(state::greeted, "MAIL FROM");
        boost::system::error_code ec;
        reply rep = co_await command("MAIL FROM:<" + address + ">", ec);
        if (ec || !rep.is_positive_completion())
        {
            co_await close();
            throw failure(errc::sender_rejected, ec ? "Mail sender failure." : "Mail sender rejection.", rep, ec);
        }
        state_ = state::sender_declared;
        co_return rep;
    }

    /**
    Probing the recipient with a single `RCPT TO` and returning whatever the server answers.

    @param address Recipient address, without angle brackets.
    @throw error   `protocol_error` if the reply cannot be read or parsed.
    **/
    boost::asio::awaitable<reply> probe_recipient(const std::string& address)
    {
        require_state(state::sender_declared, "RCPT TO");
        boost::system::error_code ec;
        reply rep = co_await command("RCPT TO:<" + address + ">", ec);
        if (ec)
        {
            co_await close();
            throw failure(errc::protocol_error, "Mail recipient failure.", rep, ec);
        }
        state_ = state::recipient_probed;
        co_return rep;
    }

    /**
    Sending `QUIT` and releasing the connection.

    The reply to `QUIT` and its errors are ignored. After a transport or protocol failure the connection is released
    without `QUIT`. Calling it on a closed session does nothing.
    **/
    boost::asio::awaitable<void> close()
    {
        if (state_ == state::closed)
            co_return;
        state_ = state::closed;

        if (dialog_.is_open() && !cancel_.cancelled() && !transport_failed_)
        {
            boost::system::error_code ec;
            co_await command("QUIT", ec);
            if (ec)
                MXPROBE_DEBUG("QUIT to " + host_ + " failed: " + ec.message());
        }
        dialog_.close();
    }

    /**
    Releasing the connection without `QUIT`, for a server that never completed its greeting.
    **/
    void abort() noexcept
    {
        state_ = state::closed;
        dialog_.close();
    }

    state current_state() const noexcept { return state_; }

    const std::string& host() const noexcept { return host_; }

    bool is_open() const { return dialog_.is_open(); }

private:
    void require_state(state expected, const char* command_name) const
    {
        if (state_ != expected)
            throw error(errc::protocol_error, "Command out of sequence.", std::string(command_name) + " to " + host_);
    }

    error failure(errc kind, const char* msg, const reply& rep, const boost::system::error_code& ec) const
    {
        if (ec == boost::asio::error::operation_aborted && cancel_.cancelled())
            return error(errc::cancelled, "Session cancelled.", host_, ec);

        std::string details = host_;
        const std::string text = rep.message();
        if (rep.status != 0)
            details += ": " + std::to_string(rep.status) + " " + text;
        else if (!text.empty())
            details += ": " + text;
        return error(kind, msg, details, ec);
    }

    boost::asio::awaitable<reply> command(std::string_view line, boost::system::error_code& ec)
    {
        log::logger::instance().trace_protocol("SMTP", log::direction::send, line);
        co_await dialog_.write_line(line, boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec)
        {
            transport_failed_ = true;
            co_return reply{};
        }
        co_return co_await read_reply(ec);
    }

    boost::asio::awaitable<reply> read_reply(boost::system::error_code& ec)
    {
        reply rep;

        while (true)
        {
            std::string line = co_await dialog_.read_line(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
            if (ec)
            {
                transport_failed_ = true;
                co_return rep;
            }
            log::logger::instance().trace_protocol("SMTP", log::direction::receive, line);

            auto parsed = parse_reply_line(line);
            if (!parsed.has_value() || (rep.status != 0 && rep.status != parsed->status))
            {
                ec = make_error_code(errc::protocol_error);
                transport_failed_ = true;
                rep.status = 0;
                rep.lines.assign(1, line);
                co_return rep;
            }

            rep.status = parsed->status;
            rep.lines.push_back(std::move(parsed->text));
            if (parsed->last)
                co_return rep;
        }
    }

    dialog_type dialog_;
    std::string host_;
    cancellation_token cancel_;
    state state_ = state::connected;
    // Set once a read or write failed; the stream is out of step with the server.
    bool transport_failed_ = false;
};

} // namespace mxprobe::smtp
