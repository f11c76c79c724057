/*

net/dialog.hpp
--------------

Copyright (C) 2016, Tomislav Karastojkovic (http://www.alepho.com).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <optional>
#include <utility>
#include <boost/asio.hpp>
#include <mxprobe/cancellation.hpp>
#include <mxprobe/net/deadline.hpp>
#include <mxprobe/options.hpp>

namespace mxprobe::net
{

/**
Dealing with network in a line oriented fashion.

Wraps a Boost.Asio stream. Every read and write is bounded by the dialog timeout and aborted by its cancellation
token. The dialog owns the stream; `close()` releases it.
**/
template<typename Stream>
class dialog
{
public:
    static constexpr std::size_t DEFAULT_MAX_LINE_LENGTH = 8192;

    dialog(Stream stream,
        std::size_t max_line_length = DEFAULT_MAX_LINE_LENGTH,
        std::optional<duration> timeout = std::nullopt,
        cancellation_token cancel = {})
        : stream_(std::move(stream)),
          max_line_length_(max_line_length),
          timeout_(timeout),
          cancel_(std::move(cancel))
    {
    }

    /**
    Sending a line to network asynchronously.

    @param line  Line to send, CRLF is appended.
    @param token Completion token (callback, use_awaitable, etc.).
    **/
    template<typename CompletionToken>
    auto write_line(std::string_view line, CompletionToken&& token)
    {
        // Kept on the heap, the handler owning it moves while the write is pending.
        auto payload = std::make_shared<std::string>(line);
        *payload += "\r\n";
        return async_with_deadline<void(boost::system::error_code, std::size_t)>(stream_.lowest_layer(), timeout_, cancel_,
            [this, payload](auto handler)
            {
                boost::asio::async_write(stream_, boost::asio::buffer(*payload), std::move(handler));
            }, std::forward<CompletionToken>(token));
    }

    /**
    Receiving a line from network asynchronously, without the line terminator.

    A line longer than the maximum length fails with `boost::asio::error::message_size`.

    @param token Completion token.
    **/
    template<typename CompletionToken>
    auto read_line(CompletionToken&& token)
    {
        return boost::asio::async_compose<CompletionToken, void(boost::system::error_code, std::string)>(
            [this, started = false](auto& self, boost::system::error_code ec = {}, std::size_t = 0) mutable
            {
                if (!started)
                {
                    started = true;
                    if (read_buffer_.find('\n') == std::string::npos)
                    {
                        const std::size_t max_size = max_line_length_ + 2;
                        async_with_deadline<void(boost::system::error_code, std::size_t)>(stream_.lowest_layer(), timeout_, cancel_,
                            [this, max_size](auto handler)
                            {
                                auto buffer = boost::asio::dynamic_buffer(read_buffer_, max_size);
                                boost::asio::async_read_until(stream_, buffer, '\n', std::move(handler));
                            }, std::move(self));
                        return;
                    }
                }

                if (ec == boost::asio::error::not_found)
                    ec = boost::asio::error::message_size;
                if (ec)
                {
                    self.complete(ec, std::string());
                    return;
                }

                std::string line;
                ec = take_line(line);
                self.complete(ec, std::move(line));
            }, token, stream_);
    }

    bool is_open() const { return stream_.lowest_layer().is_open(); }

    /**
    Releasing the underlying socket.

    @return True if the socket was open and is closed now, false if there was nothing to release.
    **/
    bool close() noexcept
    {
        auto& socket = stream_.lowest_layer();
        if (!socket.is_open())
            return false;
        boost::system::error_code ignore_ec;
        socket.shutdown(boost::asio::socket_base::shutdown_both, ignore_ec);
        socket.close(ignore_ec);
        return true;
    }

    Stream& stream() { return stream_; }
    const Stream& stream() const { return stream_; }

    std::size_t max_line_length() const { return max_line_length_; }

    std::optional<duration> timeout() const { return timeout_; }

    const cancellation_token& cancel_token() const { return cancel_; }

protected:
    boost::system::error_code take_line(std::string& line)
    {
        const auto pos = read_buffer_.find('\n');
        if (pos == std::string::npos)
            return boost::asio::error::invalid_argument;

        const std::size_t line_length = (pos > 0 && read_buffer_[pos - 1] == '\r') ? pos - 1 : pos;
        if (line_length > max_line_length_)
            return boost::asio::error::message_size;
        line = read_buffer_.substr(0, line_length);
        read_buffer_.erase(0, pos + 1);
        return {};
    }

    Stream stream_;
    std::string read_buffer_;
    std::size_t max_line_length_;
    std::optional<duration> timeout_;
    cancellation_token cancel_;
};

} // namespace mxprobe::net
