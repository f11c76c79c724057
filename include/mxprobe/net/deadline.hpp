/*

net/deadline.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <memory>
#include <optional>
#include <utility>
#include <boost/asio.hpp>
#include <mxprobe/cancellation.hpp>
#include <mxprobe/options.hpp>

namespace mxprobe::net
{

namespace detail
{

template<typename IoObject>
void cancel_io(IoObject& io)
{
    if constexpr (requires(IoObject& obj, boost::system::error_code& ec) { obj.cancel(ec); })
    {
        boost::system::error_code ignore_ec;
        io.cancel(ignore_ec);
    }
    else
        io.cancel();
}

} // namespace detail


/**
Running an asynchronous operation on an I/O object with a deadline and a cancellation token.

Both the expiry and the cancellation request cancel the I/O object. An expired operation completes with
`boost::asio::error::timed_out`, a cancelled one with `boost::asio::error::operation_aborted`. The I/O object must be
used from a single thread (or strand).

@param io         I/O object the operation runs on.
@param timeout    Deadline, none if not set.
@param cancel     Cancellation token.
@param initiation Callable starting the operation with the handler given.
@param token      Completion token.
**/
template<typename Signature, typename IoObject, typename Initiation, typename CompletionToken>
auto async_with_deadline(IoObject& io, std::optional<duration> timeout, cancellation_token cancel,
    Initiation initiation, CompletionToken&& token)
{
    struct deadline_state
    {
        bool done = false;
        bool timed_out = false;
    };

    return boost::asio::async_compose<CompletionToken, Signature>(
        [&io, timeout, cancel = std::move(cancel), initiation = std::move(initiation),
            state = std::make_shared<deadline_state>(),
            timer = std::shared_ptr<boost::asio::steady_timer>(),
            registration = cancellation_registration(),
            started = false](auto& self, boost::system::error_code ec = {}, auto... results) mutable
        {
            if (!started)
            {
                started = true;
                auto executor = io.get_executor();
                if (timeout.has_value())
                {
                    timer = std::make_shared<boost::asio::steady_timer>(executor);
                    timer->expires_after(*timeout);
                    timer->async_wait([&io, state](boost::system::error_code timer_ec)
                    {
                        if (timer_ec || state->done)
                            return;
                        state->timed_out = true;
                        detail::cancel_io(io);
                    });
                }
                registration = cancel.on_cancel([&io, state, executor]()
                {
                    boost::asio::post(executor, [&io, state]()
                    {
                        if (!state->done)
                            detail::cancel_io(io);
                    });
                });
                initiation(std::move(self));
                return;
            }

            if constexpr (requires { self.complete(ec, std::move(results)...); })
            {
                state->done = true;
                if (timer)
                    timer->cancel();
                registration.reset();
                if (state->timed_out && ec == boost::asio::error::operation_aborted)
                    ec = boost::asio::error::timed_out;
                self.complete(ec, std::move(results)...);
            }
        }, token, io);
}

} // namespace mxprobe::net
