/*

cancellation.hpp
----------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace mxprobe
{

namespace detail
{

class cancellation_state
{
public:
    using handler_type = std::function<void()>;

    bool cancelled() const noexcept
    {
        return cancelled_.load(std::memory_order_acquire);
    }

    /// Returns zero when the state is already cancelled; the handler has run by then.
    std::uint64_t subscribe(handler_type handler)
    {
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (!cancelled_.load(std::memory_order_relaxed))
            {
                const std::uint64_t id = ++next_id_;
                handlers_.emplace(id, std::move(handler));
                return id;
            }
        }
        handler();
        return 0;
    }

    void unsubscribe(std::uint64_t id)
    {
        std::lock_guard<std::mutex> guard(mutex_);
        handlers_.erase(id);
    }

    void cancel()
    {
        std::map<std::uint64_t, handler_type> handlers;
        {
            std::lock_guard<std::mutex> guard(mutex_);
            if (cancelled_.load(std::memory_order_relaxed))
                return;
            cancelled_.store(true, std::memory_order_release);
            handlers.swap(handlers_);
        }
        for (auto& entry : handlers)
            entry.second();
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::uint64_t next_id_{0};
    std::map<std::uint64_t, handler_type> handlers_;
};

} // namespace detail


/**
Keeps a cancellation handler registered for as long as it lives.
**/
class cancellation_registration
{
public:
    cancellation_registration() noexcept = default;

    cancellation_registration(std::shared_ptr<detail::cancellation_state> state, std::uint64_t id) noexcept
        : state_(std::move(state)), id_(id)
    {
    }

    cancellation_registration(const cancellation_registration&) = delete;
    cancellation_registration& operator=(const cancellation_registration&) = delete;

    cancellation_registration(cancellation_registration&& other) noexcept
        : state_(std::move(other.state_)), id_(std::exchange(other.id_, 0))
    {
    }

    cancellation_registration& operator=(cancellation_registration&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            state_ = std::move(other.state_);
            id_ = std::exchange(other.id_, 0);
        }
        return *this;
    }

    ~cancellation_registration()
    {
        reset();
    }

    void reset() noexcept
    {
        if (state_ != nullptr && id_ != 0)
            state_->unsubscribe(id_);
        state_.reset();
        id_ = 0;
    }

private:
    std::shared_ptr<detail::cancellation_state> state_;
    std::uint64_t id_{0};
};


/**
Observer side of a cancellation source. A default constructed token is never cancelled.
**/
class cancellation_token
{
public:
    cancellation_token() = default;

    bool cancelled() const noexcept
    {
        return state_ != nullptr && state_->cancelled();
    }

    bool can_be_cancelled() const noexcept
    {
        return state_ != nullptr;
    }

    /**
    Registering a handler for the cancellation request.

    The handler runs on the thread requesting the cancellation, or right away if the cancellation was already
    requested.
    **/
    [[nodiscard]] cancellation_registration on_cancel(std::function<void()> handler) const
    {
        if (state_ == nullptr)
            return cancellation_registration();
        const std::uint64_t id = state_->subscribe(std::move(handler));
        return cancellation_registration(state_, id);
    }

private:
    friend class cancellation_source;

    explicit cancellation_token(std::shared_ptr<detail::cancellation_state> state)
        : state_(std::move(state))
    {
    }

    std::shared_ptr<detail::cancellation_state> state_;
};


class cancellation_source
{
public:
    cancellation_source()
        : state_(std::make_shared<detail::cancellation_state>())
    {
    }

    /// Thread safe; only the first call has an effect.
    void cancel()
    {
        state_->cancel();
    }

    bool cancelled() const noexcept
    {
        return state_->cancelled();
    }

    cancellation_token token() const
    {
        return cancellation_token(state_);
    }

private:
    std::shared_ptr<detail::cancellation_state> state_;
};

} // namespace mxprobe
