/*

detail/log.hpp
--------------

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#pragma once

#include <atomic>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace mxprobe::log
{

enum class level
{
    trace,
    debug,
    info,
    warn,
    error,
    off
};

enum class direction
{
    send,
    receive
};

inline const char* to_string(level lvl) noexcept
{
    switch (lvl)
    {
        case level::trace: return "trace";
        case level::debug: return "debug";
        case level::info: return "info";
        case level::warn: return "warn";
        case level::error: return "error";
        case level::off: return "off";
    }
    return "unknown";
}

/**
Process wide logger.

Messages below the current level are dropped before the sink sees them. The sink is replaceable, the default one
writes `[level] message` lines to `std::clog`.
**/
class logger
{
public:
    using sink_type = std::function<void(level, const std::string&)>;

    static logger& instance()
    {
        static logger inst;
        return inst;
    }

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;

    void set_level(level lvl) noexcept { level_.store(lvl, std::memory_order_relaxed); }

    level get_level() const noexcept { return level_.load(std::memory_order_relaxed); }

    bool is_enabled(level lvl) const noexcept
    {
        return lvl != level::off && lvl >= get_level();
    }

    bool is_trace_enabled() const noexcept { return is_enabled(level::trace); }

    /**
    Replacing the sink; an empty function restores the default one.
    **/
    void set_sink(sink_type sink)
    {
        std::lock_guard<std::mutex> guard(mutex_);
        sink_ = sink ? std::move(sink) : default_sink();
    }

    void write(level lvl, const std::string& message)
    {
        if (!is_enabled(lvl))
            return;
        std::lock_guard<std::mutex> guard(mutex_);
        sink_(lvl, message);
    }

    void trace_protocol(std::string_view protocol, direction dir, std::string_view line)
    {
        if (!is_trace_enabled())
            return;

        std::string out;
        out.reserve(protocol.size() + line.size() + 4);
        out.append(protocol);
        out += (dir == direction::send) ? " C: " : " S: ";
        out.append(line);
        write(level::trace, out);
    }

private:
    logger() : sink_(default_sink())
    {
    }

    static sink_type default_sink()
    {
        return [](level lvl, const std::string& message)
        {
            std::clog << '[' << to_string(lvl) << "] " << message << std::endl;
        };
    }

    std::atomic<level> level_{level::info};
    std::mutex mutex_;
    sink_type sink_;
};

} // namespace mxprobe::log


#define MXPROBE_LOG(lvl, ...)                                                   \
    do                                                                          \
    {                                                                           \
        auto& mxprobe_logger_ = ::mxprobe::log::logger::instance();             \
        if (mxprobe_logger_.is_enabled(lvl))                                    \
            mxprobe_logger_.write(lvl, __VA_ARGS__);                            \
    } while (false)

#define MXPROBE_TRACE(...) MXPROBE_LOG(::mxprobe::log::level::trace, __VA_ARGS__)
#define MXPROBE_DEBUG(...) MXPROBE_LOG(::mxprobe::log::level::debug, __VA_ARGS__)
#define MXPROBE_INFO(...) MXPROBE_LOG(::mxprobe::log::level::info, __VA_ARGS__)
#define MXPROBE_WARN(...) MXPROBE_LOG(::mxprobe::log::level::warn, __VA_ARGS__)
#define MXPROBE_ERROR(...) MXPROBE_LOG(::mxprobe::log::level::error, __VA_ARGS__)
