/*

mxprobe.cpp
-----------

Checks whether email addresses are likely deliverable by asking their mail exchanges.

Copyright (C) 2025, Sylvain Guinebert (github.com/sguinebert).

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <stdexcept>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <mxprobe/mxprobe.hpp>

using mxprobe::cancellation_source;
using mxprobe::errc;
using mxprobe::error;
using mxprobe::verification;
using mxprobe::verifier;
using mxprobe::smtp::verdict_kind;


struct command_line
{
    mxprobe::options opts;
    std::vector<std::string> addresses;
    mxprobe::log::level level = mxprobe::log::level::info;
};


void usage(const char* program)
{
    std::cerr << "usage: " << std::filesystem::path(program).filename().string()
        << " [--helo DOMAIN] [--from ADDRESS] [--dns HOST[:PORT] | [IPV6]:PORT] [--timeout SECONDS] [--verbose] [--trace]"
        << " email ..." << std::endl;
}


std::optional<command_line> parse_command_line(int argc, char* argv[])
{
    command_line cmd;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "--verbose")
            cmd.level = mxprobe::log::level::debug;
        else if (arg == "--trace")
            cmd.level = mxprobe::log::level::trace;
        else if (arg == "--helo" && has_value)
            cmd.opts.helo_domain = argv[++i];
        else if (arg == "--from" && has_value)
            cmd.opts.mail_from = argv[++i];
        else if (arg == "--dns" && has_value)
        {
            try
            {
                mxprobe::set_name_server(cmd.opts.dns, argv[++i]);
            }
            catch (const std::invalid_argument&)
            {
                return std::nullopt;
            }
        }
        else if (arg == "--timeout" && has_value)
        {
            try
            {
                const std::chrono::seconds timeout(std::stoul(argv[++i]));
                cmd.opts.dns.timeout = timeout;
                cmd.opts.smtp.connect_timeout = timeout;
                cmd.opts.smtp.command_timeout = timeout;
            }
            catch (const std::exception&)
            {
                return std::nullopt;
            }
        }
        else if (boost::algorithm::starts_with(arg, "--"))
            return std::nullopt;
        else
            cmd.addresses.push_back(arg);
    }

    if (cmd.addresses.empty())
        return std::nullopt;
    return cmd;
}


boost::asio::awaitable<int> verify_one(verifier& checker, const std::string& address)
{
    try
    {
        const verification result = co_await checker.verify(address);
        if (!result.verdict.has_value())
        {
            MXPROBE_INFO("no mail servers found for " + address);
            co_return EXIT_SUCCESS;
        }

        const auto& outcome = *result.verdict;
        switch (outcome.kind)
        {
            case verdict_kind::valid:
                MXPROBE_INFO(address + " seems to be valid");
                co_return EXIT_SUCCESS;
            case verdict_kind::invalid:
                MXPROBE_INFO(address + " seems to be invalid (email does not seem to exist or server blocks detection: "
                    + outcome.reason + ")");
                break;
            case verdict_kind::blocked:
                MXPROBE_INFO(address + " could not be checked (our address appears to be blacklisted by "
                    + outcome.host + ": " + outcome.reason + ")");
                break;
            case verdict_kind::indeterminate:
                MXPROBE_INFO(address + " could not be verified (" + outcome.host + " answered "
                    + std::to_string(outcome.code) + " " + outcome.reason + ")");
                break;
        }
        co_return EXIT_FAILURE;
    }
    catch (const error& exc)
    {
        std::string reason = std::string(exc.what()) + " " + exc.details();
        if (exc.cause())
            reason += " (" + exc.cause().message() + ")";

        switch (exc.kind())
        {
            case errc::malformed_address:
                MXPROBE_ERROR("could not extract domain: " + reason);
                break;
            case errc::resolution_failed:
                MXPROBE_ERROR("could not retrieve mail server: " + reason);
                break;
            case errc::cancelled:
                MXPROBE_WARN("verification of " + address + " cancelled");
                break;
            default:
                MXPROBE_INFO(address + " could not be verified (" + reason + ")");
                break;
        }
        co_return EXIT_FAILURE;
    }
}


boost::asio::awaitable<int> verify_all(verifier& checker, const std::vector<std::string>& addresses,
    const cancellation_source& cancel)
{
    const bool single = addresses.size() == 1;
    for (const auto& address : addresses)
    {
        const int status = co_await verify_one(checker, address);
        if (single)
            co_return status;
        if (cancel.cancelled())
            co_return EXIT_FAILURE;
    }
    co_return EXIT_SUCCESS;
}


int main(int argc, char* argv[])
{
    const std::optional<command_line> cmd = parse_command_line(argc, argv);
    if (!cmd.has_value())
    {
        usage(argv[0]);
        return 2;
    }
    mxprobe::log::logger::instance().set_level(cmd->level);

    int status = EXIT_FAILURE;
    try
    {
        boost::asio::io_context io_ctx;
        cancellation_source cancel;
        verifier checker(io_ctx, cmd->opts, cancel.token());

        boost::asio::signal_set signals(io_ctx, SIGINT, SIGTERM);
        signals.async_wait([&cancel](const boost::system::error_code& ec, int)
        {
            if (ec)
                return;
            MXPROBE_WARN("interrupted, cancelling");
            cancel.cancel();
        });

        boost::asio::co_spawn(io_ctx, verify_all(checker, cmd->addresses, cancel),
            [&status, &signals](std::exception_ptr eptr, int result)
            {
                boost::system::error_code ignore_ec;
                signals.cancel(ignore_ec);
                if (eptr)
                    std::rethrow_exception(eptr);
                status = result;
            });
        io_ctx.run();
    }
    catch (std::exception& e)
    {
        MXPROBE_ERROR(std::string("Main Error: ") + e.what());
    }
    return status;
}
