/*

test_verifier.cpp
-----------------

Copyright (C) 2025, Sylvain Guinebert.

Distributed under the FreeBSD license, see the accompanying file LICENSE or
copy at http://www.freebsd.org/copyright/freebsd-license.html.

*/


#define BOOST_TEST_MODULE verifier_test

#include <chrono>
#include <string>
#include <utility>
#include <vector>
#include <boost/asio.hpp>
#include <boost/test/unit_test.hpp>
#include <mxprobe/mxprobe.hpp>
#include "fake_dns_server.hpp"
#include "fake_smtp_server.hpp"
#include "run_task.hpp"

using mxprobe::cancellation_source;
using mxprobe::errc;
using mxprobe::error;
using mxprobe::options;
using mxprobe::verification;
using mxprobe::verifier;
using mxprobe::smtp::verdict;
using mxprobe::smtp::verdict_kind;
using mxprobe::test::dns_script;
using mxprobe::test::drain;
using mxprobe::test::fake_dns_server;
using mxprobe::test::fake_smtp_server;
using mxprobe::test::run_task;
using mxprobe::test::smtp_script;
using std::string;
using std::vector;

namespace mxlog = mxprobe::log;


namespace
{

const string HELO = "client.test";
const string SENDER = "probe@client.test";
const string ADDRESS = "user@example.com";

options local_options(unsigned short smtp_port)
{
    options opts;
    opts.helo_domain = HELO;
    opts.smtp.port = smtp_port;
    opts.smtp.connect_timeout = std::chrono::seconds(2);
    opts.smtp.command_timeout = std::chrono::seconds(2);
    opts.dns.server = "127.0.0.1";
    opts.dns.timeout = std::chrono::milliseconds(500);
    return opts;
}

smtp_script recipient_reply(const string& rcpt_to)
{
    smtp_script script;
    script.rcpt_to = rcpt_to;
    return script;
}

bool is_kind(const error& exc, errc kind)
{
    return exc.kind() == kind;
}


/**
Capturing the log messages of a level for the lifetime of the object.
**/
class log_capture
{
public:
    explicit log_capture(mxlog::level lvl) : previous_(mxlog::logger::instance().get_level())
    {
        mxlog::logger::instance().set_level(lvl);
        mxlog::logger::instance().set_sink([this](mxlog::level msg_level, const string& message)
        {
            messages.push_back(string(mxlog::to_string(msg_level)) + ": " + message);
        });
    }

    ~log_capture()
    {
        mxlog::logger::instance().set_sink({});
        mxlog::logger::instance().set_level(previous_);
    }

    bool contains(const string& text) const
    {
        for (const auto& message : messages)
            if (message.find(text) != string::npos)
                return true;
        return false;
    }

    vector<string> messages;

private:
    mxlog::level previous_;
};

} // namespace


BOOST_AUTO_TEST_CASE(accepted_recipient_is_valid)
{
    boost::asio::io_context ctx;
    fake_smtp_server server(ctx, recipient_reply("250 2.1.5 Ok"));
    verifier v(ctx, local_options(server.port()));

    const verdict result = run_task(ctx, v.check_mailbox(HELO, SENDER, ADDRESS, {"127.0.0.1"}));
    BOOST_CHECK(result.kind == verdict_kind::valid);
    BOOST_CHECK_EQUAL(result.code, 250);
    BOOST_CHECK_EQUAL(result.host, "127.0.0.1");

    drain(ctx);
    BOOST_CHECK_EQUAL(server.connections(), 1U);
    BOOST_CHECK_EQUAL(server.closed_connections(), 1U);
    const vector<string> transcript = {"EHLO client.test", "MAIL FROM:<probe@client.test>", "RCPT TO:<user@example.com>",
        "QUIT"};
    const auto& got = server.transcripts()[0];
    BOOST_CHECK_EQUAL_COLLECTIONS(got.begin(), got.end(), transcript.begin(), transcript.end());
}

BOOST_AUTO_TEST_CASE(unknown_recipient_is_invalid)
{
    boost::asio::io_context ctx;
    fake_smtp_server server(ctx, recipient_reply("550 5.1.1 User unknown"));
    verifier v(ctx, local_options(server.port()));

    const verdict result = run_task(ctx, v.check_mailbox(HELO, SENDER, "nobody@example.com", {"127.0.0.1"}));
    BOOST_CHECK(result.kind == verdict_kind::invalid);
    BOOST_CHECK_EQUAL(result.code, 550);
    BOOST_CHECK_EQUAL(result.reason, "5.1.1 User unknown");

    drain(ctx);
    BOOST_CHECK_EQUAL(server.closed_connections(), 1U);
}

BOOST_AUTO_TEST_CASE(refused_transaction_is_blocked)
{
    boost::asio::io_context ctx;
    fake_smtp_server server(ctx, recipient_reply("554 5.7.1 Relay access denied"));
    verifier v(ctx, local_options(server.port()));

    const verdict result = run_task(ctx, v.check_mailbox(HELO, SENDER, ADDRESS, {"127.0.0.1"}));
    BOOST_CHECK(result.kind == verdict_kind::blocked);
    BOOST_CHECK_EQUAL(result.code, 554);

    drain(ctx);
    BOOST_CHECK_EQUAL(server.closed_connections(), 1U);
}

BOOST_AUTO_TEST_CASE(unknown_code_is_indeterminate)
{
    boost::asio::io_context ctx;
    fake_smtp_server server(ctx, recipient_reply("451 4.7.1 Greylisted, try again later"));
    verifier v(ctx, local_options(server.port()));
    log_capture capture(mxlog::level::warn);

    const verdict result = run_task(ctx, v.check_mailbox(HELO, SENDER, ADDRESS, {"127.0.0.1"}));
    BOOST_CHECK(result.kind == verdict_kind::indeterminate);
    BOOST_CHECK_EQUAL(result.code, 451);
    BOOST_CHECK(capture.contains("warn: Unknown code returned by 127.0.0.1: 451"));

    drain(ctx);
    BOOST_CHECK_EQUAL(server.closed_connections(), 1U);
}

BOOST_AUTO_TEST_CASE(refusing_server_skipped)
{
    boost::asio::io_context ctx;
    fake_smtp_server server(ctx, smtp_script{});
    verifier v(ctx, local_options(server.port()));

    const verdict result = run_task(ctx, v.check_mailbox(HELO, SENDER, ADDRESS, {"127.0.0.2", "127.0.0.1"}));
    BOOST_CHECK(result.kind == verdict_kind::valid);
    BOOST_CHECK_EQUAL(result.host, "127.0.0.1");

    drain(ctx);
    BOOST_CHECK_EQUAL(server.connections(), 1U);
    BOOST_CHECK_EQUAL(server.closed_connections(), 1U);
}

BOOST_AUTO_TEST_CASE(several_refusing_servers_skipped)
{
    boost::asio::io_context ctx;
    fake_smtp_server server(ctx, smtp_script{}, "127.0.0.5");
    verifier v(ctx, local_options(server.port()));

    const verdict result = run_task(ctx, v.check_mailbox(HELO, SENDER, ADDRESS,
        {"127.0.0.2", "127.0.0.3", "127.0.0.4", "127.0.0.5"}));
    BOOST_CHECK(result.kind == verdict_kind::valid);
    BOOST_CHECK_EQUAL(result.host, "127.0.0.5");
    BOOST_CHECK_EQUAL(server.connections(), 1U);
}

BOOST_AUTO_TEST_CASE(selection_stops_at_first_usable_server)
{
    boost::asio::io_context ctx;
    fake_smtp_server first(ctx, smtp_script{});
    fake_smtp_server second(ctx, smtp_script{}, "127.0.0.4", first.port());
    verifier v(ctx, local_options(first.port()));

    const verdict result = run_task(ctx, v.check_mailbox(HELO, SENDER, ADDRESS, {"127.0.0.1", "127.0.0.4"}));
    BOOST_CHECK(result.kind == verdict_kind::valid);
    BOOST_CHECK_EQUAL(result.host, "127.0.0.1");

    drain(ctx);
    BOOST_CHECK_EQUAL(first.connections(), 1U);
    BOOST_CHECK_EQUAL(second.connections(), 0U);
}

BOOST_AUTO_TEST_CASE(silent_server_skipped)
{
    boost::asio::io_context ctx;
    smtp_script silent;
    silent.silent = true;
    fake_smtp_server mute(ctx, silent);
    fake_smtp_server server(ctx, smtp_script{}, "127.0.0.3", mute.port());
    auto opts = local_options(mute.port());
    opts.smtp.command_timeout = std::chrono::milliseconds(300);
    verifier v(ctx, opts);

    const verdict result = run_task(ctx, v.check_mailbox(HELO, SENDER, ADDRESS, {"127.0.0.1", "127.0.0.3"}));
    BOOST_CHECK(result.kind == verdict_kind::valid);
    BOOST_CHECK_EQUAL(result.host, "127.0.0.3");

    drain(ctx);
    BOOST_CHECK_EQUAL(mute.connections(), 1U);
    BOOST_CHECK_EQUAL(mute.closed_connections(), 1U);
    BOOST_CHECK_EQUAL(server.closed_connections(), 1U);
}

BOOST_AUTO_TEST_CASE(rejecting_greeting_skipped)
{
    boost::asio::io_context ctx;
    smtp_script busy;
    busy.greeting = "421 4.3.2 Service not available";
    fake_smtp_server rejecting(ctx, busy);
    fake_smtp_server server(ctx, smtp_script{}, "127.0.0.3", rejecting.port());
    verifier v(ctx, local_options(rejecting.port()));

    const verdict result = run_task(ctx, v.check_mailbox(HELO, SENDER, ADDRESS, {"127.0.0.1", "127.0.0.3"}));
    BOOST_CHECK(result.kind == verdict_kind::valid);
    BOOST_CHECK_EQUAL(result.host, "127.0.0.3");

    drain(ctx);
    BOOST_CHECK_EQUAL(rejecting.closed_connections(), 1U);
    BOOST_CHECK(rejecting.transcripts()[0].empty());
}

BOOST_AUTO_TEST_CASE(no_usable_server)
{
    boost::asio::io_context ctx;
    fake_smtp_server server(ctx, smtp_script{});
    verifier v(ctx, local_options(server.port()));

    try
    {
        run_task(ctx, v.check_mailbox(HELO, SENDER, ADDRESS, {"127.0.0.2", "127.0.0.3"}));
        BOOST_FAIL("verdict without a server");
    }
    catch (const error& exc)
    {
        BOOST_CHECK(exc.kind() == errc::no_usable_server);
        BOOST_CHECK_EQUAL(exc.details(), "127.0.0.2, 127.0.0.3");
    }
    BOOST_CHECK_EQUAL(server.connections(), 0U);
}

BOOST_AUTO_TEST_CASE(empty_server_list)
{
    boost::asio::io_context ctx;
    verifier v(ctx, local_options(25));

    BOOST_CHECK_EXCEPTION(run_task(ctx, v.check_mailbox(HELO, SENDER, ADDRESS, {})), error,
        [](const error& exc) { return is_kind(exc, errc::no_usable_server); });
}

BOOST_AUTO_TEST_CASE(handshake_failure_releases_connection)
{
    boost::asio::io_context ctx;
    smtp_script script;
    script.ehlo = "554 5.7.1 Go away";
    script.helo = "554 5.7.1 Go away";
    fake_smtp_server server(ctx, script);
    verifier v(ctx, local_options(server.port()));

    BOOST_CHECK_EXCEPTION(run_task(ctx, v.check_mailbox(HELO, SENDER, ADDRESS, {"127.0.0.1"})), error,
        [](const error& exc) { return is_kind(exc, errc::handshake_failed); });

    drain(ctx);
    BOOST_CHECK_EQUAL(server.closed_connections(), 1U);
    BOOST_CHECK_EQUAL(server.transcripts()[0].back(), "QUIT");
}

BOOST_AUTO_TEST_CASE(sender_rejection_releases_connection)
{
    boost::asio::io_context ctx;
    smtp_script script;
    script.mail_from = "550 5.7.1 Sender rejected";
    fake_smtp_server server(ctx, script);
    verifier v(ctx, local_options(server.port()));

    BOOST_CHECK_EXCEPTION(run_task(ctx, v.check_mailbox(HELO, SENDER, ADDRESS, {"127.0.0.1"})), error,
        [](const error& exc) { return is_kind(exc, errc::sender_rejected); });

    drain(ctx);
    BOOST_CHECK_EQUAL(server.closed_connections(), 1U);
    BOOST_CHECK_EQUAL(server.transcripts()[0].size(), 3U);
}

BOOST_AUTO_TEST_CASE(dropped_connection_is_protocol_error)
{
    boost::asio::io_context ctx;
    smtp_script script;
    script.drop_on_rcpt = true;
    fake_smtp_server server(ctx, script);
    verifier v(ctx, local_options(server.port()));

    BOOST_CHECK_EXCEPTION(run_task(ctx, v.check_mailbox(HELO, SENDER, ADDRESS, {"127.0.0.1"})), error,
        [](const error& exc) { return is_kind(exc, errc::protocol_error); });

    drain(ctx);
    BOOST_CHECK_EQUAL(server.closed_connections(), 1U);
}

BOOST_AUTO_TEST_CASE(stalled_recipient_reply_times_out)
{
    boost::asio::io_context ctx;
    smtp_script script;
    script.stall_on_rcpt = true;
    fake_smtp_server server(ctx, script);
    auto opts = local_options(server.port());
    opts.smtp.command_timeout = std::chrono::milliseconds(400);
    verifier v(ctx, opts);

    const auto start = std::chrono::steady_clock::now();
    try
    {
        run_task(ctx, v.check_mailbox(HELO, SENDER, ADDRESS, {"127.0.0.1"}));
        BOOST_FAIL("verdict without a recipient reply");
    }
    catch (const error& exc)
    {
        BOOST_CHECK(exc.kind() == errc::protocol_error);
        BOOST_CHECK(exc.cause() == boost::asio::error::timed_out);
    }
    BOOST_CHECK(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(600));

    drain(ctx);
    BOOST_CHECK_EQUAL(server.closed_connections(), 1U);
    const auto& got = server.transcripts()[0];
    BOOST_REQUIRE_EQUAL(got.size(), 3U);
    BOOST_CHECK_EQUAL(got.back(), "RCPT TO:<user@example.com>");
}

BOOST_AUTO_TEST_CASE(malformed_input_rejected_before_connecting)
{
    boost::asio::io_context ctx;
    fake_smtp_server server(ctx, smtp_script{});
    verifier v(ctx, local_options(server.port()));

    BOOST_CHECK_EXCEPTION(run_task(ctx, v.check_mailbox(HELO, SENDER, "user.example.com", {"127.0.0.1"})), error,
        [](const error& exc) { return is_kind(exc, errc::malformed_address); });
    BOOST_CHECK_EXCEPTION(run_task(ctx, v.check_mailbox("client.test\r\nRSET", SENDER, ADDRESS, {"127.0.0.1"})), error,
        [](const error& exc) { return is_kind(exc, errc::malformed_address); });
    BOOST_CHECK_EXCEPTION(run_task(ctx, v.check_mailbox(HELO, "probe@client.test\n", ADDRESS, {"127.0.0.1"})), error,
        [](const error& exc) { return is_kind(exc, errc::malformed_address); });
    BOOST_CHECK_EQUAL(server.connections(), 0U);
}

BOOST_AUTO_TEST_CASE(cancelled_before_selection)
{
    boost::asio::io_context ctx;
    fake_smtp_server server(ctx, smtp_script{});
    cancellation_source source;
    source.cancel();
    verifier v(ctx, local_options(server.port()), source.token());

    BOOST_CHECK_EXCEPTION(run_task(ctx, v.check_mailbox(HELO, SENDER, ADDRESS, {"127.0.0.1", "127.0.0.2"})), error,
        [](const error& exc) { return is_kind(exc, errc::cancelled); });
    BOOST_CHECK_EQUAL(server.connections(), 0U);
}

BOOST_AUTO_TEST_CASE(cancelled_while_waiting_for_greeting)
{
    boost::asio::io_context ctx;
    smtp_script silent;
    silent.silent = true;
    fake_smtp_server mute(ctx, silent);
    fake_smtp_server server(ctx, smtp_script{}, "127.0.0.3", mute.port());
    cancellation_source source;
    auto opts = local_options(mute.port());
    opts.smtp.command_timeout = std::chrono::seconds(5);
    verifier v(ctx, opts, source.token());

    boost::asio::steady_timer timer(ctx, std::chrono::milliseconds(100));
    timer.async_wait([&source](boost::system::error_code ec)
    {
        if (!ec)
            source.cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    BOOST_CHECK_EXCEPTION(run_task(ctx, v.check_mailbox(HELO, SENDER, ADDRESS, {"127.0.0.1", "127.0.0.3"})), error,
        [](const error& exc) { return is_kind(exc, errc::cancelled); });
    BOOST_CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(4));

    drain(ctx);
    BOOST_CHECK_EQUAL(mute.closed_connections(), 1U);
    BOOST_CHECK_EQUAL(server.connections(), 0U);
}

BOOST_AUTO_TEST_CASE(verify_through_mail_exchange)
{
    boost::asio::io_context ctx;
    fake_smtp_server server(ctx, smtp_script{});
    dns_script dns_answers;
    dns_answers.answers = {{20, "127.0.0.1"}, {10, "127.0.0.2"}};
    fake_dns_server dns(ctx, dns_answers);
    auto opts = local_options(server.port());
    opts.dns.port = dns.port();
    verifier v(ctx, opts);

    const verification result = run_task(ctx, v.verify(ADDRESS));
    BOOST_CHECK_EQUAL(result.address, ADDRESS);
    BOOST_CHECK_EQUAL(result.domain, "example.com");
    BOOST_CHECK(result.accepts_mail());
    const vector<string> servers = {"127.0.0.2", "127.0.0.1"};
    BOOST_CHECK_EQUAL_COLLECTIONS(result.servers.begin(), result.servers.end(), servers.begin(), servers.end());
    BOOST_REQUIRE(result.verdict.has_value());
    BOOST_CHECK(result.verdict->kind == verdict_kind::valid);
    BOOST_CHECK_EQUAL(result.verdict->host, "127.0.0.1");
    BOOST_CHECK_EQUAL(result.server, "127.0.0.1");
    BOOST_CHECK_EQUAL(dns.last_question(), "example.com");

    drain(ctx);
    BOOST_CHECK_EQUAL(server.connections(), 1U);
    BOOST_CHECK_EQUAL(server.transcripts()[0][1], "MAIL FROM:<verify@client.test>");
}

BOOST_AUTO_TEST_CASE(verify_domain_without_mail_exchange)
{
    boost::asio::io_context ctx;
    fake_smtp_server server(ctx, smtp_script{});
    fake_dns_server dns(ctx, dns_script{});
    auto opts = local_options(server.port());
    opts.dns.port = dns.port();
    verifier v(ctx, opts);

    const verification result = run_task(ctx, v.verify("user@nomail.example.com"));
    BOOST_CHECK_EQUAL(result.domain, "nomail.example.com");
    BOOST_CHECK(!result.accepts_mail());
    BOOST_CHECK(!result.verdict.has_value());
    BOOST_CHECK(result.server.empty());
    BOOST_CHECK_EQUAL(server.connections(), 0U);
}

BOOST_AUTO_TEST_CASE(verify_malformed_address_skips_lookup)
{
    boost::asio::io_context ctx;
    fake_dns_server dns(ctx, dns_script{});
    auto opts = local_options(25);
    opts.dns.port = dns.port();
    verifier v(ctx, opts);

    BOOST_CHECK_EXCEPTION(run_task(ctx, v.verify("user@a@example.com")), error,
        [](const error& exc) { return is_kind(exc, errc::malformed_address); });
    BOOST_CHECK_EQUAL(dns.queries(), 0U);
}

BOOST_AUTO_TEST_CASE(verify_resolution_failure)
{
    boost::asio::io_context ctx;
    dns_script nxdomain;
    nxdomain.rcode = 3;
    fake_dns_server dns(ctx, nxdomain);
    auto opts = local_options(25);
    opts.dns.port = dns.port();
    verifier v(ctx, opts);

    BOOST_CHECK_EXCEPTION(run_task(ctx, v.verify("user@nowhere.invalid")), error,
        [](const error& exc) { return is_kind(exc, errc::resolution_failed); });
}

BOOST_AUTO_TEST_CASE(protocol_lines_traced)
{
    boost::asio::io_context ctx;
    fake_smtp_server server(ctx, smtp_script{});
    verifier v(ctx, local_options(server.port()));
    log_capture capture(mxlog::level::trace);

    run_task(ctx, v.check_mailbox(HELO, SENDER, ADDRESS, {"127.0.0.1"}));
    BOOST_CHECK(capture.contains("trace: SMTP C: RCPT TO:<user@example.com>"));
    BOOST_CHECK(capture.contains("trace: SMTP S: 220 mx.test ESMTP ready"));
    BOOST_CHECK(capture.contains("trace: SMTP C: QUIT"));
}
