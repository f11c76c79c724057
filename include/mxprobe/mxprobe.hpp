#pragma once

#include <mxprobe/error.hpp>
#include <mxprobe/options.hpp>
#include <mxprobe/cancellation.hpp>
#include <mxprobe/address.hpp>

#include <mxprobe/detail/log.hpp>

#include <mxprobe/net/deadline.hpp>
#include <mxprobe/net/dialog.hpp>
#include <mxprobe/net/connect.hpp>

#include <mxprobe/dns/resolver.hpp>

#include <mxprobe/smtp/reply.hpp>
#include <mxprobe/smtp/verdict.hpp>
#include <mxprobe/smtp/session.hpp>

#include <mxprobe/verifier.hpp>
