#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace cfgsmith::io {

/// The regeneration loop runs on one boost::asio::io_context, driven by a
/// single thread.
using IoContext = boost::asio::io_context;

using WorkGuard = boost::asio::executor_work_guard<IoContext::executor_type>;

} // namespace cfgsmith::io
