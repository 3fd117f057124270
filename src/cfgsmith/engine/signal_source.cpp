#include "cfgsmith/engine/signal_source.hpp"

#include "cfgsmith/util/log.hpp"

#include <system_error>
#include <utility>

namespace cfgsmith {

auto SignalSource::create(io::IoContext &io)
    -> Result<std::unique_ptr<SignalSource>> {
  return create(io, {SIGHUP, SIGINT, SIGTERM, SIGUSR1, SIGUSR2});
}

auto SignalSource::create(io::IoContext &io,
                          std::initializer_list<int> signals)
    -> Result<std::unique_ptr<SignalSource>> {
  if (signals.size() == 0) {
    return fail(Error::InvalidArgument);
  }
  std::unique_ptr<SignalSource> source(new SignalSource(io));
  for (int signo : signals) {
    boost::system::error_code ec;
    source->signals_.add(signo, ec);
    if (ec == boost::asio::error::invalid_argument) {
      return fail(Error::InvalidArgument);
    }
    if (ec) {
      return fail(std::error_code(ec.value(), std::system_category()));
    }
  }
  return ok(std::move(source));
}

auto SignalSource::start(Handler handler) -> void {
  handler_ = std::move(handler);
  active_ = true;
  arm();
}

auto SignalSource::cancel() noexcept -> void {
  active_ = false;
  boost::system::error_code ec;
  signals_.cancel(ec);
}

auto SignalSource::arm() -> void {
  signals_.async_wait(
      [this](const boost::system::error_code &ec, int signo) {
        if (ec == boost::asio::error::operation_aborted) {
          return;
        }
        if (ec) {
          log::warn("Signal wait failed: {}", ec.message());
          return;
        }
        handler_(signo);
        if (active_) {
          arm();
        }
      });
}

auto signal_name(int signo) -> std::string_view {
  switch (signo) {
  case SIGHUP:
    return "HUP";
  case SIGINT:
    return "INT";
  case SIGTERM:
    return "TERM";
  case SIGUSR1:
    return "USR1";
  case SIGUSR2:
    return "USR2";
  case SIGQUIT:
    return "QUIT";
  default:
    return "UNKNOWN";
  }
}

} // namespace cfgsmith
