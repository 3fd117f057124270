#pragma once

#include "cfgsmith/core/error.hpp"
#include "cfgsmith/io/context.hpp"

#include <boost/asio/signal_set.hpp>

#include <csignal>
#include <functional>
#include <initializer_list>
#include <memory>
#include <string_view>

namespace cfgsmith {

// POSIX signals delivered through a boost::asio::signal_set, so they wake the
// engine's io_context like any other event source instead of interrupting the
// loop. The default disposition is restored when the source is destroyed.
class SignalSource {
public:
  using Handler = std::function<void(int)>;

  SignalSource(const SignalSource &) = delete;
  auto operator=(const SignalSource &) -> SignalSource & = delete;
  ~SignalSource() = default;

  // HUP, INT, TERM, USR1 and USR2.
  [[nodiscard]] static auto create(io::IoContext &io)
      -> Result<std::unique_ptr<SignalSource>>;
  [[nodiscard]] static auto create(io::IoContext &io,
                                   std::initializer_list<int> signals)
      -> Result<std::unique_ptr<SignalSource>>;

  // Calls `handler` on the io_context for every signal received until
  // cancel().
  auto start(Handler handler) -> void;
  auto cancel() noexcept -> void;

private:
  explicit SignalSource(io::IoContext &io) : signals_(io) {}

  auto arm() -> void;

  boost::asio::signal_set signals_;
  Handler handler_;
  bool active_{false};
};

// "HUP", "TERM", ...; used as the metrics label.
[[nodiscard]] auto signal_name(int signo) -> std::string_view;

} // namespace cfgsmith
