#include "cfgsmith/engine/channel.hpp"

#include <boost/asio/post.hpp>

namespace cfgsmith {

auto TriggerChannel::notify() -> void {
  if (pending_.fetch_add(1, std::memory_order_acq_rel) == 0) {
    boost::asio::post(io_, [] {});
  }
}

auto TerminationChannel::request() -> void {
  if (!requested_.exchange(true, std::memory_order_acq_rel)) {
    boost::asio::post(io_, [] {});
  }
}

} // namespace cfgsmith
