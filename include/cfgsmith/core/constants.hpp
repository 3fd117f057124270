#pragma once

#include <chrono>
#include <cstddef>

namespace cfgsmith {

namespace io {
constexpr std::size_t kEventBufferSize = 4096;
constexpr std::size_t kReadBufferSize = 4096;
} // namespace io

namespace timing {
constexpr auto kDefaultSleepDuration = std::chrono::seconds(60);
constexpr auto kDefaultCooldownDuration = std::chrono::seconds(5);
constexpr auto kDaemonPollInterval = std::chrono::milliseconds(100);
} // namespace timing

namespace diff {
constexpr std::size_t kContextLines = 3;
} // namespace diff

} // namespace cfgsmith
