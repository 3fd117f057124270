#pragma once

#include "cfgsmith/core/constants.hpp"
#include "cfgsmith/core/error.hpp"
#include "cfgsmith/watch/watch_set.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace cfgsmith {

struct BeforeRegenerate {
  bool force_reload{false};
  std::string existing_hash;
  std::string existing_content;
};

struct AfterRegenerate {
  bool force_reload{false};
  bool config_was_different{false};
  bool config_was_cycled{false};
  std::string new_hash;
};

// The plugin a daemon supplies: where the artifact lives, how to produce it
// and how to make the downstream server pick it up.
//
// config_data() and reload_server() may report failure through their Result
// or by throwing a std::exception; both are treated the same way.
class ConfigGenerator {
public:
  virtual ~ConfigGenerator() = default;

  // Absolute path of the live artifact.
  [[nodiscard]] virtual auto config_file() const -> std::filesystem::path = 0;

  [[nodiscard]] virtual auto config_data() -> Result<std::string> = 0;

  [[nodiscard]] virtual auto reload_server() -> Result<void> = 0;

  // Whether the downstream server is running happily on its current config.
  [[nodiscard]] virtual auto config_ok() -> bool { return true; }

  virtual auto before_regenerate_config(const BeforeRegenerate &) -> void {}
  virtual auto after_regenerate_config(const AfterRegenerate &) -> void {}

  [[nodiscard]] virtual auto sleep_duration() const
      -> std::chrono::milliseconds {
    return timing::kDefaultSleepDuration;
  }
  [[nodiscard]] virtual auto cooldown_duration() const
      -> std::chrono::milliseconds {
    return timing::kDefaultCooldownDuration;
  }

  // Metrics prefix and temp file name prefix.
  [[nodiscard]] virtual auto service_name() const -> std::string {
    return "cfgsmith";
  }

  // Watches every engine built around this generator installs.
  [[nodiscard]] virtual auto watches() const -> WatchSet { return {}; }
};

} // namespace cfgsmith
