#pragma once

#include "cfgsmith/config/daemon_config.hpp"
#include "cfgsmith/core/error.hpp"
#include "cfgsmith/generator/command_generator.hpp"

#include <string_view>

namespace cfgsmith {

class ConfigLoader {
public:
  // Parses the TOML, applies CFGSMITH_* environment overrides and validates
  // the result. Syntax errors give Error::ParseError, bad values
  // Error::InvalidArgument.
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<DaemonConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<DaemonConfig>;
};

[[nodiscard]] auto to_generator_options(const DaemonConfig &config)
    -> CommandGeneratorOptions;

} // namespace cfgsmith
