#pragma once

#include <string>
#include <string_view>

namespace cfgsmith::util {

// Lowercase hex SHA-256 of `data`. Used to identify config contents in logs
// and regeneration hooks.
[[nodiscard]] auto content_hash(std::string_view data) -> std::string;

} // namespace cfgsmith::util
