#pragma once

#include "cfgsmith/core/constants.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace cfgsmith::util {

// Line-based unified diff ("diff -u" layout). Returns an empty string when the
// two texts are byte-identical, and a non-empty one otherwise.
[[nodiscard]] auto unified_diff(std::string_view old_text,
                                std::string_view new_text,
                                std::string_view old_label,
                                std::string_view new_label,
                                std::size_t context = diff::kContextLines)
    -> std::string;

} // namespace cfgsmith::util
