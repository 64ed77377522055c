#pragma once

#include <string_view>

#include "core/model/types.hpp"

namespace totem {

Result validate_boost_config(const BoostConfig& config);

// Reads a "key = value" file over the defaults already in out. Lines
// starting with '#' are comments. Lists are comma separated; premium tiers
// are written as points:probability pairs, e.g. "500:50, 700:25".
Result load_boost_config_file(std::string_view path, BoostConfig& out);

}  // namespace totem
