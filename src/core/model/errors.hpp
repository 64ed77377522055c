#pragma once

#include <string>

#include "core/model/types.hpp"

namespace totem {

ErrorCategory error_category(BoostError error);
std::string error_to_string(BoostError error);
std::string category_to_string(ErrorCategory category);

}  // namespace totem
