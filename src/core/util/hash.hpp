#pragma once

#include <string>
#include <string_view>

namespace totem::util {

std::string to_hex(std::string_view bytes);
std::string from_hex(std::string_view hex);

std::string sha256_hex(std::string_view payload);
std::string sha256_raw(std::string_view payload);

}  // namespace totem::util
