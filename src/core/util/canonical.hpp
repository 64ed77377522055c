#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace totem::util {

std::int64_t unix_timestamp_now();

std::string trim_copy(std::string_view value);

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields);

std::vector<std::string> split_csv(std::string_view csv);
std::vector<std::string> split_fields(std::string_view line, char separator);

std::optional<std::int64_t> parse_int64(std::string_view text);
std::optional<std::uint64_t> parse_uint64(std::string_view text);

}  // namespace totem::util
