#include "core/util/canonical.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cctype>
#include <ranges>

namespace totem::util {

std::int64_t unix_timestamp_now() {
  const auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
}

std::string trim_copy(std::string_view value) {
  std::size_t begin = 0;
  while (begin < value.size() && std::isspace(static_cast<unsigned char>(value[begin])) != 0) {
    ++begin;
  }

  std::size_t end = value.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) {
    --end;
  }

  return std::string{value.substr(begin, end - begin)};
}

std::string canonical_join(std::vector<std::pair<std::string, std::string>> fields) {
  std::ranges::sort(fields, [](const auto& lhs, const auto& rhs) {
    return lhs.first < rhs.first;
  });

  std::string payload;
  for (const auto& [key, value] : fields) {
    payload.append(key);
    payload.push_back('=');
    for (char c : value) {
      if (c == '\n') {
        payload.append("\\n");
      } else if (c == '\\') {
        payload.append("\\\\");
      } else {
        payload.push_back(c);
      }
    }
    payload.push_back('\n');
  }

  return payload;
}

std::vector<std::string> split_csv(std::string_view csv) {
  std::vector<std::string> values;
  std::string current;
  for (char c : csv) {
    if (c == ',') {
      const std::string trimmed = trim_copy(current);
      if (!trimmed.empty()) {
        values.push_back(trimmed);
      }
      current.clear();
      continue;
    }
    current.push_back(c);
  }
  const std::string trimmed = trim_copy(current);
  if (!trimmed.empty()) {
    values.push_back(trimmed);
  }
  return values;
}

std::vector<std::string> split_fields(std::string_view line, char separator) {
  std::vector<std::string> fields;
  std::size_t start = 0;
  for (std::size_t i = 0; i <= line.size(); ++i) {
    if (i == line.size() || line[i] == separator) {
      fields.emplace_back(line.substr(start, i - start));
      start = i + 1U;
    }
  }
  return fields;
}

std::optional<std::int64_t> parse_int64(std::string_view text) {
  std::int64_t value = 0;
  const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::uint64_t> parse_uint64(std::string_view text) {
  std::uint64_t value = 0;
  const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
  if (result.ec != std::errc() || result.ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace totem::util
