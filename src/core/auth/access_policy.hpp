#pragma once

#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "core/model/types.hpp"

namespace totem {

// Single "manager" capability checked per admin entry point.
class AccessPolicy {
public:
  void set_managers(const std::vector<std::string>& managers);

  [[nodiscard]] bool is_manager(std::string_view caller) const;
  [[nodiscard]] Result require_manager(std::string_view caller, std::string_view operation) const;
  [[nodiscard]] std::vector<std::string> managers() const;

private:
  std::set<std::string, std::less<>> managers_;
};

}  // namespace totem
