#include "core/auth/access_policy.hpp"

#include "core/util/canonical.hpp"

namespace totem {

void AccessPolicy::set_managers(const std::vector<std::string>& managers) {
  managers_.clear();
  for (const auto& manager : managers) {
    const std::string trimmed = util::trim_copy(manager);
    if (!trimmed.empty()) {
      managers_.insert(trimmed);
    }
  }
}

bool AccessPolicy::is_manager(std::string_view caller) const {
  return managers_.contains(caller);
}

Result AccessPolicy::require_manager(std::string_view caller, std::string_view operation) const {
  if (!is_manager(caller)) {
    return Result::failure(BoostError::Unauthorized,
                           std::string{operation} + " requires the manager role.");
  }
  return Result::success();
}

std::vector<std::string> AccessPolicy::managers() const {
  return {managers_.begin(), managers_.end()};
}

}  // namespace totem
