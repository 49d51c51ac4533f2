#include "access_policy.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace lending::policy {

using lending::util::ErrorReason;

bool AccessPolicy::IsSteward(const lending::model::AccountId& caller) const {
  return steward_.has_value() && !caller.empty() && *steward_ == caller;
}

bool AccessPolicy::IsCurator(const lending::model::AccountId& caller) const {
  return curators_.count(caller) > 0;
}

void AccessPolicy::RequireSteward(const lending::model::AccountId& caller, std::string_view action) const {
  if (IsSteward(caller)) {
    return;
  }
  if (!steward_.has_value()) {
    throw lending::util::Unauthorized(ErrorReason::kNotSteward, std::string(action) + ": stewardship has been renounced");
  }
  throw lending::util::Unauthorized(ErrorReason::kNotSteward, std::string(action) + ": caller " + caller + " is not the steward");
}

void AccessPolicy::RequireCuratorOrSteward(const lending::model::AccountId& caller, std::string_view action) const {
  if (IsSteward(caller) || IsCurator(caller)) {
    return;
  }
  throw lending::util::Unauthorized(ErrorReason::kNotCurator, std::string(action) + ": caller " + caller + " is neither steward nor curator");
}

} // namespace lending::policy
