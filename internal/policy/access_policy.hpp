#pragma once

#include <optional>
#include <set>
#include <string_view>

#include "internal/model/types.hpp"

namespace lending::policy {

/*
  Snapshot of who may perform privileged operations. Passed by value into
  every privileged precondition check so authorization never reads ambient
  state. An empty steward means stewardship was renounced.
*/
class AccessPolicy {
 public:
  AccessPolicy() = default;
  AccessPolicy(std::optional<lending::model::AccountId> steward, std::set<lending::model::AccountId> curators)
      : steward_(std::move(steward)), curators_(std::move(curators)) {
  }

  const std::optional<lending::model::AccountId>& Steward() const {
    return steward_;
  }
  const std::set<lending::model::AccountId>& Curators() const {
    return curators_;
  }

  bool IsSteward(const lending::model::AccountId& caller) const;
  bool IsCurator(const lending::model::AccountId& caller) const;

  // Throw Unauthorized naming `action` when the caller lacks the role.
  void RequireSteward(const lending::model::AccountId& caller, std::string_view action) const;
  void RequireCuratorOrSteward(const lending::model::AccountId& caller, std::string_view action) const;

 private:
  std::optional<lending::model::AccountId> steward_;
  std::set<lending::model::AccountId>      curators_;
};

} // namespace lending::policy
