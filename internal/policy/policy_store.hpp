#pragma once

#include <memory>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string_view>
#include <utility>
#include <vector>

#include "access_policy.hpp"
#include "internal/model/events.hpp"
#include "internal/model/policy.hpp"
#include "internal/model/types.hpp"

namespace lending::events {
class EventSink;
}

namespace lending::policy {

/*
  Current lending terms, custodian (branch) and roles.

  Every setter is steward-gated, validates its input and publishes an audit
  event carrying the old and new value. Events are published after the
  change is visible.
*/
class PolicyStore {
 public:
  struct Roles {
    std::optional<lending::model::AccountId> steward;
    std::set<lending::model::AccountId>      curators;
  };

  PolicyStore(lending::model::LendingPolicy policy, lending::model::AccountId custodian, Roles roles,
              std::shared_ptr<lending::events::EventSink> events);

  lending::model::LendingPolicy Policy() const;
  lending::model::AccountId     Custodian() const;
  AccessPolicy                  Access() const;

  void SetLoanDuration(const lending::model::AccountId& caller, lending::util::Seconds value);
  void SetDepositAmount(const lending::model::AccountId& caller, lending::model::Amount value);
  void SetGracePeriod(const lending::model::AccountId& caller, lending::util::Seconds value);
  void SetExtensionDuration(const lending::model::AccountId& caller, lending::util::Seconds value);
  void SetMaxExtensions(const lending::model::AccountId& caller, std::uint32_t value);

  // Applies every set field under one lock, or none if the merged policy is
  // invalid. Publishes one PolicyChanged per set field, in declaration order.
  lending::model::LendingPolicy Update(const lending::model::AccountId& caller, const lending::model::PolicyUpdate& update);

  void SetCustodian(const lending::model::AccountId& caller, const lending::model::AccountId& custodian);

  void TransferStewardship(const lending::model::AccountId& caller, const lending::model::AccountId& new_steward);

  // Irrevocable: afterwards every steward-gated call fails with NotSteward.
  void RenounceStewardship(const lending::model::AccountId& caller);

  void GrantCurator(const lending::model::AccountId& caller, const lending::model::AccountId& account);
  void RevokeCurator(const lending::model::AccountId& caller, const lending::model::AccountId& account);

  // Throws InvalidValue when `policy` violates a field constraint.
  static void Validate(const lending::model::LendingPolicy& policy);

 private:
  using FieldChange = std::pair<lending::model::PolicyParameter, std::uint64_t>;

  void                          SetParameter(const lending::model::AccountId& caller, lending::model::PolicyParameter parameter, std::uint64_t value);
  lending::model::LendingPolicy Apply(const lending::model::AccountId& caller, std::string_view action, const std::vector<FieldChange>& fields);
  void Publish(const lending::model::LedgerEvent& event);

  mutable std::shared_mutex                   mutex_;
  lending::model::LendingPolicy               policy_;
  lending::model::AccountId                   custodian_;
  Roles                                       roles_;
  std::shared_ptr<lending::events::EventSink> events_;
};

} // namespace lending::policy
