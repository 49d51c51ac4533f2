#include "policy_store.hpp"

#include <mutex>
#include <string>
#include <vector>

#include "internal/events/event_sink.hpp"
#include "internal/model/events.hpp"
#include "internal/util/errors.hpp"

namespace lending::policy {

using lending::model::PolicyParameter;
using lending::util::ErrorReason;

namespace {

std::uint64_t Read(const lending::model::LendingPolicy& policy, PolicyParameter parameter) {
  switch (parameter) {
    case PolicyParameter::kLoanDuration:
      return policy.loan_duration;
    case PolicyParameter::kDepositAmount:
      return policy.deposit_amount;
    case PolicyParameter::kGracePeriod:
      return policy.grace_period;
    case PolicyParameter::kExtensionDuration:
      return policy.extension_duration;
    case PolicyParameter::kMaxExtensions:
      return policy.max_extensions;
  }
  return 0;
}

void Write(lending::model::LendingPolicy& policy, PolicyParameter parameter, std::uint64_t value) {
  switch (parameter) {
    case PolicyParameter::kLoanDuration:
      policy.loan_duration = value;
      break;
    case PolicyParameter::kDepositAmount:
      policy.deposit_amount = value;
      break;
    case PolicyParameter::kGracePeriod:
      policy.grace_period = value;
      break;
    case PolicyParameter::kExtensionDuration:
      policy.extension_duration = value;
      break;
    case PolicyParameter::kMaxExtensions:
      policy.max_extensions = static_cast<std::uint32_t>(value);
      break;
  }
}

} // namespace

PolicyStore::PolicyStore(lending::model::LendingPolicy policy, lending::model::AccountId custodian, Roles roles,
                         std::shared_ptr<lending::events::EventSink> events)
    : policy_(policy), custodian_(std::move(custodian)), roles_(std::move(roles)), events_(std::move(events)) {
  Validate(policy_);
  if (roles_.steward.has_value() && roles_.steward->empty()) {
    roles_.steward.reset();
  }
}

void PolicyStore::Validate(const lending::model::LendingPolicy& policy) {
  if (policy.loan_duration == 0) {
    throw lending::util::InvalidValue(ErrorReason::kZeroDuration, "policy: loan duration must be positive");
  }
  if (policy.deposit_amount == 0) {
    throw lending::util::InvalidValue(ErrorReason::kZeroDeposit, "policy: deposit amount must be positive");
  }
  if (policy.extension_duration == 0) {
    throw lending::util::InvalidValue(ErrorReason::kZeroDuration, "policy: extension duration must be positive");
  }
}

lending::model::LendingPolicy PolicyStore::Policy() const {
  std::shared_lock lock(mutex_);
  return policy_;
}

lending::model::AccountId PolicyStore::Custodian() const {
  std::shared_lock lock(mutex_);
  return custodian_;
}

AccessPolicy PolicyStore::Access() const {
  std::shared_lock lock(mutex_);
  return AccessPolicy(roles_.steward, roles_.curators);
}

void PolicyStore::SetLoanDuration(const lending::model::AccountId& caller, lending::util::Seconds value) {
  SetParameter(caller, PolicyParameter::kLoanDuration, value);
}

void PolicyStore::SetDepositAmount(const lending::model::AccountId& caller, lending::model::Amount value) {
  SetParameter(caller, PolicyParameter::kDepositAmount, value);
}

void PolicyStore::SetGracePeriod(const lending::model::AccountId& caller, lending::util::Seconds value) {
  SetParameter(caller, PolicyParameter::kGracePeriod, value);
}

void PolicyStore::SetExtensionDuration(const lending::model::AccountId& caller, lending::util::Seconds value) {
  SetParameter(caller, PolicyParameter::kExtensionDuration, value);
}

void PolicyStore::SetMaxExtensions(const lending::model::AccountId& caller, std::uint32_t value) {
  SetParameter(caller, PolicyParameter::kMaxExtensions, value);
}

void PolicyStore::SetParameter(const lending::model::AccountId& caller, PolicyParameter parameter, std::uint64_t value) {
  Apply(caller, "set " + std::string(ToString(parameter)), {{parameter, value}});
}

lending::model::LendingPolicy PolicyStore::Update(const lending::model::AccountId& caller, const lending::model::PolicyUpdate& update) {
  std::vector<FieldChange> fields;
  if (update.loan_duration.has_value()) fields.emplace_back(PolicyParameter::kLoanDuration, *update.loan_duration);
  if (update.deposit_amount.has_value()) fields.emplace_back(PolicyParameter::kDepositAmount, *update.deposit_amount);
  if (update.grace_period.has_value()) fields.emplace_back(PolicyParameter::kGracePeriod, *update.grace_period);
  if (update.extension_duration.has_value()) fields.emplace_back(PolicyParameter::kExtensionDuration, *update.extension_duration);
  if (update.max_extensions.has_value()) fields.emplace_back(PolicyParameter::kMaxExtensions, *update.max_extensions);
  return Apply(caller, "update policy", fields);
}

lending::model::LendingPolicy PolicyStore::Apply(const lending::model::AccountId& caller, std::string_view action,
                                                 const std::vector<FieldChange>& fields) {
  std::vector<lending::model::PolicyChanged> changes;
  lending::model::LendingPolicy              updated;
  {
    std::unique_lock lock(mutex_);
    AccessPolicy(roles_.steward, roles_.curators).RequireSteward(caller, action);

    updated = policy_;
    for (const auto& [parameter, value] : fields) {
      changes.push_back({parameter, Read(policy_, parameter), value});
      Write(updated, parameter, value);
    }
    Validate(updated);
    policy_ = updated;
  }
  for (const auto& change : changes) {
    Publish(change);
  }
  return updated;
}

void PolicyStore::SetCustodian(const lending::model::AccountId& caller, const lending::model::AccountId& custodian) {
  lending::model::CustodianChanged change;
  {
    std::unique_lock lock(mutex_);
    AccessPolicy(roles_.steward, roles_.curators).RequireSteward(caller, "set custodian");
    if (custodian.empty()) {
      throw lending::util::InvalidValue(ErrorReason::kBranchUnset, "set custodian: custodian account must not be empty");
    }
    change.old_custodian = custodian_;
    change.new_custodian = custodian;
    custodian_           = custodian;
  }
  Publish(change);
}

void PolicyStore::TransferStewardship(const lending::model::AccountId& caller, const lending::model::AccountId& new_steward) {
  lending::model::StewardTransferred change;
  {
    std::unique_lock lock(mutex_);
    AccessPolicy(roles_.steward, roles_.curators).RequireSteward(caller, "transfer stewardship");
    if (new_steward.empty()) {
      throw lending::util::InvalidValue(ErrorReason::kInvalidAccount, "transfer stewardship: new steward must not be empty; use renounce instead");
    }
    change.old_steward = *roles_.steward;
    change.new_steward = new_steward;
    roles_.steward     = new_steward;
  }
  Publish(change);
}

void PolicyStore::RenounceStewardship(const lending::model::AccountId& caller) {
  lending::model::StewardRenounced change;
  {
    std::unique_lock lock(mutex_);
    AccessPolicy(roles_.steward, roles_.curators).RequireSteward(caller, "renounce stewardship");
    change.old_steward = *roles_.steward;
    roles_.steward.reset();
  }
  Publish(change);
}

void PolicyStore::GrantCurator(const lending::model::AccountId& caller, const lending::model::AccountId& account) {
  {
    std::unique_lock lock(mutex_);
    AccessPolicy(roles_.steward, roles_.curators).RequireSteward(caller, "grant curator");
    if (account.empty()) {
      throw lending::util::InvalidValue(ErrorReason::kInvalidAccount, "grant curator: account must not be empty");
    }
    if (!roles_.curators.insert(account).second) {
      return;
    }
  }
  Publish(lending::model::CuratorChanged{account, true});
}

void PolicyStore::RevokeCurator(const lending::model::AccountId& caller, const lending::model::AccountId& account) {
  {
    std::unique_lock lock(mutex_);
    AccessPolicy(roles_.steward, roles_.curators).RequireSteward(caller, "revoke curator");
    if (roles_.curators.erase(account) == 0) {
      return;
    }
  }
  Publish(lending::model::CuratorChanged{account, false});
}

void PolicyStore::Publish(const lending::model::LedgerEvent& event) {
  if (events_) {
    events_->Publish(event);
  }
}

} // namespace lending::policy
