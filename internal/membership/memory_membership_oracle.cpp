#include "memory_membership_oracle.hpp"

#include <mutex>

namespace lending::membership {

bool MemoryMembershipOracle::IsMember(const lending::model::AccountId& account) const {
  std::shared_lock lock(mutex_);
  return cards_.count(account) > 0;
}

std::optional<std::uint32_t> MemoryMembershipOracle::Tier(const lending::model::AccountId& account) const {
  std::shared_lock lock(mutex_);
  auto             it = cards_.find(account);
  if (it == cards_.end() || it->second == 0) {
    return std::nullopt;
  }
  return it->second;
}

bool MemoryMembershipOracle::Grant(const lending::model::AccountId& account, std::optional<std::uint32_t> tier) {
  std::unique_lock lock(mutex_);
  const auto       value   = tier.value_or(0);
  auto [it, inserted]      = cards_.emplace(account, value);
  if (inserted) {
    return true;
  }
  if (it->second == value) {
    return false;
  }
  it->second = value;
  return true;
}

bool MemoryMembershipOracle::Revoke(const lending::model::AccountId& account) {
  std::unique_lock lock(mutex_);
  return cards_.erase(account) > 0;
}

std::size_t MemoryMembershipOracle::Size() const {
  std::shared_lock lock(mutex_);
  return cards_.size();
}

} // namespace lending::membership
