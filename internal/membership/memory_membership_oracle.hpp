#pragma once

#include <shared_mutex>
#include <unordered_map>

#include "membership_oracle.hpp"

namespace lending::membership {

/*
  Membership cards held in process. A card without a tier is stored as
  tier 0 and reported as std::nullopt.
*/
class MemoryMembershipOracle final : public MembershipOracle {
 public:
  bool IsMember(const lending::model::AccountId& account) const override;

  std::optional<std::uint32_t> Tier(const lending::model::AccountId& account) const override;

  // Returns false when the account already held a card with the same tier.
  bool Grant(const lending::model::AccountId& account, std::optional<std::uint32_t> tier = std::nullopt);

  // Returns false when the account held no card.
  bool Revoke(const lending::model::AccountId& account);

  std::size_t Size() const;

 private:
  mutable std::shared_mutex                                     mutex_;
  std::unordered_map<lending::model::AccountId, std::uint32_t> cards_;
};

} // namespace lending::membership
