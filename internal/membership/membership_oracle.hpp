#pragma once

#include <cstdint>
#include <optional>

#include "internal/model/types.hpp"

namespace lending::membership {

class MembershipOracle {
 public:
  virtual ~MembershipOracle() = default;

  virtual bool IsMember(const lending::model::AccountId& account) const = 0;

  virtual std::optional<std::uint32_t> Tier(const lending::model::AccountId& account) const = 0;
};

} // namespace lending::membership
