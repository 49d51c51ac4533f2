#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "types.hpp"

namespace lending::model {

/*
  Lending terms applied at borrow/extend/return time. The deposit captured on
  an open loan is not affected by later changes here.
*/
struct LendingPolicy {
  lending::util::Seconds loan_duration      = 14 * 24 * 3600;
  Amount                 deposit_amount     = 1;
  lending::util::Seconds grace_period       = 0;
  lending::util::Seconds extension_duration = 7 * 24 * 3600;
  std::uint32_t          max_extensions     = 0;
};

// Fields left unset keep their current value.
struct PolicyUpdate {
  std::optional<lending::util::Seconds> loan_duration;
  std::optional<Amount>                 deposit_amount;
  std::optional<lending::util::Seconds> grace_period;
  std::optional<lending::util::Seconds> extension_duration;
  std::optional<std::uint32_t>          max_extensions;
};

enum class PolicyParameter : std::uint8_t {
  kLoanDuration,
  kDepositAmount,
  kGracePeriod,
  kExtensionDuration,
  kMaxExtensions,
};

std::string_view ToString(PolicyParameter parameter);

} // namespace lending::model
