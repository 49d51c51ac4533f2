#pragma once

#include <mutex>
#include <unordered_map>

#include "funds_sink.hpp"

namespace lending::funds {

class MemoryFundsSink final : public FundsSink {
 public:
  explicit MemoryFundsSink(lending::model::Amount opening_balance = 0);

  void Received(lending::model::Amount amount) override;

  void PayOut(const lending::model::AccountId& to, lending::model::Amount amount) override;

  lending::model::Amount Balance() const override;

  // Total value paid out to `account` so far.
  lending::model::Amount PaidTo(const lending::model::AccountId& account) const;

 private:
  mutable std::mutex                                                   mutex_;
  lending::model::Amount                                               balance_;
  std::unordered_map<lending::model::AccountId, lending::model::Amount> paid_;
};

} // namespace lending::funds
