#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

#include "internal/util/time.hpp"

namespace lending::model {

using AccountId = std::string;
using ItemId    = std::uint64_t;
using Amount    = std::uint64_t;
using Timestamp = lending::util::Timestamp;

// Identifies one (borrower, item) claim. At most one loan exists per key.
struct LoanKey {
  AccountId borrower;
  ItemId    item_id = 0;

  bool operator==(const LoanKey& other) const {
    return item_id == other.item_id && borrower == other.borrower;
  }
  bool operator!=(const LoanKey& other) const {
    return !(*this == other);
  }
};

struct LoanKeyHash {
  std::size_t operator()(const LoanKey& key) const noexcept {
    const std::size_t h1 = std::hash<std::string>{}(key.borrower);
    const std::size_t h2 = std::hash<std::uint64_t>{}(key.item_id);
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
  }
};

std::string ToString(const LoanKey& key);

} // namespace lending::model
