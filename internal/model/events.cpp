#include "events.hpp"

#include <type_traits>

namespace lending::model {

const char* EventName(const LedgerEvent& event) {
  return std::visit(
      [](const auto& e) -> const char* {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, LoanOpened>) {
          return "loan_opened";
        } else if constexpr (std::is_same_v<T, LoanExtended>) {
          return "loan_extended";
        } else if constexpr (std::is_same_v<T, LoanClosed>) {
          return "loan_closed";
        } else if constexpr (std::is_same_v<T, DepositRefunded>) {
          return "deposit_refunded";
        } else if constexpr (std::is_same_v<T, DepositForfeited>) {
          return "deposit_forfeited";
        } else if constexpr (std::is_same_v<T, PoolWithdrawn>) {
          return "pool_withdrawn";
        } else if constexpr (std::is_same_v<T, PolicyChanged>) {
          return "policy_changed";
        } else if constexpr (std::is_same_v<T, CustodianChanged>) {
          return "custodian_changed";
        } else if constexpr (std::is_same_v<T, StewardTransferred>) {
          return "steward_transferred";
        } else if constexpr (std::is_same_v<T, StewardRenounced>) {
          return "steward_renounced";
        } else if constexpr (std::is_same_v<T, CuratorChanged>) {
          return "curator_changed";
        } else if constexpr (std::is_same_v<T, MembershipChanged>) {
          return "membership_changed";
        } else if constexpr (std::is_same_v<T, ItemCreated>) {
          return "item_created";
        } else if constexpr (std::is_same_v<T, ItemUpdated>) {
          return "item_updated";
        } else if constexpr (std::is_same_v<T, ItemPauseChanged>) {
          return "item_pause_changed";
        } else {
          return "units_minted";
        }
      },
      event);
}

} // namespace lending::model
