#include "event_sink.hpp"

#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace lending::events {

using namespace lending::model;
using lending::observability::BoolField;
using lending::observability::StringField;
using lending::observability::UintField;

void LoggingEventSink::Publish(const LedgerEvent& event) {
  const char* name = EventName(event);
  std::visit(
      [name](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, LoanOpened>) {
          LENDING_LOG_INFO(name, {StringField("borrower", e.key.borrower), UintField("item_id", e.key.item_id), UintField("due_date", e.due_date),
                                  UintField("deposit", e.deposit)});
        } else if constexpr (std::is_same_v<T, LoanExtended>) {
          LENDING_LOG_INFO(name, {StringField("borrower", e.key.borrower), UintField("item_id", e.key.item_id), UintField("due_date", e.due_date),
                                  UintField("extensions_used", e.extensions_used)});
        } else if constexpr (std::is_same_v<T, LoanClosed>) {
          LENDING_LOG_INFO(name, {StringField("borrower", e.key.borrower), UintField("item_id", e.key.item_id),
                                  UintField("returned_at", e.returned_at), BoolField("late", e.late)});
        } else if constexpr (std::is_same_v<T, DepositRefunded>) {
          LENDING_LOG_INFO(name, {StringField("borrower", e.key.borrower), UintField("item_id", e.key.item_id), UintField("amount", e.amount)});
        } else if constexpr (std::is_same_v<T, DepositForfeited>) {
          LENDING_LOG_WARN(name, {StringField("borrower", e.key.borrower), UintField("item_id", e.key.item_id), UintField("amount", e.amount),
                                  UintField("pool_balance", e.pool_balance)});
        } else if constexpr (std::is_same_v<T, PoolWithdrawn>) {
          LENDING_LOG_INFO(name, {StringField("to", e.to), UintField("amount", e.amount), UintField("pool_balance", e.pool_balance)});
        } else if constexpr (std::is_same_v<T, PolicyChanged>) {
          LENDING_LOG_INFO(name, {StringField("parameter", ToString(e.parameter)), UintField("old", e.old_value), UintField("new", e.new_value)});
        } else if constexpr (std::is_same_v<T, CustodianChanged>) {
          LENDING_LOG_INFO(name, {StringField("old", e.old_custodian), StringField("new", e.new_custodian)});
        } else if constexpr (std::is_same_v<T, StewardTransferred>) {
          LENDING_LOG_INFO(name, {StringField("old", e.old_steward), StringField("new", e.new_steward)});
        } else if constexpr (std::is_same_v<T, StewardRenounced>) {
          LENDING_LOG_WARN(name, {StringField("old", e.old_steward)});
        } else if constexpr (std::is_same_v<T, CuratorChanged>) {
          LENDING_LOG_INFO(name, {StringField("account", e.account), BoolField("granted", e.granted)});
        } else if constexpr (std::is_same_v<T, MembershipChanged>) {
          LENDING_LOG_INFO(name, {StringField("account", e.account), BoolField("granted", e.granted), UintField("tier", e.tier.value_or(0))});
        } else if constexpr (std::is_same_v<T, ItemCreated>) {
          LENDING_LOG_INFO(name, {UintField("item_id", e.item_id), StringField("title", e.title)});
        } else if constexpr (std::is_same_v<T, ItemUpdated>) {
          LENDING_LOG_INFO(name, {UintField("item_id", e.item_id), StringField("editor", e.editor)});
        } else if constexpr (std::is_same_v<T, ItemPauseChanged>) {
          LENDING_LOG_INFO(name, {UintField("item_id", e.item_id), BoolField("paused", e.paused)});
        } else if constexpr (std::is_same_v<T, UnitsMinted>) {
          LENDING_LOG_INFO(name, {UintField("item_id", e.item_id), StringField("custodian", e.custodian), UintField("quantity", e.quantity)});
        }
      },
      event);
}

void MetricsEventSink::Publish(const LedgerEvent& event) {
  lending::observability::Metrics::Instance().RecordLedgerEvent(EventName(event));
}

void RecordingEventSink::Publish(const LedgerEvent& event) {
  std::lock_guard lock(mutex_);
  events_.push_back(event);
}

std::vector<LedgerEvent> RecordingEventSink::Events() const {
  std::lock_guard lock(mutex_);
  return events_;
}

void RecordingEventSink::Clear() {
  std::lock_guard lock(mutex_);
  events_.clear();
}

FanoutEventSink::FanoutEventSink(std::vector<std::shared_ptr<EventSink>> sinks) : sinks_(std::move(sinks)) {
}

void FanoutEventSink::Publish(const LedgerEvent& event) {
  for (const auto& sink : sinks_) {
    if (sink) {
      sink->Publish(event);
    }
  }
}

} // namespace lending::events
