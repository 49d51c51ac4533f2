#pragma once

#include <memory>
#include <mutex>
#include <vector>

#include "internal/model/events.hpp"

namespace lending::events {

class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual void Publish(const lending::model::LedgerEvent& event) = 0;
};

// Writes each event as a structured log line.
class LoggingEventSink final : public EventSink {
 public:
  void Publish(const lending::model::LedgerEvent& event) override;
};

// Counts each event by name on the lending.ledger.events counter.
class MetricsEventSink final : public EventSink {
 public:
  void Publish(const lending::model::LedgerEvent& event) override;
};

// Keeps every event in memory; used by tests and simulations.
class RecordingEventSink final : public EventSink {
 public:
  void Publish(const lending::model::LedgerEvent& event) override;

  std::vector<lending::model::LedgerEvent> Events() const;

  template <typename T>
  std::vector<T> EventsOf() const {
    std::lock_guard lock(mutex_);
    std::vector<T>  out;
    for (const auto& event : events_) {
      if (const auto* typed = std::get_if<T>(&event)) {
        out.push_back(*typed);
      }
    }
    return out;
  }

  void Clear();

 private:
  mutable std::mutex                       mutex_;
  std::vector<lending::model::LedgerEvent> events_;
};

class FanoutEventSink final : public EventSink {
 public:
  explicit FanoutEventSink(std::vector<std::shared_ptr<EventSink>> sinks);

  void Publish(const lending::model::LedgerEvent& event) override;

 private:
  std::vector<std::shared_ptr<EventSink>> sinks_;
};

} // namespace lending::events
