#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"

namespace lending::util {

/*
  Time utilities. Ledger time is whole seconds since the Unix epoch; zero is
  never a valid "now".
*/

using Timestamp = std::uint64_t;
using Seconds   = std::uint64_t;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual Timestamp Now() const = 0;
};

class SystemClock final : public Clock {
 public:
  Timestamp Now() const override;
};

// Externally driven clock for simulations and boundary tests.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(Timestamp start) : now_(start) {
  }

  Timestamp Now() const override {
    return now_.load();
  }

  void Set(Timestamp now) {
    now_.store(now);
  }

  void Advance(Seconds delta) {
    now_.fetch_add(delta);
  }

 private:
  std::atomic<Timestamp> now_;
};

Timestamp ToUnixSeconds(std::chrono::system_clock::time_point tp);

// Rejects negative durations; sub-second parts are truncated.
Seconds FromProto(const google::protobuf::Duration& duration);

google::protobuf::Duration ToProto(Seconds seconds);

} // namespace lending::util
