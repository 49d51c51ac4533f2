#include "internal/events/event_sink.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/observability/metrics.hpp"

namespace {

using namespace lending::events;
using lending::model::LedgerEvent;
using lending::model::LoanKey;

void TestFanoutDeliversToEverySink() {
  auto first  = std::make_shared<RecordingEventSink>();
  auto second = std::make_shared<RecordingEventSink>();

  // A null entry is skipped.
  FanoutEventSink fanout({first, nullptr, second});
  fanout.Publish(lending::model::LoanOpened{LoanKey{"alice", 1}, 100, 10});
  fanout.Publish(lending::model::DepositRefunded{LoanKey{"alice", 1}, 10});

  assert(first->Events().size() == 2);
  assert(second->Events().size() == 2);
  assert(first->EventsOf<lending::model::LoanOpened>().front().due_date == 100);
  assert(second->EventsOf<lending::model::DepositRefunded>().front().amount == 10);

  first->Clear();
  assert(first->Events().empty());
  assert(second->Events().size() == 2);
}

void TestProductionSinksAcceptEveryEventKind() {
  const std::vector<LedgerEvent> events = {
      lending::model::LoanOpened{LoanKey{"alice", 1}, 100, 10},
      lending::model::LoanExtended{LoanKey{"alice", 1}, 200, 1},
      lending::model::LoanClosed{LoanKey{"alice", 1}, 150, false},
      lending::model::DepositForfeited{LoanKey{"bob", 1}, 10, 10},
      lending::model::PoolWithdrawn{"steward", 10, 0},
      lending::model::CustodianChanged{"main-branch", "east-branch"},
      lending::model::UnitsMinted{1, "main-branch", 3},
  };

  // Metrics stay on the no-op provider until InitializeMetrics succeeds.
  auto            recorder = std::make_shared<RecordingEventSink>();
  FanoutEventSink fanout({std::make_shared<LoggingEventSink>(), std::make_shared<MetricsEventSink>(), recorder});
  for (const auto& event : events) {
    fanout.Publish(event);
  }
  assert(recorder->Events().size() == events.size());
  assert(std::string(lending::model::EventName(recorder->Events().back())) == "units_minted");

  lending::observability::ShutdownMetrics();
}

} // namespace

int main() {
  TestFanoutDeliversToEverySink();
  TestProductionSinksAcceptEveryEventKind();

  std::cout << "lending_ledger_unit_event_sink: pass\n";
  return 0;
}
