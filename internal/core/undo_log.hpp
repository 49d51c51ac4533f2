#pragma once

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace lending::core {

/*
  Compensating actions for a multi-step ledger mutation.

  Semantics:
  - Steps are undone in reverse order of registration
  - Commit() discards the recorded steps
  - Destructor MUST roll back if not committed
*/
class UndoLog {
 public:
  explicit UndoLog(std::string operation) : operation_(std::move(operation)) {
  }
  ~UndoLog();

  UndoLog(const UndoLog&)            = delete;
  UndoLog& operator=(const UndoLog&) = delete;

  void Add(std::function<void()> step) {
    steps_.push_back(std::move(step));
  }

  void Commit() {
    steps_.clear();
    committed_ = true;
  }

  // Runs every step even when one fails; failures are logged. Returns false
  // if any step failed.
  bool Rollback();

  bool IsCommitted() const {
    return committed_;
  }

 private:
  std::string                        operation_;
  std::vector<std::function<void()>> steps_;
  bool                               committed_ = false;
};

} // namespace lending::core
