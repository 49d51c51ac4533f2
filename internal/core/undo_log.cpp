#include "undo_log.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace lending::core {

UndoLog::~UndoLog() {
  if (!committed_ && !steps_.empty()) Rollback();
}

bool UndoLog::Rollback() {
  bool ok = true;
  for (auto it = steps_.rbegin(); it != steps_.rend(); ++it) {
    try {
      (*it)();
    } catch (const std::exception& e) {
      ok = false;
      LENDING_LOG_ERROR("rollback step failed", {lending::observability::StringField("operation", operation_),
                                                 lending::observability::StringField("error", e.what())});
    }
  }
  steps_.clear();
  return ok;
}

} // namespace lending::core
