#include "loan_state.hpp"

namespace lending::model {

const char* ToString(LoanState state) {
  switch (state) {
    case LoanState::kAvailable:
      return "available";
    case LoanState::kBorrowed:
      return "borrowed";
    case LoanState::kExtended:
      return "extended";
    case LoanState::kReturned:
      return "returned";
    case LoanState::kReturning:
      return "returning";
  }
  return "unknown";
}

} // namespace lending::model
