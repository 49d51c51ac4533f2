#include "types.hpp"

namespace lending::model {

std::string ToString(const LoanKey& key) {
  return key.borrower + "/" + std::to_string(key.item_id);
}

} // namespace lending::model
