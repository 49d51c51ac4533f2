#include "policy.hpp"

namespace lending::model {

std::string_view ToString(PolicyParameter parameter) {
  switch (parameter) {
    case PolicyParameter::kLoanDuration:
      return "loan_duration";
    case PolicyParameter::kDepositAmount:
      return "deposit_amount";
    case PolicyParameter::kGracePeriod:
      return "grace_period";
    case PolicyParameter::kExtensionDuration:
      return "extension_duration";
    case PolicyParameter::kMaxExtensions:
      return "max_extensions";
  }
  return "unknown";
}

} // namespace lending::model
