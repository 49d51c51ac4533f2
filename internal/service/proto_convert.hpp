#pragma once

#include <cstdint>

#include "internal/model/catalog_item.hpp"
#include "internal/model/loan.hpp"
#include "internal/model/policy.hpp"
#include "internal/policy/access_policy.hpp"
#include "lending/v1/types.pb.h"

namespace lending::service {

lending::v1::CatalogItem ToProto(const lending::model::CatalogItem& item, std::uint64_t available);
lending::v1::Loan        ToProto(const lending::model::LoanKey& key, const lending::model::Loan& loan);
lending::v1::LendingPolicy ToProto(const lending::model::LendingPolicy& policy, const lending::model::AccountId& custodian,
                                   const lending::policy::AccessPolicy& access);

// Empty optional URIs map to std::nullopt.
lending::model::ItemMetadata FromProto(const lending::v1::ItemMetadata& metadata);

} // namespace lending::service
