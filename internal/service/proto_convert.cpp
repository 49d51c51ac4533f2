#include "proto_convert.hpp"

#include "internal/util/time.hpp"

namespace lending::service {

lending::v1::CatalogItem ToProto(const lending::model::CatalogItem& item, std::uint64_t available) {
  lending::v1::CatalogItem out;
  out.set_id(item.id);
  out.set_paused(item.paused);
  out.set_available(available);

  auto* metadata = out.mutable_metadata();
  metadata->set_title(item.metadata.title);
  metadata->set_author(item.metadata.author);
  metadata->set_content_uri(item.metadata.content_uri);
  metadata->set_license(item.metadata.license);
  metadata->set_manifest_uri(item.metadata.manifest_uri.value_or(""));
  metadata->set_provenance_uri(item.metadata.provenance_uri.value_or(""));
  for (const auto& contributor : item.metadata.contributors) {
    metadata->add_contributors(contributor);
  }
  return out;
}

lending::v1::Loan ToProto(const lending::model::LoanKey& key, const lending::model::Loan& loan) {
  lending::v1::Loan out;
  out.set_borrower(key.borrower);
  out.set_item_id(key.item_id);
  out.set_custodian(loan.custodian);
  out.set_opened_at(loan.opened_at);
  out.set_due_date(loan.due_date);
  out.set_deposit(loan.deposit);
  out.set_extensions_used(loan.extensions_used);
  return out;
}

lending::v1::LendingPolicy ToProto(const lending::model::LendingPolicy& policy, const lending::model::AccountId& custodian,
                                   const lending::policy::AccessPolicy& access) {
  lending::v1::LendingPolicy out;
  *out.mutable_loan_duration()      = lending::util::ToProto(policy.loan_duration);
  *out.mutable_grace_period()       = lending::util::ToProto(policy.grace_period);
  *out.mutable_extension_duration() = lending::util::ToProto(policy.extension_duration);
  out.set_deposit_amount(policy.deposit_amount);
  out.set_max_extensions(policy.max_extensions);
  out.set_custodian(custodian);
  out.set_steward(access.Steward().value_or(""));
  for (const auto& curator : access.Curators()) {
    out.add_curators(curator);
  }
  return out;
}

lending::model::ItemMetadata FromProto(const lending::v1::ItemMetadata& metadata) {
  lending::model::ItemMetadata out;
  out.title       = metadata.title();
  out.author      = metadata.author();
  out.content_uri = metadata.content_uri();
  out.license     = metadata.license();
  if (!metadata.manifest_uri().empty()) out.manifest_uri = metadata.manifest_uri();
  if (!metadata.provenance_uri().empty()) out.provenance_uri = metadata.provenance_uri();
  out.contributors.assign(metadata.contributors().begin(), metadata.contributors().end());
  return out;
}

} // namespace lending::service
