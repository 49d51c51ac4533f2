#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>

#include "internal/model/catalog_item.hpp"
#include "internal/policy/access_policy.hpp"

namespace lending::events {
class EventSink;
}

namespace lending::catalog {

/*
  Catalog items. Ids are assigned from 1 upward and never reused; items are
  never deleted, pausing takes their place.
*/
class Catalog {
 public:
  explicit Catalog(std::shared_ptr<lending::events::EventSink> events);

  lending::model::ItemId CreateItem(const lending::policy::AccessPolicy& access, const lending::model::AccountId& caller,
                                    lending::model::ItemMetadata metadata);

  void UpdateMetadata(const lending::policy::AccessPolicy& access, const lending::model::AccountId& caller, lending::model::ItemId item_id,
                      lending::model::ItemMetadata metadata);

  void SetPaused(const lending::policy::AccessPolicy& access, const lending::model::AccountId& caller, lending::model::ItemId item_id,
                 bool paused);

  std::optional<lending::model::CatalogItem> Get(lending::model::ItemId item_id) const;
  bool                                       Exists(lending::model::ItemId item_id) const;
  bool                                       IsPaused(lending::model::ItemId item_id) const;

  std::vector<lending::model::CatalogItem> List() const;
  std::size_t                              Size() const;

 private:
  static void ValidateMetadata(const lending::model::ItemMetadata& metadata);

  mutable std::shared_mutex                                    mutex_;
  lending::model::ItemId                                       next_id_ = 1;
  std::map<lending::model::ItemId, lending::model::CatalogItem> items_;
  std::shared_ptr<lending::events::EventSink>                  events_;
};

} // namespace lending::catalog
