#include "catalog.hpp"

#include <mutex>
#include <string>
#include <string_view>

#include "internal/events/event_sink.hpp"
#include "internal/util/errors.hpp"

namespace lending::catalog {

using lending::util::ErrorReason;

namespace {

lending::util::NotFound NoSuchItem(std::string_view action, lending::model::ItemId item_id) {
  return lending::util::NotFound(ErrorReason::kNoSuchItem, std::string(action) + ": item " + std::to_string(item_id) + " does not exist");
}

} // namespace

Catalog::Catalog(std::shared_ptr<lending::events::EventSink> events) : events_(std::move(events)) {
}

void Catalog::ValidateMetadata(const lending::model::ItemMetadata& metadata) {
  if (metadata.title.empty()) {
    throw lending::util::InvalidValue(ErrorReason::kInvalidMetadata, "catalog item: title must not be empty");
  }
  for (const auto& contributor : metadata.contributors) {
    if (contributor.empty()) {
      throw lending::util::InvalidValue(ErrorReason::kInvalidMetadata, "catalog item: contributor entries must not be empty");
    }
  }
}

lending::model::ItemId Catalog::CreateItem(const lending::policy::AccessPolicy& access, const lending::model::AccountId& caller,
                                           lending::model::ItemMetadata metadata) {
  access.RequireSteward(caller, "create item");
  ValidateMetadata(metadata);

  lending::model::ItemCreated created;
  {
    std::unique_lock lock(mutex_);
    lending::model::CatalogItem item;
    item.id       = next_id_++;
    item.metadata = std::move(metadata);

    created.item_id = item.id;
    created.title   = item.metadata.title;
    items_.emplace(item.id, std::move(item));
  }

  if (events_) events_->Publish(created);
  return created.item_id;
}

void Catalog::UpdateMetadata(const lending::policy::AccessPolicy& access, const lending::model::AccountId& caller, lending::model::ItemId item_id,
                             lending::model::ItemMetadata metadata) {
  access.RequireCuratorOrSteward(caller, "update item");
  ValidateMetadata(metadata);
  {
    std::unique_lock lock(mutex_);
    auto             it = items_.find(item_id);
    if (it == items_.end()) throw NoSuchItem("update item", item_id);
    it->second.metadata = std::move(metadata);
  }

  if (events_) events_->Publish(lending::model::ItemUpdated{item_id, caller});
}

void Catalog::SetPaused(const lending::policy::AccessPolicy& access, const lending::model::AccountId& caller, lending::model::ItemId item_id,
                        bool paused) {
  access.RequireCuratorOrSteward(caller, paused ? "pause item" : "unpause item");
  {
    std::unique_lock lock(mutex_);
    auto             it = items_.find(item_id);
    if (it == items_.end()) throw NoSuchItem(paused ? "pause item" : "unpause item", item_id);
    if (it->second.paused == paused) return;
    it->second.paused = paused;
  }

  if (events_) events_->Publish(lending::model::ItemPauseChanged{item_id, paused});
}

std::optional<lending::model::CatalogItem> Catalog::Get(lending::model::ItemId item_id) const {
  std::shared_lock lock(mutex_);
  auto             it = items_.find(item_id);
  if (it == items_.end()) return std::nullopt;
  return it->second;
}

bool Catalog::Exists(lending::model::ItemId item_id) const {
  std::shared_lock lock(mutex_);
  return items_.count(item_id) > 0;
}

bool Catalog::IsPaused(lending::model::ItemId item_id) const {
  std::shared_lock lock(mutex_);
  auto             it = items_.find(item_id);
  return it != items_.end() && it->second.paused;
}

std::vector<lending::model::CatalogItem> Catalog::List() const {
  std::shared_lock                         lock(mutex_);
  std::vector<lending::model::CatalogItem> out;
  out.reserve(items_.size());
  for (const auto& [id, item] : items_) {
    out.push_back(item);
  }
  return out;
}

std::size_t Catalog::Size() const {
  std::shared_lock lock(mutex_);
  return items_.size();
}

} // namespace lending::catalog
