#include <cassert>
#include <iostream>
#include <memory>

#include "internal/catalog/catalog.hpp"
#include "internal/events/event_sink.hpp"
#include "internal/util/errors.hpp"

namespace {

using lending::model::ItemMetadata;
using lending::policy::AccessPolicy;
using lending::util::ErrorReason;

const AccessPolicy kAccess{std::string("steward"), {"curator"}};

template <typename Error, typename Fn>
void ExpectError(ErrorReason reason, Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const Error& e) {
    threw = true;
    assert(e.Reason() == reason);
  }
  assert(threw);
}

ItemMetadata Book(const std::string& title) {
  ItemMetadata metadata;
  metadata.title        = title;
  metadata.author       = "Knuth";
  metadata.content_uri  = "ipfs://taocp";
  metadata.license      = "all-rights-reserved";
  metadata.contributors = {"scanner", "proofreader"};
  return metadata;
}

void TestIdsStartAtOneAndIncrease() {
  auto                      events = std::make_shared<lending::events::RecordingEventSink>();
  lending::catalog::Catalog catalog(events);

  assert(catalog.CreateItem(kAccess, "steward", Book("Volume 1")) == 1);
  assert(catalog.CreateItem(kAccess, "steward", Book("Volume 2")) == 2);
  assert(catalog.CreateItem(kAccess, "steward", Book("Volume 3")) == 3);
  assert(catalog.Size() == 3);

  const auto items = catalog.List();
  assert(items.size() == 3);
  assert(items[0].id == 1 && items[2].id == 3);
  assert(items[1].metadata.title == "Volume 2");

  const auto created = events->EventsOf<lending::model::ItemCreated>();
  assert(created.size() == 3);
  assert(created[2].item_id == 3 && created[2].title == "Volume 3");
}

void TestCreateRequiresStewardAndTitle() {
  lending::catalog::Catalog catalog(nullptr);

  ExpectError<lending::util::Unauthorized>(ErrorReason::kNotSteward, [&] { catalog.CreateItem(kAccess, "curator", Book("Draft")); });
  ExpectError<lending::util::InvalidValue>(ErrorReason::kInvalidMetadata, [&] { catalog.CreateItem(kAccess, "steward", Book("")); });

  auto bad_contributor = Book("Anthology");
  bad_contributor.contributors.push_back("");
  ExpectError<lending::util::InvalidValue>(ErrorReason::kInvalidMetadata, [&] { catalog.CreateItem(kAccess, "steward", bad_contributor); });

  assert(catalog.Size() == 0);
  // Failed creations do not consume ids.
  assert(catalog.CreateItem(kAccess, "steward", Book("First")) == 1);
}

void TestCuratorMayUpdateAndPause() {
  auto                      events = std::make_shared<lending::events::RecordingEventSink>();
  lending::catalog::Catalog catalog(events);
  const auto                id = catalog.CreateItem(kAccess, "steward", Book("Volume 1"));

  auto updated         = Book("Volume 1, third edition");
  updated.manifest_uri = "ipfs://manifest";
  catalog.UpdateMetadata(kAccess, "curator", id, updated);

  const auto item = catalog.Get(id);
  assert(item.has_value());
  assert(item->metadata.title == "Volume 1, third edition");
  assert(item->metadata.manifest_uri.value() == "ipfs://manifest");
  assert(!item->metadata.provenance_uri.has_value());

  catalog.SetPaused(kAccess, "curator", id, true);
  catalog.SetPaused(kAccess, "curator", id, true);
  assert(catalog.IsPaused(id));
  catalog.SetPaused(kAccess, "steward", id, false);
  assert(!catalog.IsPaused(id));

  assert(events->EventsOf<lending::model::ItemUpdated>().size() == 1);
  assert(events->EventsOf<lending::model::ItemPauseChanged>().size() == 2);

  ExpectError<lending::util::Unauthorized>(ErrorReason::kNotCurator, [&] { catalog.SetPaused(kAccess, "reader", id, true); });
  ExpectError<lending::util::Unauthorized>(ErrorReason::kNotCurator, [&] { catalog.UpdateMetadata(kAccess, "reader", id, Book("Mine")); });
  ExpectError<lending::util::NotFound>(ErrorReason::kNoSuchItem, [&] { catalog.SetPaused(kAccess, "curator", 99, true); });
  ExpectError<lending::util::NotFound>(ErrorReason::kNoSuchItem, [&] { catalog.UpdateMetadata(kAccess, "curator", 99, Book("Ghost")); });
}

void TestUnknownItemQueries() {
  lending::catalog::Catalog catalog(nullptr);
  assert(!catalog.Exists(1));
  assert(!catalog.IsPaused(1));
  assert(!catalog.Get(1).has_value());
}

} // namespace

int main() {
  TestIdsStartAtOneAndIncrease();
  TestCreateRequiresStewardAndTitle();
  TestCuratorMayUpdateAndPause();
  TestUnknownItemQueries();

  std::cout << "lending_ledger_unit_catalog: pass\n";
  return 0;
}
