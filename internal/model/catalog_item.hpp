#pragma once

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace lending::model {

struct ItemMetadata {
  std::string                title;
  std::string                author;
  std::string                content_uri;
  std::string                license;
  std::optional<std::string> manifest_uri;
  std::optional<std::string> provenance_uri;
  std::vector<std::string>   contributors;
};

struct CatalogItem {
  ItemId       id = 0;
  ItemMetadata metadata;
  bool         paused = false;
};

} // namespace lending::model
