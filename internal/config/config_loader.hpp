#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/model/policy.hpp"

namespace lending::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, so unknown keys and
  type mismatches are rejected by the protobuf JSON parser. Durations use the
  protobuf JSON form ("3600s").
*/
class ConfigLoader {
 public:
  static lending::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static lending::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Throws lending::util::InvalidValue when a field the ledger depends on is invalid.
  static void Validate(const lending::runtime::config::RuntimeConfig& config);

  // Policy section with defaults applied for unset fields.
  static lending::model::LendingPolicy ToPolicy(const lending::runtime::config::PolicyConfig& config);
};

} // namespace lending::config
