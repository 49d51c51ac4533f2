#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <set>
#include <stdexcept>

#include "internal/policy/policy_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace lending::config {

using lending::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // Quoted scalars carry the non-specific "!" tag and always stay strings,
  // so account names such as "42" are not turned into numbers.
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  if (!scalar_value.empty()) {
    char*        endptr        = nullptr;
    const double numeric_value = strtod(scalar_value.c_str(), &endptr);
    if (endptr && *endptr == '\0') {
      value->set_number_value(numeric_value);
      return;
    }
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }
  }
}

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

lending::model::LendingPolicy ConfigLoader::ToPolicy(const lending::runtime::config::PolicyConfig& config) {
  lending::model::LendingPolicy policy;
  try {
    if (config.has_loan_duration()) policy.loan_duration = lending::util::FromProto(config.loan_duration());
    if (config.has_grace_period()) policy.grace_period = lending::util::FromProto(config.grace_period());
    if (config.has_extension_duration()) policy.extension_duration = lending::util::FromProto(config.extension_duration());
  } catch (const std::invalid_argument& e) {
    throw lending::util::InvalidValue(lending::util::ErrorReason::kZeroDuration, std::string("policy: ") + e.what());
  }
  if (config.has_deposit_amount()) policy.deposit_amount = config.deposit_amount();
  policy.max_extensions = config.max_extensions();
  return policy;
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  using lending::util::ErrorReason;

  if (config.has_policy()) {
    const auto& policy = config.policy();
    if (policy.has_loan_duration() && policy.loan_duration().seconds() == 0) {
      throw lending::util::InvalidValue(ErrorReason::kZeroDuration, "config: policy.loan_duration must be positive");
    }
    if (policy.has_extension_duration() && policy.extension_duration().seconds() == 0) {
      throw lending::util::InvalidValue(ErrorReason::kZeroDuration, "config: policy.extension_duration must be positive");
    }
    lending::policy::PolicyStore::Validate(ToPolicy(policy));
  }

  std::set<std::string> members;
  for (const auto& member : config.members()) {
    if (member.account().empty()) {
      throw lending::util::InvalidValue(ErrorReason::kInvalidAccount, "config: member account must not be empty");
    }
    if (!members.insert(member.account()).second) {
      throw lending::util::InvalidValue(ErrorReason::kInvalidAccount, "config: member " + member.account() + " listed twice");
    }
  }

  for (const auto& item : config.catalog()) {
    if (item.title().empty()) {
      throw lending::util::InvalidValue(ErrorReason::kInvalidMetadata, "config: catalog item title must not be empty");
    }
    if (item.units() > 0 && config.custodian().empty()) {
      throw lending::util::InvalidValue(ErrorReason::kBranchUnset, "config: catalog units need a custodian");
    }
  }

  if (config.catalog_size() > 0 && config.stewardship().steward().empty()) {
    throw lending::util::InvalidValue(ErrorReason::kInvalidAccount, "config: catalog seeding needs a steward");
  }
}

} // namespace lending::config
