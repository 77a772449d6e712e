#include "internal/config/config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace taskengine::config {

using taskengine::runtime::config::RuntimeConfig;

namespace {

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

/*
  Plain true/false become booleans and plain null/~ becomes null. Every
  other scalar stays a string: the JSON parser accepts quoted integers for
  integer fields, which keeps 64-bit values such as max_range_span exact
  instead of routing them through a double. Quoted scalars ("true", "8080")
  are always strings.
*/
void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();
  const bool         plain  = node.Tag() != "!";

  if (plain && (scalar == "true" || scalar == "false")) {
    value->set_bool_value(scalar == "true");
    return;
  }
  if (plain && (scalar == "null" || scalar == "~")) {
    value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
    return;
  }
  value->set_string_value(scalar);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (const auto& item : node) {
        YamlToProtoValue(item, list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        YamlToProtoValue(entry.second, &(*fields)[entry.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node in task engine config");
  }
}

// Checks the parser cannot express: a selected backend must say where it lives.
void Validate(const RuntimeConfig& config) {
  const auto& db = config.database();
  if (db.has_sqlite() && db.sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }
  if (db.has_postgres() && db.postgres().connection_uri().empty()) {
    throw std::runtime_error("Invalid configuration: database.postgres.connection_uri is required");
  }
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + e.what());
  }

  RuntimeConfig config;

  // An empty file selects every default.
  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level of " + path + " must be a mapping");
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  Validate(config);
  return config;
}

} // namespace taskengine::config
