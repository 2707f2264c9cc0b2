#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace labbook::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // Quoted scalars are always strings, e.g. command: ["sleep", "5"].
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  // Everything else is a string, numbers included; integer fields accept quoted values.
  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
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

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static void RequireRoot(const labbook::runtime::config::StageConfig& stage, const std::string& field) {
  if (stage.root().empty()) {
    throw std::runtime_error("Invalid configuration: " + field + ".root must be set");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

labbook::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  labbook::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  Validate(config);
  return config;
}

void ConfigLoader::Validate(const labbook::runtime::config::RuntimeConfig& config) {
  const auto& pipeline = config.pipeline();
  RequireRoot(pipeline.corpus(), "pipeline.corpus");
  RequireRoot(pipeline.sample(), "pipeline.sample");
  RequireRoot(pipeline.config(), "pipeline.config");
  RequireRoot(pipeline.experiment(), "pipeline.experiment");

  if (pipeline.sample().name().empty()) {
    throw std::runtime_error("Invalid configuration: pipeline.sample.name must be set");
  }

  const auto& file_name = config.lock().file_name();
  if (file_name.find('/') != std::string::npos || file_name == "." || file_name == "..") {
    throw std::runtime_error("Invalid configuration: lock.file_name must be a plain file name");
  }
}

} // namespace labbook::config
