#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace docrev::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars carry the "!" tag and are always strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

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
      throw util::InvalidArgument("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

docrev::runtime::config::RuntimeConfig ConfigLoader::Defaults() {
  docrev::runtime::config::RuntimeConfig config;

  config.mutable_logging()->set_level("warn");

  config.mutable_database()->mutable_sqlite()->set_path("data/docrev.db");

  auto* timeline = config.mutable_timeline();
  timeline->set_min_interval_seconds(30);
  timeline->set_max_interval_seconds(300);
  timeline->set_default_author("docrev");
  timeline->set_default_mode("final");

  auto* package = config.mutable_package();
  package->set_application_name("Microsoft Office Word");
  package->set_app_version("16.0000");

  auto* sanitize = config.mutable_sanitize();
  sanitize->set_neutral_author("Anonymous");
  sanitize->set_neutral_timestamp("2000-01-01T00:00:00Z");
  sanitize->set_application_name("Microsoft Office Word");

  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

docrev::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::BadFile& e) {
    throw util::IOError("Failed to open YAML config " + path + ": " + std::string(e.what()));
  } catch (const YAML::Exception& e) {
    throw util::InvalidArgument("Failed to load YAML config: " + std::string(e.what()));
  }

  auto config = Defaults();
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  docrev::runtime::config::RuntimeConfig parsed;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &parsed, options);

  if (!status.ok()) {
    throw util::InvalidArgument("Invalid configuration: " + std::string(status.message()));
  }

  config.MergeFrom(parsed);
  return config;
}

} // namespace docrev::config
