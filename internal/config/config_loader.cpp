#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace llrp::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

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
      throw std::runtime_error("Unsupported YAML node");
  }
}

static llrp::runtime::config::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  llrp::runtime::config::RuntimeConfig config;

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

llrp::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

llrp::runtime::config::RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return ParseYaml(yaml);
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

namespace {

std::chrono::milliseconds OrDefault(std::uint32_t value_ms, std::chrono::milliseconds fallback) {
  return value_ms ? std::chrono::milliseconds(value_ms) : fallback;
}

} // namespace

ReaderSettings ResolveReaderSettings(const llrp::runtime::config::RuntimeConfig& config) {
  const auto& reader = config.reader();
  if (reader.host().empty()) {
    throw std::invalid_argument("reader.host is required");
  }
  if (reader.port() > std::numeric_limits<std::uint16_t>::max()) {
    throw std::invalid_argument("reader.port out of range: " + std::to_string(reader.port()));
  }

  ReaderSettings settings;
  settings.endpoint.host = reader.host();
  settings.endpoint.port =
      reader.port() ? static_cast<std::uint16_t>(reader.port()) : transport::kDefaultLlrpPort;
  settings.endpoint.connect_timeout = OrDefault(reader.connect_timeout_ms(), settings.endpoint.connect_timeout);

  auto& session           = settings.session;
  session.connect_timeout = settings.endpoint.connect_timeout;
  session.command_timeout = OrDefault(reader.command_timeout_ms(), session.command_timeout);
  session.close_timeout   = OrDefault(reader.close_timeout_ms(), session.close_timeout);
  if (reader.max_frame_bytes()) {
    session.max_frame_bytes = reader.max_frame_bytes();
  }

  session.keepalive_period = std::chrono::milliseconds(config.keepalive().period_ms());
  session.keepalive_grace  = OrDefault(config.keepalive().grace_ms(), session.keepalive_grace);
  session.reader_label =
      reader.label().empty() ? reader.host() + ":" + std::to_string(settings.endpoint.port) : reader.label();

  return settings;
}

} // namespace llrp::config
