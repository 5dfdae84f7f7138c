#pragma once

#include <string>

#include "config/config.pb.h"

#include "internal/session/session.hpp"
#include "internal/transport/tcp_transport.hpp"

namespace llrp::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected.
*/
class ConfigLoader {
 public:
  static llrp::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static llrp::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

// Endpoint and session settings with defaults filled in for unset fields.
struct ReaderSettings {
  transport::TcpEndpoint  endpoint;
  session::SessionOptions session;
};

// Throws std::invalid_argument when no reader host is configured.
ReaderSettings ResolveReaderSettings(const llrp::runtime::config::RuntimeConfig& config);

} // namespace llrp::config
