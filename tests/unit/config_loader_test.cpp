#include "internal/config/config_loader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using llrp::config::ConfigLoader;
using llrp::config::ResolveReaderSettings;

using namespace std::chrono_literals;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "llrp_engine_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigurationLoads() {
  const auto yaml_path = WriteYaml("full",
                                   R"(reader:
  host: "10.0.0.5"
  port: 5085
  command_timeout_ms: 750
keepalive:
  period_ms: 10000
  grace_ms: 2500
logging:
  level: debug
inventory:
  rospec_id: 1234
  antennas: [1, 2]
  duration_ms: 2000
  transmit_power_dbm: 30.0
  include_peak_rssi: true
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.reader().host() == "10.0.0.5");
  assert(config.reader().port() == 5085);
  assert(config.logging().level() == "debug");
  assert(config.inventory().rospec_id() == 1234);
  assert(config.inventory().antennas_size() == 2);
  assert(config.inventory().antennas(1) == 2);
  assert(config.inventory().transmit_power_dbm() == 30.0);
  assert(config.inventory().include_peak_rssi());

  const auto settings = ResolveReaderSettings(config);
  assert(settings.endpoint.host == "10.0.0.5");
  assert(settings.endpoint.port == 5085);
  assert(settings.session.command_timeout == 750ms);
  assert(settings.session.keepalive_period == 10000ms);
  assert(settings.session.keepalive_grace == 2500ms);
}

void TestDefaultsFillUnsetFields() {
  auto config = ConfigLoader::LoadFromYamlString(R"(reader:
  host: reader.local
)");

  const auto settings = ResolveReaderSettings(config);
  assert(settings.endpoint.port == llrp::transport::kDefaultLlrpPort);
  assert(settings.endpoint.connect_timeout == 5000ms);
  assert(settings.session.connect_timeout == 5000ms);
  assert(settings.session.close_timeout == 2000ms);
  assert(settings.session.keepalive_period == 0ms);
  assert(settings.session.max_frame_bytes == llrp::codec::kDefaultMaxFrameBytes);
  assert(settings.session.reader_label == "reader.local:5084");
}

void TestReaderLabelOverridesEndpoint() {
  auto config = ConfigLoader::LoadFromYamlString(R"(reader:
  host: 10.0.0.9
  label: dock-door-3
)");

  assert(ResolveReaderSettings(config).session.reader_label == "dock-door-3");
}

void TestReaderEndpointIsValidated() {
  bool threw = false;
  try {
    (void)ResolveReaderSettings(ConfigLoader::LoadFromYamlString("logging:\n  level: info\n"));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw && "a reader host is required");

  threw = false;
  try {
    (void)ResolveReaderSettings(ConfigLoader::LoadFromYamlString("reader:\n  host: r1\n  port: 70000\n"));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw && "ports above 65535 are rejected");
}

void TestScalarEscapingForQuotedValues() {
  auto config = ConfigLoader::LoadFromYamlString(R"(reader:
  host: "dock\\door \"3\""
)");
  assert(config.reader().host() == "dock\\door \"3\"");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(reader:
  host: "10.0.0.5"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/llrp-engine.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigurationLoads();
  TestDefaultsFillUnsetFields();
  TestReaderLabelOverridesEndpoint();
  TestReaderEndpointIsValidated();
  TestScalarEscapingForQuotedValues();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "llrp_engine_unit_config_loader: pass\n";
  return 0;
}
