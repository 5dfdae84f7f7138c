#include "internal/factory.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <variant>

#include "internal/config/config_loader.hpp"

namespace {

using llrp::config::ConfigLoader;

namespace factory = llrp::factory;
namespace model   = llrp::model;

model::ReaderCapabilities PowerTable() {
  model::UhfBandCapabilities uhf;
  uhf.transmit_power_table = {{1, 1000}, {2, 2000}, {3, 3000}};
  model::RegulatoryCapabilities regulatory;
  regulatory.uhf_band = uhf;

  model::ReaderCapabilities caps;
  caps.regulatory = regulatory;
  return caps;
}

const model::AiSpec& OnlyAiSpec(const model::RoSpec& rospec) {
  assert(rospec.specs.size() == 1);
  return std::get<model::AiSpec>(rospec.specs[0]);
}

void TestInventoryRoSpecFromConfig() {
  auto config = ConfigLoader::LoadFromYamlString(R"(inventory:
  rospec_id: 77
  antennas: [1, 3]
  duration_ms: 1500
  report_every_n_tags: 10
  transmit_power_dbm: 25
  session: 2
  include_peak_rssi: true
)");

  const auto caps   = PowerTable();
  const auto rospec = factory::BuildInventoryRoSpec(config.inventory(), &caps);

  assert(rospec.id == 77);
  assert(rospec.current_state == model::RoSpecState::kDisabled);
  assert(rospec.boundary.start_trigger.type == model::StartTriggerType::kNull);

  const auto& ai = OnlyAiSpec(rospec);
  assert((ai.antenna_ids == std::vector<std::uint16_t>{1, 3}));
  assert(ai.stop_trigger.type == model::AiSpecStopTriggerType::kDuration);
  assert(ai.stop_trigger.duration_ms == 1500);

  const auto& spec = ai.inventory_parameter_specs.at(0);
  assert(spec.antenna_configurations.size() == 2);
  for (const auto& antenna : spec.antenna_configurations) {
    assert(antenna.rf_transmitter);
    assert(antenna.rf_transmitter->transmit_power == 2);
    assert(antenna.inventory_commands.at(0).singulation_control->session == 2);
  }

  assert(rospec.report_spec);
  assert(rospec.report_spec->n == 10);
  assert(rospec.report_spec->content_selector.enable_peak_rssi);
  assert(!rospec.report_spec->content_selector.enable_tag_seen_count);
}

void TestInventoryDefaults() {
  const auto rospec = factory::BuildInventoryRoSpec(llrp::runtime::config::InventoryConfig{}, nullptr);

  assert(rospec.id == 1);
  const auto& ai = OnlyAiSpec(rospec);
  assert((ai.antenna_ids == std::vector<std::uint16_t>{0}));
  assert(ai.stop_trigger.type == model::AiSpecStopTriggerType::kNull);
  assert(!ai.inventory_parameter_specs.at(0).antenna_configurations.at(0).rf_transmitter);
  assert(rospec.report_spec->n == 1);
}

void TestPowerBelowTableKeepsReaderDefault() {
  llrp::runtime::config::InventoryConfig inventory;
  inventory.set_transmit_power_dbm(5.0);

  const auto caps   = PowerTable();
  const auto rospec = factory::BuildInventoryRoSpec(inventory, &caps);
  assert(!OnlyAiSpec(rospec).inventory_parameter_specs.at(0).antenna_configurations.at(0).rf_transmitter);
}

void TestSessionReaderConfig() {
  auto config = ConfigLoader::LoadFromYamlString("keepalive:\n  period_ms: 5000\n");

  const auto reader_config = factory::BuildSessionReaderConfig(config);
  assert(reader_config.keepalive_spec->trigger == model::KeepaliveTriggerType::kPeriodic);
  assert(reader_config.keepalive_spec->period_ms == 5000);

  const auto& states = reader_config.event_notification_spec->states;
  assert(!states.empty());
  bool rospec_events = false;
  for (const auto& state : states) {
    assert(state.enabled);
    rospec_events |= state.event_type == static_cast<std::uint16_t>(model::ReaderEventType::kRoSpec);
  }
  assert(rospec_events);

  const auto quiet = factory::BuildSessionReaderConfig(llrp::runtime::config::RuntimeConfig{});
  assert(quiet.keepalive_spec->trigger == model::KeepaliveTriggerType::kNull);
}

void TestBuildSessionIsUnopened() {
  auto config  = ConfigLoader::LoadFromYamlString("reader:\n  host: 127.0.0.1\n");
  auto session = factory::BuildSession(config);
  assert(session->State() == model::SessionState::kConnecting);
  assert(session->options().keepalive_period.count() == 0);

  bool threw = false;
  try {
    (void)factory::BuildSession(llrp::runtime::config::RuntimeConfig{});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestInventoryRoSpecFromConfig();
  TestInventoryDefaults();
  TestPowerBelowTableKeepsReaderDefault();
  TestSessionReaderConfig();
  TestBuildSessionIsUnopened();

  std::cout << "llrp_engine_unit_factory: pass\n";
  return 0;
}
