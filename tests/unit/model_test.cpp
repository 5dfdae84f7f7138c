#include <cassert>
#include <iostream>

#include "internal/model/capabilities.hpp"
#include "internal/model/reader_config.hpp"
#include "internal/model/rospec.hpp"
#include "internal/model/state_machine.hpp"

namespace {

namespace model = llrp::model;

using model::RoSpecCommand;
using model::RoSpecState;
using model::SessionState;

model::ReaderCapabilities MakeCapabilities() {
  model::ReaderCapabilities caps;

  model::GeneralDeviceCapabilities general;
  general.max_antennas  = 4;
  general.air_protocols = {{1, {1}}, {2, {1}}, {3, {}}};
  caps.general          = general;

  model::UhfBandCapabilities uhf;
  uhf.transmit_power_table = {{1, 1000}, {2, 1500}, {3, 2000}, {4, 2550}, {5, 3000}};
  model::RegulatoryCapabilities regulatory;
  regulatory.uhf_band = uhf;
  caps.regulatory     = regulatory;
  return caps;
}

void TestTransmitPowerLookup() {
  const auto caps = MakeCapabilities();

  assert(caps.TransmitPowerIndexFor(25.5) == 4);
  assert(caps.TransmitPowerIndexFor(26.0) == 4);
  assert(caps.TransmitPowerIndexFor(30.0) == 5);
  assert(!caps.TransmitPowerIndexFor(5.0));
  assert(!model::ReaderCapabilities{}.TransmitPowerIndexFor(20.0));
}

void TestAirProtocolSupport() {
  const auto caps = MakeCapabilities();

  assert(caps.MaxAntennas() == 4);
  assert(caps.SupportsAirProtocol(1));
  assert(caps.SupportsAirProtocol(1, 2));
  assert(!caps.SupportsAirProtocol(1, 3));
  assert(!caps.SupportsAirProtocol(2));
  assert(model::ReaderCapabilities{}.MaxAntennas() == 0);
}

void TestConfigMergeKeepsUntouchedGroups() {
  model::ReaderConfig cached;
  cached.keepalive_spec = model::KeepaliveSpec{model::KeepaliveTriggerType::kPeriodic, 10000};
  cached.gpi_port_states = {{1, true, 0}, {2, true, 1}};
  cached.antenna_configurations.push_back(model::AntennaConfiguration{});
  cached.antenna_configurations[0].antenna_id = 1;
  cached.event_notification_spec = model::ReaderEventNotificationSpec{{{2, true}, {6, true}}};

  model::ReaderConfig partial;
  partial.gpi_port_states = {{2, false, 2}, {3, true, 0}};
  model::AntennaConfiguration antenna2;
  antenna2.antenna_id     = 2;
  antenna2.rf_transmitter = model::RfTransmitter{1, 1, 61};
  partial.antenna_configurations.push_back(antenna2);
  partial.event_notification_spec = model::ReaderEventNotificationSpec{{{6, false}}};

  model::MergeReaderConfig(&cached, partial);

  assert(cached.keepalive_spec->period_ms == 10000);
  assert(cached.gpi_port_states.size() == 3);
  assert(cached.gpi_port_states[1].port == 2 && !cached.gpi_port_states[1].enabled);
  assert(cached.antenna_configurations.size() == 2);
  assert(cached.antenna_configurations[1].rf_transmitter->transmit_power == 61);

  const auto& states = cached.event_notification_spec->states;
  assert(states.size() == 2);
  assert(states[0].enabled);
  assert(!states[1].enabled);
}

void TestConfigMergeAntennaZeroAddressesAll() {
  model::ReaderConfig cached;
  for (std::uint16_t id = 1; id <= 2; ++id) {
    model::AntennaConfiguration antenna;
    antenna.antenna_id = id;
    cached.antenna_configurations.push_back(antenna);
  }

  model::ReaderConfig         partial;
  model::AntennaConfiguration all;
  all.rf_transmitter = model::RfTransmitter{1, 1, 90};
  partial.antenna_configurations.push_back(all);

  model::MergeReaderConfig(&cached, partial);

  assert(cached.antenna_configurations.size() == 2);
  for (const auto& antenna : cached.antenna_configurations) {
    assert(antenna.antenna_id != 0);
    assert(antenna.rf_transmitter->transmit_power == 90);
  }
}

void TestRoSpecTransitions() {
  static_assert(model::CanApply(RoSpecState::kDisabled, RoSpecCommand::kEnable));
  static_assert(!model::CanApply(RoSpecState::kDisabled, RoSpecCommand::kStart));
  static_assert(model::CanApply(RoSpecState::kInactive, RoSpecCommand::kStart));
  static_assert(!model::CanApply(RoSpecState::kActive, RoSpecCommand::kDisable));
  static_assert(model::CanApply(RoSpecState::kActive, RoSpecCommand::kDelete));
  static_assert(model::TargetState(RoSpecCommand::kStop) == RoSpecState::kInactive);
  static_assert(!model::TargetState(RoSpecCommand::kDelete));
}

void TestSessionTransitions() {
  static_assert(model::CanTransition(SessionState::kConnecting, SessionState::kConnected));
  static_assert(model::CanTransition(SessionState::kOperational, SessionState::kError));
  static_assert(model::CanTransition(SessionState::kError, SessionState::kClosed));
  static_assert(!model::CanTransition(SessionState::kClosed, SessionState::kError));
  static_assert(!model::CanTransition(SessionState::kClosing, SessionState::kOperational));
  static_assert(!model::CanTransition(SessionState::kError, SessionState::kOperational));
}

void TestAntennasOf() {
  model::RoSpec rospec;
  model::AiSpec first;
  first.antenna_ids = {3, 1};
  model::AiSpec second;
  second.antenna_ids = {1, 2};
  rospec.specs.emplace_back(first);
  rospec.specs.emplace_back(second);

  assert((model::AntennasOf(rospec) == std::vector<std::uint16_t>{1, 2, 3}));
}

} // namespace

int main() {
  TestTransmitPowerLookup();
  TestAirProtocolSupport();
  TestConfigMergeKeepsUntouchedGroups();
  TestConfigMergeAntennaZeroAddressesAll();
  TestRoSpecTransitions();
  TestSessionTransitions();
  TestAntennasOf();

  std::cout << "llrp_engine_unit_model: pass\n";
  return 0;
}
