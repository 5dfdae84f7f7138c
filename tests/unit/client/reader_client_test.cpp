#include "client/cpp/reader_client.h"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <variant>

#include "memory_transport.hpp"

namespace {

using llrp::engine::client::ReaderClient;
using llrp::testing::ConnectionEvent;
using llrp::testing::MemoryTransport;
using llrp::testing::ResponseFor;
using llrp::testing::RoSpecEventNotification;

namespace v1 = llrp::engine::v1;

using namespace std::chrono_literals;

struct Fixture {
  MemoryTransport*              transport = nullptr;
  std::unique_ptr<ReaderClient> client;
};

// A reader that accepts every command.
void AcceptAll(const v1::Message& request, MemoryTransport& transport) {
  if (v1::ResponseTypeFor(request.type)) {
    transport.Push(ResponseFor(request));
  }
}

Fixture MakeFixture(MemoryTransport::Responder responder = AcceptAll) {
  auto transport = std::make_unique<MemoryTransport>();

  Fixture fixture;
  fixture.transport = transport.get();
  fixture.transport->SetResponder(std::move(responder));

  v1::SessionOptions options;
  options.command_timeout = 2s;
  options.connect_timeout = 2s;
  options.close_timeout   = 200ms;
  options.poll_interval   = 10ms;
  fixture.client =
      std::make_unique<ReaderClient>(std::make_shared<v1::Session>(std::move(transport), options));
  return fixture;
}

Fixture ConnectedFixture(MemoryTransport::Responder responder = AcceptAll) {
  auto fixture = MakeFixture(std::move(responder));
  fixture.transport->Push(ConnectionEvent(0));
  assert(fixture.client->Connect().ok());
  return fixture;
}

v1::RoSpec InventoryRoSpec(std::uint32_t id) {
  v1::RoSpec rospec;
  rospec.id = id;
  v1::AiSpec ai;
  ai.antenna_ids = {1};
  ai.inventory_parameter_specs.push_back(v1::InventoryParameterSpec{});
  rospec.specs.emplace_back(ai);
  return rospec;
}

template <typename Body>
Body LastSent(MemoryTransport& transport, v1::MessageType type) {
  Body body{};
  for (const auto& message : transport.Sent()) {
    if (message.type == type) {
      body = std::get<Body>(message.body);
    }
  }
  return body;
}

void TestCommandsBeforeConnectFail() {
  auto fixture = MakeFixture();
  auto status  = fixture.client->GetROSpecs();
  assert(status.error_class() == v1::ErrorClass::kTransport);
  assert(status.error().code == static_cast<std::int32_t>(v1::TransportCode::kNotConnected));
}

void TestLocalCheckRejectsBeforeSending() {
  auto fixture = ConnectedFixture();

  auto status = fixture.client->StartROSpec(7);
  assert(status.error_class() == v1::ErrorClass::kProtocol);
  assert(status.error().code == static_cast<std::int32_t>(v1::LifecycleStatus::kROSpecNotFound));

  assert(fixture.client->AddROSpec(InventoryRoSpec(7)).ok());
  auto disabled = fixture.client->StartROSpec(7);
  assert(disabled.error().code == static_cast<std::int32_t>(v1::LifecycleStatus::kInvalidState));

  assert(fixture.transport->CountSent(v1::MessageType::kStartRoSpec) == 0);
}

void TestLifecycleFollowsReaderAnswers() {
  auto fixture = ConnectedFixture();

  assert(fixture.client->AddROSpec(InventoryRoSpec(0x04D2)).ok());
  assert(fixture.client->EnableROSpec(0x04D2).ok());
  assert(fixture.client->StartROSpec(0x04D2).ok());

  auto& registry = fixture.client->session().rospecs();
  assert(registry.State(0x04D2) == v1::RoSpecState::kActive);

  const auto added = LastSent<v1::AddRoSpec>(*fixture.transport, v1::MessageType::kAddRoSpec);
  assert(added.rospec.id == 0x04D2);

  assert(fixture.client->StopROSpec(0x04D2).ok());
  assert(fixture.client->DisableROSpec(0x04D2).ok());
  assert(fixture.client->DeleteROSpec(0x04D2).ok());
  assert(registry.size() == 0);
}

void TestImmediateRoSpecSecondStartIsRefused() {
  auto fixture = ConnectedFixture();

  auto rospec                        = InventoryRoSpec(0x04D2);
  rospec.boundary.start_trigger.type = v1::StartTriggerType::kImmediate;
  rospec.boundary.stop_trigger.type  = v1::StopTriggerType::kNull;
  assert(fixture.client->AddROSpec(rospec).ok());
  assert(fixture.client->EnableROSpec(0x04D2).ok());
  assert(fixture.client->StartROSpec(0x04D2).ok());

  auto again = fixture.client->StartROSpec(0x04D2);
  assert(again.error_class() == v1::ErrorClass::kProtocol);
  assert(again.error().code == static_cast<std::int32_t>(v1::LifecycleStatus::kInvalidState));
  assert(fixture.transport->CountSent(v1::MessageType::kStartRoSpec) == 1);
  assert(fixture.client->session().rospecs().State(0x04D2) == v1::RoSpecState::kActive);
}

void TestStartEventAheadOfEnableResponse() {
  // The reader starts the ROSpec and reports it before answering ENABLE_ROSPEC.
  auto fixture = ConnectedFixture([](const v1::Message& request, MemoryTransport& transport) {
    if (request.type == v1::MessageType::kEnableRoSpec) {
      const auto id = std::get<v1::RoSpecIdRequest>(request.body).rospec_id;
      transport.Push(RoSpecEventNotification(v1::RoSpecEventType::kStart, id));
    }
    AcceptAll(request, transport);
  });

  auto rospec                        = InventoryRoSpec(0x04D2);
  rospec.boundary.start_trigger.type = v1::StartTriggerType::kImmediate;
  assert(fixture.client->AddROSpec(rospec).ok());
  assert(fixture.client->EnableROSpec(0x04D2).ok());

  auto& registry = fixture.client->session().rospecs();
  assert(registry.State(0x04D2) == v1::RoSpecState::kActive);

  assert(fixture.client->StopROSpec(0x04D2).ok());
  assert(registry.State(0x04D2) == v1::RoSpecState::kInactive);
  assert(fixture.transport->CountSent(v1::MessageType::kStopRoSpec) == 1);
}

void TestReaderRejectionLeavesRegistryUnchanged() {
  auto fixture = ConnectedFixture([](const v1::Message& request, MemoryTransport& transport) {
    const bool reject = request.type == v1::MessageType::kEnableRoSpec;
    transport.Push(ResponseFor(request, reject ? 100 : 0));
  });

  assert(fixture.client->AddROSpec(InventoryRoSpec(3)).ok());

  auto status = fixture.client->EnableROSpec(3);
  assert(status.error_class() == v1::ErrorClass::kProtocol);
  assert(status.error().code == 100);
  assert(fixture.client->session().rospecs().State(3) == v1::RoSpecState::kDisabled);
}

void TestSetReaderConfigMergesIntoCache() {
  auto fixture = ConnectedFixture();

  v1::ReaderConfig first;
  v1::AntennaConfiguration antenna1;
  antenna1.antenna_id     = 1;
  antenna1.rf_transmitter = v1::RfTransmitter{1, 1, 81};
  first.antenna_configurations.push_back(antenna1);
  first.keepalive_spec = v1::KeepaliveSpec{v1::KeepaliveTriggerType::kPeriodic, 60000};
  assert(fixture.client->SetReaderConfig(first).ok());

  v1::ReaderConfig second;
  v1::AntennaConfiguration antenna2;
  antenna2.antenna_id     = 2;
  antenna2.rf_transmitter = v1::RfTransmitter{1, 1, 40};
  second.antenna_configurations.push_back(antenna2);
  assert(fixture.client->SetReaderConfig(second).ok());

  auto cached = fixture.client->cached_config();
  assert(cached.antenna_configurations.size() == 2);
  assert(cached.keepalive_spec->period_ms == 60000);

  // Only the groups present in the partial are sent.
  const auto sent = LastSent<v1::SetReaderConfig>(*fixture.transport, v1::MessageType::kSetReaderConfig);
  assert(!sent.reset_to_factory_default);
  assert(!sent.config.keepalive_spec);
  assert(sent.config.antenna_configurations.size() == 1);
}

void TestFactoryResetSendsOnlyTheFlag() {
  auto fixture = ConnectedFixture();

  v1::ReaderConfig config;
  config.keepalive_spec = v1::KeepaliveSpec{v1::KeepaliveTriggerType::kPeriodic, 60000};
  assert(fixture.client->SetReaderConfig(config).ok());

  assert(fixture.client->SetReaderConfig(config, true).ok());
  const auto sent = LastSent<v1::SetReaderConfig>(*fixture.transport, v1::MessageType::kSetReaderConfig);
  assert(sent.reset_to_factory_default);
  assert(sent.config == v1::ReaderConfig{});
  assert(fixture.client->cached_config() == v1::ReaderConfig{});
}

void TestGetROSpecsResynchronizesRegistry() {
  auto fixture = ConnectedFixture([](const v1::Message& request, MemoryTransport& transport) {
    if (request.type != v1::MessageType::kGetRoSpecs) {
      transport.Push(ResponseFor(request));
      return;
    }
    auto listed          = InventoryRoSpec(55);
    listed.current_state = v1::RoSpecState::kActive;
    v1::GetRoSpecsResponse response;
    response.rospecs.push_back(listed);
    transport.Push(v1::MakeMessage(v1::MessageType::kGetRoSpecsResponse, request.message_id, response));
  });

  assert(fixture.client->AddROSpec(InventoryRoSpec(1)).ok());

  auto listed = fixture.client->GetROSpecs();
  assert(listed.ok());
  assert(listed->size() == 1);

  auto& registry = fixture.client->session().rospecs();
  assert(!registry.Get(1));
  assert(registry.State(55) == v1::RoSpecState::kActive);
}

void TestCustomMessageRoundTrip() {
  auto fixture = ConnectedFixture();

  auto reply = fixture.client->SendCustomMessage(25882, 21, {0x01, 0x02});
  assert(reply.ok());
  assert(reply->vendor_id == 25882);
  assert(reply->subtype == 21);
  assert((reply->data == llrp::util::Bytes{0x01, 0x02}));
}

void TestFireAndForgetCommands() {
  auto fixture = ConnectedFixture();

  assert(fixture.client->EnableEventsAndReports().ok());
  assert(fixture.client->GetReport().ok());
  assert(fixture.transport->WaitForSent(v1::MessageType::kGetReport, 2s));
  assert(fixture.transport->CountSent(v1::MessageType::kEnableEventsAndReports) == 1);
}

void TestScrubConfigurationClearsEverything() {
  auto fixture = ConnectedFixture();

  assert(fixture.client->AddROSpec(InventoryRoSpec(1)).ok());
  assert(fixture.client->AddROSpec(InventoryRoSpec(2)).ok());

  assert(fixture.client->ScrubConfiguration().ok());
  assert(fixture.client->session().rospecs().size() == 0);

  const auto deleted = LastSent<v1::RoSpecIdRequest>(*fixture.transport, v1::MessageType::kDeleteRoSpec);
  assert(deleted.rospec_id == 0);
  assert(fixture.transport->CountSent(v1::MessageType::kDeleteAccessSpec) == 1);
  assert(LastSent<v1::SetReaderConfig>(*fixture.transport, v1::MessageType::kSetReaderConfig)
             .reset_to_factory_default);
}

void TestCloseEndsSession() {
  auto fixture = ConnectedFixture();
  assert(fixture.client->Close().ok());
  assert(fixture.client->session().State() == v1::SessionState::kClosed);

  auto after = fixture.client->EnableROSpec(1);
  assert(!after.ok());
}

} // namespace

int main() {
  TestCommandsBeforeConnectFail();
  TestLocalCheckRejectsBeforeSending();
  TestLifecycleFollowsReaderAnswers();
  TestImmediateRoSpecSecondStartIsRefused();
  TestStartEventAheadOfEnableResponse();
  TestReaderRejectionLeavesRegistryUnchanged();
  TestSetReaderConfigMergesIntoCache();
  TestFactoryResetSendsOnlyTheFlag();
  TestGetROSpecsResynchronizesRegistry();
  TestCustomMessageRoundTrip();
  TestFireAndForgetCommands();
  TestScrubConfigurationClearsEverything();
  TestCloseEndsSession();

  std::cout << "llrp_engine_unit_reader_client: pass\n";
  return 0;
}
