#include "internal/session/session.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "memory_transport.hpp"

namespace {

using llrp::codec::MakeMessage;
using llrp::codec::Message;
using llrp::codec::MessageType;
using llrp::model::SessionState;
using llrp::session::Session;
using llrp::session::SessionOptions;
using llrp::testing::ConnectionEvent;
using llrp::testing::MemoryTransport;
using llrp::testing::ResponseFor;
using llrp::util::ErrorClass;
using llrp::util::TransportCode;

namespace codec     = llrp::codec;
namespace lifecycle = llrp::lifecycle;
namespace model     = llrp::model;
namespace util      = llrp::util;

using namespace std::chrono_literals;

struct Harness {
  MemoryTransport*         transport = nullptr;
  std::unique_ptr<Session> session;
};

SessionOptions FastOptions() {
  SessionOptions options;
  options.command_timeout = 5s;
  options.connect_timeout = 2s;
  options.close_timeout   = 200ms;
  options.poll_interval   = 10ms;
  return options;
}

Harness MakeHarness(SessionOptions options = FastOptions()) {
  auto    transport = std::make_unique<MemoryTransport>();
  Harness harness;
  harness.transport = transport.get();
  harness.session   = std::make_unique<Session>(std::move(transport), options);
  return harness;
}

Harness OpenHarness(SessionOptions options = FastOptions()) {
  auto harness = MakeHarness(options);
  harness.transport->Push(ConnectionEvent(0));
  auto opened = harness.session->Open();
  assert(opened.ok());
  assert(harness.session->State() == SessionState::kOperational);
  return harness;
}

template <typename Pred>
bool Eventually(Pred pred, std::chrono::milliseconds timeout = 2s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(5ms);
  }
  return pred();
}

// Answers CLOSE_CONNECTION so Close completes without waiting.
void AnswerClose(const Message& request, MemoryTransport& transport) {
  if (request.type == MessageType::kCloseConnection) {
    transport.Push(ResponseFor(request));
  }
}

Message StartRoSpec(Session& session, std::uint32_t rospec_id) {
  return MakeMessage(MessageType::kStartRoSpec, session.NextMessageId(), codec::RoSpecIdRequest{rospec_id});
}

void TestOpenAndCloseWalkTheStates() {
  auto harness = MakeHarness();

  std::mutex                                         mutex;
  std::vector<std::pair<SessionState, SessionState>> changes;
  harness.session->AddStateObserver([&](SessionState from, SessionState to) {
    std::lock_guard lock(mutex);
    changes.emplace_back(from, to);
  });

  harness.transport->Push(ConnectionEvent(0));
  harness.transport->SetResponder(AnswerClose);
  assert(harness.session->Open().ok());
  assert(harness.session->Close().ok());
  assert(harness.session->State() == SessionState::kClosed);
  assert(harness.transport->CountSent(MessageType::kCloseConnection) == 1);
  assert(!harness.transport->IsOpen());

  std::lock_guard lock(mutex);
  const std::vector<std::pair<SessionState, SessionState>> expected{
      {SessionState::kConnecting, SessionState::kConnected},
      {SessionState::kConnected, SessionState::kOperational},
      {SessionState::kOperational, SessionState::kClosing},
      {SessionState::kClosing, SessionState::kClosed},
  };
  assert(changes == expected);
}

void TestRefusedConnectionIsProtocolError() {
  auto harness = MakeHarness();
  harness.transport->Push(ConnectionEvent(5));

  auto opened = harness.session->Open();
  assert(!opened.ok());
  assert(opened.error_class() == ErrorClass::kProtocol);
  assert(opened.error().code == 5);
  assert(harness.session->State() == SessionState::kError);
}

void TestMissingConnectionEventTimesOut() {
  auto options            = FastOptions();
  options.connect_timeout = 50ms;
  auto harness            = MakeHarness(options);

  auto opened = harness.session->Open();
  assert(!opened.ok());
  assert(opened.error().code == static_cast<std::int32_t>(TransportCode::kTimeout));
  assert(harness.session->State() == SessionState::kError);
}

void TestConnectFailureIsTransportError() {
  auto harness = MakeHarness();
  harness.transport->RefuseConnect();

  auto opened = harness.session->Open();
  assert(opened.error_class() == ErrorClass::kTransport);
  assert(harness.session->State() == SessionState::kError);
}

void TestCommandsRequireOperationalSession() {
  auto harness = MakeHarness();
  auto result  = harness.session->Transact(StartRoSpec(*harness.session, 1));
  assert(result.error().code == static_cast<std::int32_t>(TransportCode::kNotConnected));
  assert(harness.transport->Sent().empty());
}

void TestKeepaliveIsAcknowledgedWithSameId() {
  auto harness = OpenHarness();
  harness.transport->Push(MakeMessage(MessageType::kKeepalive, 77));

  assert(harness.transport->WaitForSent(MessageType::kKeepaliveAck, 2s));
  for (const auto& message : harness.transport->Sent()) {
    if (message.type == MessageType::kKeepaliveAck) {
      assert(message.message_id == 77);
    }
  }
}

void TestResponseIsFoundAmongReports() {
  auto harness = OpenHarness();

  std::mutex                        mutex;
  std::vector<model::TagReportData> tags;
  harness.session->AddReportObserver([&](const model::TagReportData& tag) {
    std::lock_guard lock(mutex);
    tags.push_back(tag);
  });

  harness.transport->SetResponder([](const Message& request, MemoryTransport& transport) {
    if (request.type == MessageType::kGetRoSpecs) {
      // Reports may precede the response and may even reuse its id.
      model::TagReportData tag;
      tag.epc        = util::Bytes(12, 0xAA);
      tag.antenna_id = 1;
      codec::RoAccessReport report;
      report.tag_reports.push_back(tag);
      transport.Push(MakeMessage(MessageType::kRoAccessReport, request.message_id, report));
      transport.Push(MakeMessage(MessageType::kKeepalive, 500));
      transport.Push(ResponseFor(request));
    }
    AnswerClose(request, transport);
  });

  auto response =
      harness.session->Transact(MakeMessage(MessageType::kGetRoSpecs, harness.session->NextMessageId()));
  assert(response.ok());
  assert(response->type == MessageType::kGetRoSpecsResponse);

  assert(harness.session->Close().ok());
  std::lock_guard lock(mutex);
  assert(tags.size() == 1);
  assert(tags[0].antenna_id == 1);
}

void TestReaderStatusBecomesProtocolError() {
  auto harness = OpenHarness();
  harness.transport->SetResponder([](const Message& request, MemoryTransport& transport) {
    if (request.type == MessageType::kStartRoSpec) {
      transport.Push(ResponseFor(request, static_cast<std::uint16_t>(model::StatusCode::kFieldInvalid)));
    } else if (request.type == MessageType::kGetReaderConfig) {
      model::LlrpStatus status;
      status.code = static_cast<std::uint16_t>(model::StatusCode::kMsgUnsupportedMessage);
      transport.Push(MakeMessage(MessageType::kErrorMessage, request.message_id, codec::StatusResponse{status}));
    }
  });

  auto rejected = harness.session->Transact(StartRoSpec(*harness.session, 3));
  assert(rejected.error_class() == ErrorClass::kProtocol);
  assert(rejected.error().code == 300);

  auto unsupported = harness.session->Transact(
      MakeMessage(MessageType::kGetReaderConfig, harness.session->NextMessageId(), codec::GetReaderConfig{}));
  assert(unsupported.error_class() == ErrorClass::kProtocol);
  assert(unsupported.error().code == 109);

  assert(harness.session->State() == SessionState::kOperational);
}

void TestEncodeFailureLeavesSessionUsable() {
  auto harness = OpenHarness();

  auto sent = harness.session->Send(MakeMessage(MessageType::kAddRoSpec, harness.session->NextMessageId()));
  assert(sent.error_class() == ErrorClass::kCodec);
  assert(harness.session->State() == SessionState::kOperational);
}

void TestDuplicateIdAndCancel() {
  auto harness = OpenHarness();
  auto request = StartRoSpec(*harness.session, 1);

  util::Result<Message> first = util::TransportFailure(TransportCode::kIOError, "not run");
  std::thread           waiter([&] { first = harness.session->Transact(request); });
  assert(harness.transport->WaitForSent(MessageType::kStartRoSpec, 2s));

  auto second = harness.session->Transact(request);
  assert(second.error().code == static_cast<std::int32_t>(TransportCode::kDuplicateMessageId));

  assert(Eventually([&] { return harness.session->Cancel(request.message_id); }));
  waiter.join();
  assert(first.error().code == static_cast<std::int32_t>(TransportCode::kCancelled));
  assert(harness.session->State() == SessionState::kOperational);
}

void TestCloseFailsPendingCommands() {
  auto harness = OpenHarness();

  util::Result<Message> result = util::TransportFailure(TransportCode::kIOError, "not run");
  std::thread           waiter([&] { result = harness.session->Transact(StartRoSpec(*harness.session, 1)); });
  assert(harness.transport->WaitForSent(MessageType::kStartRoSpec, 2s));

  // No CLOSE_CONNECTION_RESPONSE arrives; the close is forced after its timeout.
  assert(harness.session->Close().ok());
  waiter.join();

  assert(result.error_class() == ErrorClass::kTransport);
  assert(result.error().code == static_cast<std::int32_t>(TransportCode::kClosed));
  assert(harness.session->State() == SessionState::kClosed);

  auto after = harness.session->Transact(StartRoSpec(*harness.session, 1));
  assert(after.error().code == static_cast<std::int32_t>(TransportCode::kNotConnected));
}

void TestEofWhileClosingCompletesClose() {
  auto harness = OpenHarness();
  harness.transport->SetResponder([](const Message& request, MemoryTransport& transport) {
    if (request.type == MessageType::kCloseConnection) {
      transport.SetEof();
    }
  });

  assert(harness.session->Close().ok());
  assert(harness.session->State() == SessionState::kClosed);
  assert(!harness.session->LastError());
}

void TestKeepaliveLossFailsSession() {
  auto options             = FastOptions();
  options.command_timeout  = 10s;
  options.keepalive_period = 100ms;
  options.keepalive_grace  = 100ms;
  auto harness             = OpenHarness(options);

  const auto            started = std::chrono::steady_clock::now();
  util::Result<Message> result  = util::TransportFailure(TransportCode::kIOError, "not run");
  std::thread           waiter([&] { result = harness.session->Transact(StartRoSpec(*harness.session, 1)); });
  waiter.join();

  assert(std::chrono::steady_clock::now() - started < 5s);
  assert(result.error().code == static_cast<std::int32_t>(TransportCode::kConnectionLost));
  assert(harness.session->State() == SessionState::kError);
  assert(harness.session->LastError()->code == static_cast<std::int32_t>(TransportCode::kConnectionLost));
}

void TestKeepalivesHoldTheWatchdogOff() {
  auto options             = FastOptions();
  options.keepalive_period = 100ms;
  options.keepalive_grace  = 100ms;
  auto harness             = OpenHarness(options);

  for (std::uint32_t i = 0; i < 8; ++i) {
    harness.transport->Push(MakeMessage(MessageType::kKeepalive, 1000 + i));
    std::this_thread::sleep_for(50ms);
  }
  assert(harness.session->State() == SessionState::kOperational);
}

void TestMalformedFrameEntersError() {
  auto harness = OpenHarness();
  harness.transport->PushBytes({0x04, 0x3E, 0x00, 0x00, 0x00, 0x05, 0x00, 0x00, 0x00, 0x01});

  assert(Eventually([&] { return harness.session->State() == SessionState::kError; }));
  const auto error = harness.session->LastError();
  assert(error && error->error_class == ErrorClass::kCodec);
  assert(error->code == static_cast<std::int32_t>(util::CodecErrorCode::kBadLength));
}

void TestPeerEofEntersError() {
  auto harness = OpenHarness();
  harness.transport->SetEof();

  assert(Eventually([&] { return harness.session->State() == SessionState::kError; }));
  assert(harness.session->LastError()->code == static_cast<std::int32_t>(TransportCode::kConnectionLost));
}

void TestUnsolicitedEventsReachRegistryAndObservers() {
  auto harness = OpenHarness();

  model::RoSpec rospec;
  rospec.id = 42;
  assert(harness.session->rospecs().Add(rospec));
  assert(harness.session->rospecs().Enable(42));

  std::mutex mutex;
  int        events = 0;
  harness.session->AddEventObserver([&](const model::ReaderEventNotificationData& data) {
    if (data.rospec) {
      std::lock_guard lock(mutex);
      ++events;
    }
  });

  model::ReaderEventNotificationData data;
  data.rospec = model::RoSpecEvent{model::RoSpecEventType::kStart, 42, 0};
  harness.transport->Push(MakeMessage(MessageType::kReaderEventNotification, 0, codec::ReaderEventNotification{data}));

  assert(Eventually([&] { return harness.session->rospecs().State(42) == model::RoSpecState::kActive; }));
  assert(Eventually([&] {
    std::lock_guard lock(mutex);
    return events == 1;
  }));
}

model::AccessSpec ReadWriteLockSpec(std::uint32_t id, bool continue_on_failure) {
  model::AccessSpec spec;
  spec.id                  = id;
  spec.continue_on_failure = continue_on_failure;
  spec.command.tag_spec.target_tags.push_back(model::C1G2TargetTag{});

  model::C1G2Read read;
  read.op_spec_id = 1;
  read.word_count = 1;
  model::C1G2Write write;
  write.op_spec_id = 2;
  write.data       = {0xBEEF};
  model::C1G2Lock lock;
  lock.op_spec_id = 3;
  lock.payloads.push_back(model::C1G2LockPayload{0, 2});

  spec.command.op_specs = {read, write, lock};
  return spec;
}

// The Write fails with "tag memory locked"; Read and Lock succeed.
void PushWriteFailure(MemoryTransport& transport, std::uint32_t accessspec_id) {
  model::TagReportData tag;
  tag.epc             = util::Bytes(12, 0xAB);
  tag.access_spec_id  = accessspec_id;
  tag.op_spec_results = {
      model::C1G2ReadOpSpecResult{0, 1, {0x1111}},
      model::C1G2WriteOpSpecResult{3, 2, 0},
      model::C1G2LockOpSpecResult{0, 3},
  };
  codec::RoAccessReport report;
  report.tag_reports.push_back(tag);
  transport.Push(MakeMessage(MessageType::kRoAccessReport, 0, report));
}

void TestAccessSpecFailurePolicy() {
  auto  harness  = OpenHarness();
  auto& registry = harness.session->accessspecs();

  assert(registry.Add(ReadWriteLockSpec(5, false)));
  assert(registry.Enable(5));
  assert(registry.Add(ReadWriteLockSpec(6, true)));
  assert(registry.Enable(6));

  PushWriteFailure(*harness.transport, 5);
  PushWriteFailure(*harness.transport, 6);

  assert(Eventually([&] { return registry.LastExecution(5) && registry.LastExecution(6); }));

  const auto halted = *registry.LastExecution(5);
  assert(halted.operations[1].outcome == lifecycle::OpOutcome::kFailed);
  assert(halted.operations[2].outcome == lifecycle::OpOutcome::kSkipped);

  const auto continued = *registry.LastExecution(6);
  assert(continued.operations[1].outcome == lifecycle::OpOutcome::kFailed);
  assert(continued.operations[2].outcome == lifecycle::OpOutcome::kSucceeded);
}

void TestObserversRunUnderReaderLabel() {
  auto options         = FastOptions();
  options.reader_label = "dock-door-3";
  auto harness         = OpenHarness(options);

  std::mutex  mutex;
  std::string label;
  harness.session->AddReportObserver([&](const model::TagReportData&) {
    std::lock_guard lock(mutex);
    label = llrp::observability::CurrentReaderLabel();
  });

  model::TagReportData tag;
  tag.epc = util::Bytes(12, 0x01);
  codec::RoAccessReport report;
  report.tag_reports.push_back(tag);
  harness.transport->Push(MakeMessage(MessageType::kRoAccessReport, 0, report));

  assert(Eventually([&] {
    std::lock_guard lock(mutex);
    return label == "dock-door-3";
  }));
}

} // namespace

int main() {
  TestOpenAndCloseWalkTheStates();
  TestRefusedConnectionIsProtocolError();
  TestMissingConnectionEventTimesOut();
  TestConnectFailureIsTransportError();
  TestCommandsRequireOperationalSession();
  TestKeepaliveIsAcknowledgedWithSameId();
  TestResponseIsFoundAmongReports();
  TestReaderStatusBecomesProtocolError();
  TestEncodeFailureLeavesSessionUsable();
  TestDuplicateIdAndCancel();
  TestCloseFailsPendingCommands();
  TestEofWhileClosingCompletesClose();
  TestKeepaliveLossFailsSession();
  TestKeepalivesHoldTheWatchdogOff();
  TestMalformedFrameEntersError();
  TestPeerEofEntersError();
  TestUnsolicitedEventsReachRegistryAndObservers();
  TestAccessSpecFailurePolicy();
  TestObserversRunUnderReaderLabel();

  std::cout << "llrp_engine_unit_session: pass\n";
  return 0;
}
