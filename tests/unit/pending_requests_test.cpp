#include "internal/session/pending_requests.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>

namespace {

using llrp::codec::MakeMessage;
using llrp::codec::MessageType;
using llrp::session::PendingRequests;
using llrp::util::ErrorClass;
using llrp::util::TransportCode;

namespace codec = llrp::codec;

using namespace std::chrono_literals;

void TestResolveWakesWaiter() {
  PendingRequests pending;
  assert(pending.Insert(7, MessageType::kStartRoSpecResponse));
  assert(!pending.Insert(7, MessageType::kStartRoSpecResponse));

  std::thread reader([&] {
    std::this_thread::sleep_for(20ms);
    assert(pending.Resolve(MakeMessage(MessageType::kStartRoSpecResponse, 7, codec::StatusResponse{})));
  });

  auto response = pending.Wait(7, 2s);
  reader.join();

  assert(response.ok());
  assert(response->type == MessageType::kStartRoSpecResponse);
  assert(response->message_id == 7);
  assert(pending.size() == 0);
}

void TestOnlyExpectedTypesResolve() {
  PendingRequests pending;
  assert(pending.Insert(3, MessageType::kAddRoSpecResponse));

  // A report that happens to carry the same id is not the answer.
  assert(!pending.Resolve(MakeMessage(MessageType::kRoAccessReport, 3, codec::RoAccessReport{})));
  assert(!pending.Resolve(MakeMessage(MessageType::kAddRoSpecResponse, 4, codec::StatusResponse{})));
  assert(pending.Resolve(MakeMessage(MessageType::kErrorMessage, 3, codec::StatusResponse{})));

  auto response = pending.Wait(3, 1s);
  assert(response.ok());
  assert(response->type == MessageType::kErrorMessage);
}

void TestTimeoutRemovesEntry() {
  PendingRequests pending;
  assert(pending.Insert(1, MessageType::kGetRoSpecsResponse));

  auto response = pending.Wait(1, 30ms);
  assert(!response.ok());
  assert(response.error_class() == ErrorClass::kTransport);
  assert(response.error().code == static_cast<std::int32_t>(TransportCode::kTimeout));
  assert(pending.size() == 0);

  // A late answer finds nobody waiting.
  assert(!pending.Resolve(MakeMessage(MessageType::kGetRoSpecsResponse, 1, codec::GetRoSpecsResponse{})));
}

void TestCancelAndFailAll() {
  PendingRequests pending;
  assert(pending.Insert(1, MessageType::kStopRoSpecResponse));
  assert(pending.Insert(2, MessageType::kStopRoSpecResponse));

  assert(pending.Cancel(1));
  auto cancelled = pending.Wait(1, 1s);
  assert(cancelled.error().code == static_cast<std::int32_t>(TransportCode::kCancelled));

  pending.FailAll(llrp::util::TransportFailure(TransportCode::kConnectionLost, "keepalive lost"));
  auto failed = pending.Wait(2, 1s);
  assert(failed.error().code == static_cast<std::int32_t>(TransportCode::kConnectionLost));
  assert(pending.size() == 0);
}

} // namespace

int main() {
  TestResolveWakesWaiter();
  TestOnlyExpectedTypesResolve();
  TestTimeoutRemovesEntry();
  TestCancelAndFailAll();

  std::cout << "llrp_engine_unit_pending_requests: pass\n";
  return 0;
}
