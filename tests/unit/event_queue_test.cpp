#include "internal/session/event_queue.hpp"

#include <cassert>
#include <iostream>
#include <thread>
#include <variant>

namespace {

using llrp::codec::MakeMessage;
using llrp::codec::MessageType;
using llrp::model::SessionState;
using llrp::session::EventQueue;
using llrp::session::StateChange;

void TestFullQueueDropsMessages() {
  EventQueue queue(2);
  assert(queue.capacity() == 2);

  assert(queue.Enqueue(MakeMessage(MessageType::kKeepalive, 1)));
  assert(queue.Enqueue(MakeMessage(MessageType::kKeepalive, 2)));
  assert(!queue.Enqueue(MakeMessage(MessageType::kKeepalive, 3)));
  assert(!queue.Enqueue(MakeMessage(MessageType::kKeepalive, 4)));
  assert(queue.size() == 2);
  assert(queue.dropped() == 2);

  // Oldest messages survive; the overflow is discarded.
  auto first = queue.Dequeue();
  assert(first && std::get<llrp::codec::Message>(*first).message_id == 1);

  assert(queue.Enqueue(MakeMessage(MessageType::kKeepalive, 5)));
  assert(queue.size() == 2);
}

void TestStateChangesBypassCapacity() {
  EventQueue queue(1);
  assert(queue.Enqueue(MakeMessage(MessageType::kKeepalive, 1)));
  assert(queue.Enqueue(StateChange{SessionState::kOperational, SessionState::kError}));
  assert(queue.size() == 2);
  assert(queue.dropped() == 0);

  (void)queue.Dequeue();
  auto change = queue.Dequeue();
  assert(change && std::get<StateChange>(*change).to == SessionState::kError);
}

void TestShutdownDrainsThenEnds() {
  EventQueue queue;
  assert(queue.Enqueue(MakeMessage(MessageType::kKeepalive, 9)));

  std::thread closer([&] { queue.Shutdown(); });
  closer.join();

  assert(!queue.Enqueue(MakeMessage(MessageType::kKeepalive, 10)));
  assert(queue.Dequeue());
  assert(!queue.Dequeue());
}

} // namespace

int main() {
  TestFullQueueDropsMessages();
  TestStateChangesBypassCapacity();
  TestShutdownDrainsThenEnds();

  std::cout << "llrp_engine_unit_event_queue: pass\n";
  return 0;
}
