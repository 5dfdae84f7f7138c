#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <variant>

#include "internal/codec/message.hpp"
#include "internal/model/state_machine.hpp"

namespace llrp::session {

struct StateChange {
  model::SessionState from = model::SessionState::kConnecting;
  model::SessionState to   = model::SessionState::kConnecting;
};

// Unit of work handed from the receive path to observers.
using SessionEvent = std::variant<codec::Message, StateChange>;

inline constexpr std::size_t kDefaultEventQueueCapacity = 4096;

/*
  Thread-safe blocking queue between the receive path and the dispatcher.

  Bounded so a stalled observer cannot grow memory without limit. When the
  queue is full, inbound messages are dropped and counted. State changes are
  always queued.
*/
class EventQueue {
 public:
  explicit EventQueue(std::size_t capacity = kDefaultEventQueueCapacity);

  // false when the event was dropped (queue full or shut down)
  bool Enqueue(SessionEvent event);

  // blocking wait; nullopt once shut down and drained
  std::optional<SessionEvent> Dequeue();

  void Shutdown();

  std::size_t size() const;
  std::size_t capacity() const { return capacity_; }
  std::size_t dropped() const;

 private:
  mutable std::mutex       mutex_;
  std::condition_variable  cv_;
  std::queue<SessionEvent> queue_;
  const std::size_t        capacity_;
  std::size_t              dropped_  = 0;
  bool                     shutdown_ = false;
};

} // namespace llrp::session
