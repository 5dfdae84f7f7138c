#include "event_queue.hpp"

namespace llrp::session {

EventQueue::EventQueue(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {
}

bool EventQueue::Enqueue(SessionEvent event) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      return false;
    }
    if (queue_.size() >= capacity_ && std::holds_alternative<codec::Message>(event)) {
      ++dropped_;
      return false;
    }
    queue_.push(std::move(event));
  }
  cv_.notify_one();
  return true;
}

std::optional<SessionEvent> EventQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  SessionEvent event = std::move(queue_.front());
  queue_.pop();
  return event;
}

void EventQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t EventQueue::size() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

std::size_t EventQueue::dropped() const {
  std::lock_guard lock(mutex_);
  return dropped_;
}

} // namespace llrp::session
