#include "pending_requests.hpp"

#include <string>

namespace llrp::session {

bool PendingRequests::Insert(std::uint32_t message_id, codec::MessageType expected) {
  std::lock_guard lock(mutex_);
  return waiters_.emplace(message_id, Waiter{expected, std::nullopt}).second;
}

bool PendingRequests::Resolve(const codec::Message& message) {
  {
    std::lock_guard lock(mutex_);

    auto it = waiters_.find(message.message_id);
    if (it == waiters_.end() || it->second.outcome) {
      return false;
    }
    if (message.type != it->second.expected && message.type != codec::MessageType::kErrorMessage) {
      return false;
    }
    it->second.outcome.emplace(message);
  }
  cv_.notify_all();
  return true;
}

util::Result<codec::Message> PendingRequests::Wait(std::uint32_t message_id, std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);

  auto it = waiters_.find(message_id);
  if (it == waiters_.end()) {
    return util::TransportFailure(util::TransportCode::kCancelled,
                                  "message " + std::to_string(message_id) + " is not pending");
  }

  bool done = cv_.wait_for(lock, timeout, [&] {
    auto entry = waiters_.find(message_id);
    return entry == waiters_.end() || entry->second.outcome.has_value();
  });

  it = waiters_.find(message_id);
  if (it == waiters_.end()) {
    return util::TransportFailure(util::TransportCode::kCancelled,
                                  "message " + std::to_string(message_id) + " was removed");
  }

  if (!done) {
    waiters_.erase(it);
    return util::TransportFailure(util::TransportCode::kTimeout,
                                  "no response to message " + std::to_string(message_id) + " within " +
                                      std::to_string(timeout.count()) + "ms");
  }

  auto outcome = std::move(*it->second.outcome);
  waiters_.erase(it);
  return outcome;
}

bool PendingRequests::Cancel(std::uint32_t message_id) {
  return Fail(message_id, util::TransportFailure(util::TransportCode::kCancelled,
                                                 "message " + std::to_string(message_id) + " cancelled"));
}

void PendingRequests::Remove(std::uint32_t message_id) {
  {
    std::lock_guard lock(mutex_);
    waiters_.erase(message_id);
  }
  cv_.notify_all();
}

bool PendingRequests::Fail(std::uint32_t message_id, const util::Error& error) {
  {
    std::lock_guard lock(mutex_);

    auto it = waiters_.find(message_id);
    if (it == waiters_.end() || it->second.outcome) {
      return false;
    }
    it->second.outcome.emplace(error);
  }
  cv_.notify_all();
  return true;
}

void PendingRequests::FailAll(const util::Error& error) {
  {
    std::lock_guard lock(mutex_);
    for (auto& [id, waiter] : waiters_) {
      if (!waiter.outcome) {
        waiter.outcome.emplace(error);
      }
    }
  }
  cv_.notify_all();
}

std::size_t PendingRequests::size() const {
  std::lock_guard lock(mutex_);
  return waiters_.size();
}

} // namespace llrp::session
