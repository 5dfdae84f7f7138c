#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "internal/codec/message.hpp"
#include "internal/util/result.hpp"

namespace llrp::session {

/*
  PendingRequests

  Table of in-flight commands keyed by message id. Command callers insert and
  wait; the receive path resolves. Every entry is removed by the waiter that
  owns it, whatever the outcome.
*/
class PendingRequests {
 public:
  // False when `message_id` is already in flight.
  bool Insert(std::uint32_t message_id, codec::MessageType expected);

  // Hands `message` to the waiter for its id when it is the expected response
  // type or an ERROR_MESSAGE. Returns false when nothing was waiting for it.
  bool Resolve(const codec::Message& message);

  // Blocks until the entry is resolved, failed, cancelled, or `timeout`
  // expires, then removes it.
  util::Result<codec::Message> Wait(std::uint32_t message_id, std::chrono::milliseconds timeout);

  bool Cancel(std::uint32_t message_id);

  // Drops an entry whose request never reached the wire.
  void Remove(std::uint32_t message_id);

  bool Fail(std::uint32_t message_id, const util::Error& error);

  void FailAll(const util::Error& error);

  std::size_t size() const;

 private:
  struct Waiter {
    codec::MessageType                          expected;
    std::optional<util::Result<codec::Message>> outcome;
  };

  mutable std::mutex      mutex_;
  std::condition_variable cv_;

  std::unordered_map<std::uint32_t, Waiter> waiters_;
};

} // namespace llrp::session
