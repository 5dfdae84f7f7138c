#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <mutex>
#include <vector>

#include "internal/codec/message.hpp"
#include "internal/codec/message_codec.hpp"
#include "internal/transport/transport.hpp"
#include "internal/util/errors.hpp"

namespace llrp::testing {

/*
  MemoryTransport

  In-process stand-in for a reader socket. Frames written by the session are
  decoded and recorded; an optional responder plays the reader and pushes
  replies back into the inbound stream.
*/
class MemoryTransport : public transport::Transport {
 public:
  using Responder = std::function<void(const codec::Message&, MemoryTransport&)>;

  void Connect() override {
    std::lock_guard lock(mutex_);
    if (refuse_connect_) {
      throw util::TransportError("connection refused");
    }
    open_ = true;
  }

  std::size_t Read(std::uint8_t* buffer, std::size_t size, std::chrono::milliseconds timeout) override {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [&] { return !inbound_.empty() || eof_ || !open_; });
    if (inbound_.empty()) {
      if (eof_ || !open_) {
        throw util::ConnectionLost("peer closed the connection");
      }
      return 0;
    }

    const std::size_t n = std::min(size, inbound_.size());
    std::memcpy(buffer, inbound_.data(), n);
    inbound_.erase(inbound_.begin(), inbound_.begin() + static_cast<std::ptrdiff_t>(n));
    return n;
  }

  void Write(const std::uint8_t* data, std::size_t size) override {
    std::vector<codec::Message> decoded;
    Responder                   responder;
    {
      std::lock_guard lock(mutex_);
      if (!open_) {
        throw util::TransportError("transport is closed");
      }
      written_.Append(data, size);
      while (auto message = codec_.Decode(written_)) {
        sent_.push_back(*message);
        decoded.push_back(std::move(*message));
      }
      responder = responder_;
    }
    cv_.notify_all();

    if (responder) {
      for (const auto& message : decoded) {
        responder(message, *this);
      }
    }
  }

  void Close() override {
    {
      std::lock_guard lock(mutex_);
      open_ = false;
    }
    cv_.notify_all();
  }

  bool IsOpen() const override {
    std::lock_guard lock(mutex_);
    return open_;
  }

  // ------------------------------------------------------------
  // Reader side
  // ------------------------------------------------------------

  void Push(const codec::Message& message) {
    PushBytes(codec_.Encode(message));
  }

  void PushBytes(const util::Bytes& bytes) {
    {
      std::lock_guard lock(mutex_);
      inbound_.insert(inbound_.end(), bytes.begin(), bytes.end());
    }
    cv_.notify_all();
  }

  void SetEof() {
    {
      std::lock_guard lock(mutex_);
      eof_ = true;
    }
    cv_.notify_all();
  }

  void SetResponder(Responder responder) {
    std::lock_guard lock(mutex_);
    responder_ = std::move(responder);
  }

  void RefuseConnect() {
    std::lock_guard lock(mutex_);
    refuse_connect_ = true;
  }

  std::vector<codec::Message> Sent() const {
    std::lock_guard lock(mutex_);
    return sent_;
  }

  std::size_t CountSent(codec::MessageType type) const {
    std::lock_guard lock(mutex_);
    std::size_t n = 0;
    for (const auto& message : sent_) {
      if (message.type == type) {
        ++n;
      }
    }
    return n;
  }

  // Blocks until a message of `type` has been written or `timeout` passes.
  bool WaitForSent(codec::MessageType type, std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] {
      for (const auto& message : sent_) {
        if (message.type == type) {
          return true;
        }
      }
      return false;
    });
  }

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;

  codec::MessageCodec         codec_;
  codec::ByteStream           written_;
  std::vector<codec::Message> sent_;
  std::vector<std::uint8_t>   inbound_;
  Responder                   responder_;

  bool open_           = false;
  bool eof_            = false;
  bool refuse_connect_ = false;
};

// READER_EVENT_NOTIFICATION carrying a ConnectionAttemptEvent.
inline codec::Message ConnectionEvent(std::uint16_t status) {
  model::ReaderEventNotificationData data;
  data.timestamp.microseconds = 1700000000000000ull;
  data.connection_attempt     = model::ConnectionAttemptEvent{status};
  return codec::MakeMessage(codec::MessageType::kReaderEventNotification, 0, codec::ReaderEventNotification{data});
}

// READER_EVENT_NOTIFICATION carrying a ROSpecEvent.
inline codec::Message RoSpecEventNotification(model::RoSpecEventType type, std::uint32_t rospec_id) {
  model::ReaderEventNotificationData data;
  data.timestamp.microseconds = 1700000000000000ull;
  data.rospec                 = model::RoSpecEvent{type, rospec_id, 0};
  return codec::MakeMessage(codec::MessageType::kReaderEventNotification, 0, codec::ReaderEventNotification{data});
}

// Response body a compliant reader would send for `request`, with `status`.
inline codec::Message ResponseFor(const codec::Message& request, std::uint16_t status = 0) {
  const auto type = *codec::ResponseTypeFor(request.type);

  model::LlrpStatus llrp_status;
  llrp_status.code = status;
  if (status != 0) {
    llrp_status.error_description = "rejected by reader";
  }

  codec::MessageBody body = codec::StatusResponse{llrp_status};
  switch (type) {
    case codec::MessageType::kGetReaderCapabilitiesResponse:
      body = codec::GetReaderCapabilitiesResponse{llrp_status, {}};
      break;
    case codec::MessageType::kGetReaderConfigResponse: body = codec::GetReaderConfigResponse{llrp_status, {}}; break;
    case codec::MessageType::kGetRoSpecsResponse: body = codec::GetRoSpecsResponse{llrp_status, {}}; break;
    case codec::MessageType::kGetAccessSpecsResponse: body = codec::GetAccessSpecsResponse{llrp_status, {}}; break;
    case codec::MessageType::kCustomMessage: body = request.body; break;
    default: break;
  }
  return codec::MakeMessage(type, request.message_id, std::move(body));
}

} // namespace llrp::testing
