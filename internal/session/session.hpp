#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "internal/codec/message.hpp"
#include "internal/codec/message_codec.hpp"
#include "internal/lifecycle/accessspec_registry.hpp"
#include "internal/lifecycle/rospec_registry.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/session/event_dispatcher.hpp"
#include "internal/session/event_queue.hpp"
#include "internal/session/pending_requests.hpp"
#include "internal/transport/transport.hpp"
#include "internal/util/result.hpp"

namespace llrp::session {

struct SessionOptions {
  std::chrono::milliseconds command_timeout  = std::chrono::milliseconds(5000);
  std::chrono::milliseconds connect_timeout  = std::chrono::milliseconds(5000);  // for the connection event
  std::chrono::milliseconds close_timeout    = std::chrono::milliseconds(2000);
  std::chrono::milliseconds keepalive_period = std::chrono::milliseconds(0);     // 0 = unsupervised
  std::chrono::milliseconds keepalive_grace  = std::chrono::milliseconds(5000);
  std::chrono::milliseconds poll_interval    = std::chrono::milliseconds(100);
  std::size_t               max_frame_bytes  = codec::kDefaultMaxFrameBytes;
  std::size_t               event_capacity   = kDefaultEventQueueCapacity;  // observer backlog
  std::string               reader_label;                                  // reader=<label> on log lines
};

/*
  Session

  One LLRP connection. Owns the transport, the pending-request table, the
  ROSpec/AccessSpec registries and the observer dispatcher.

  A single receive thread decodes the inbound stream, answers keepalives,
  resolves pending commands by message id and queues everything else for
  the dispatcher thread. Writes are serialized so frames never interleave.

    Connecting -> Connected -> Operational -> Closing -> Closed
    any non-terminal state -> Error -> Closed
*/
class Session {
 public:
  explicit Session(std::unique_ptr<transport::Transport> transport, SessionOptions options = {});
  ~Session();

  Session(const Session&)            = delete;
  Session& operator=(const Session&) = delete;

  // Connects, then waits for the reader's connection event.
  util::Status Open();

  // Sends `request` and waits for the response carrying its message id. A
  // non-success LLRPStatus in the response is returned as a kProtocol error.
  util::Result<codec::Message> Transact(const codec::Message& request);
  util::Result<codec::Message> Transact(const codec::Message& request, std::chrono::milliseconds timeout);

  // Fire-and-forget write.
  util::Status Send(const codec::Message& message);

  // Abandons the pending command; the socket stays open.
  bool Cancel(std::uint32_t message_id);

  // Two-phase shutdown: CLOSE_CONNECTION, a bounded wait for the response
  // or EOF, then the transport is closed regardless.
  util::Status Close();

  model::SessionState        State() const;
  std::optional<util::Error> LastError() const;

  std::uint32_t NextMessageId();

  void SetKeepalivePeriod(std::chrono::milliseconds period);

  void AddReportObserver(ReportObserver observer);
  void AddEventObserver(EventObserver observer);
  void AddStateObserver(StateObserver observer);
  void AddMessageObserver(MessageObserver observer);

  lifecycle::RoSpecRegistry& rospecs() {
    return rospecs_;
  }

  lifecycle::AccessSpecRegistry& accessspecs() {
    return accessspecs_;
  }

  const SessionOptions& options() const {
    return options_;
  }

 private:
  util::Result<codec::Message> TransactUnchecked(const codec::Message& request, std::chrono::milliseconds timeout);
  util::Status                 Write(const codec::Message& message);

  void ReceiveLoop();
  void HandleMessage(codec::Message message);
  void Publish(codec::Message message);
  void ApplyNotification(const model::ReaderEventNotificationData& data);
  void RecordAccessResults(const codec::RoAccessReport& report);
  void CheckKeepalive();
  void OnTransportFailure(const util::Error& error);

  bool Transition(model::SessionState to);
  void EnterError(const util::Error& error);
  void Shutdown();

  std::unique_ptr<transport::Transport> transport_;
  SessionOptions                        options_;
  codec::MessageCodec                   codec_;
  codec::ByteStream                     stream_;  // receive thread only

  PendingRequests             pending_;
  std::shared_ptr<EventQueue> events_;
  EventDispatcher             dispatcher_;

  lifecycle::RoSpecRegistry     rospecs_;
  lifecycle::AccessSpecRegistry accessspecs_;

  mutable std::mutex           state_mutex_;
  std::condition_variable      state_cv_;
  model::SessionState          state_ = model::SessionState::kConnecting;
  std::optional<util::Error>   last_error_;
  std::optional<std::uint16_t> connection_status_;

  std::mutex write_mutex_;

  std::atomic<std::uint32_t> next_message_id_{1};
  std::atomic<std::int64_t>  keepalive_period_ms_{0};
  std::atomic<std::int64_t>  last_keepalive_ns_{0};  // steady clock

  std::atomic<bool> receiving_{false};
  std::thread       receiver_;
};

} // namespace llrp::session
