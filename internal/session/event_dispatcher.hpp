#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/model/events.hpp"
#include "internal/model/report.hpp"
#include "internal/session/event_queue.hpp"

namespace llrp::session {

using ReportObserver  = std::function<void(const model::TagReportData&)>;
using EventObserver   = std::function<void(const model::ReaderEventNotificationData&)>;
using StateObserver   = std::function<void(model::SessionState from, model::SessionState to)>;
using MessageObserver = std::function<void(const codec::Message&)>;

/*
  Background worker that delivers session events to observers.

  Runs observer callbacks off the receive path so a slow consumer never
  stalls keepalive handling. An observer that throws is logged and the
  remaining observers still run.
*/
class EventDispatcher {
 public:
  // reader_label tags log lines written on the dispatcher thread.
  explicit EventDispatcher(std::shared_ptr<EventQueue> queue, std::string reader_label = {});
  ~EventDispatcher();

  void Start();

  // Delivers everything already queued, then joins.
  void Stop();

  void AddReportObserver(ReportObserver observer);
  void AddEventObserver(EventObserver observer);
  void AddStateObserver(StateObserver observer);
  void AddMessageObserver(MessageObserver observer);

 private:
  void Run();
  void Deliver(const codec::Message& message);
  void Deliver(const StateChange& change);

  std::shared_ptr<EventQueue> queue_;
  std::string                 reader_label_;

  std::mutex                   observers_mutex_;
  std::vector<ReportObserver>  report_observers_;
  std::vector<EventObserver>   event_observers_;
  std::vector<StateObserver>   state_observers_;
  std::vector<MessageObserver> message_observers_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace llrp::session
