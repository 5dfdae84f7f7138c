#include "event_dispatcher.hpp"

#include "internal/observability/logging.hpp"

namespace llrp::session {
namespace {

template <typename Fn>
void Guarded(const char* kind, Fn&& fn) {
  try {
    fn();
  } catch (const std::exception& e) {
    LLRP_LOG_ERROR("observer failed",
                   {observability::StringField("kind", kind), observability::StringField("error", e.what())});
  }
}

} // namespace

EventDispatcher::EventDispatcher(std::shared_ptr<EventQueue> queue, std::string reader_label)
    : queue_(std::move(queue)), reader_label_(std::move(reader_label)) {
}

EventDispatcher::~EventDispatcher() {
  Stop();
}

void EventDispatcher::Start() {
  if (running_.exchange(true)) {
    return;
  }
  thread_ = std::thread(&EventDispatcher::Run, this);
}

void EventDispatcher::Stop() {
  queue_->Shutdown();
  running_ = false;
  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
    thread_.join();
  }
}

void EventDispatcher::AddReportObserver(ReportObserver observer) {
  std::lock_guard lock(observers_mutex_);
  report_observers_.push_back(std::move(observer));
}

void EventDispatcher::AddEventObserver(EventObserver observer) {
  std::lock_guard lock(observers_mutex_);
  event_observers_.push_back(std::move(observer));
}

void EventDispatcher::AddStateObserver(StateObserver observer) {
  std::lock_guard lock(observers_mutex_);
  state_observers_.push_back(std::move(observer));
}

void EventDispatcher::AddMessageObserver(MessageObserver observer) {
  std::lock_guard lock(observers_mutex_);
  message_observers_.push_back(std::move(observer));
}

void EventDispatcher::Run() {
  observability::ReaderLogScope scope(reader_label_);
  while (auto event = queue_->Dequeue()) {
    std::visit([this](const auto& e) { Deliver(e); }, *event);
  }
}

void EventDispatcher::Deliver(const codec::Message& message) {
  std::vector<MessageObserver> message_observers;
  std::vector<ReportObserver>  report_observers;
  std::vector<EventObserver>   event_observers;
  {
    std::lock_guard lock(observers_mutex_);
    message_observers = message_observers_;
    report_observers  = report_observers_;
    event_observers   = event_observers_;
  }

  for (const auto& observer : message_observers) {
    Guarded("message", [&] { observer(message); });
  }

  if (const auto* report = std::get_if<codec::RoAccessReport>(&message.body)) {
    for (const auto& tag : report->tag_reports) {
      for (const auto& observer : report_observers) {
        Guarded("report", [&] { observer(tag); });
      }
    }
  } else if (const auto* notification = std::get_if<codec::ReaderEventNotification>(&message.body)) {
    for (const auto& observer : event_observers) {
      Guarded("event", [&] { observer(notification->data); });
    }
  }
}

void EventDispatcher::Deliver(const StateChange& change) {
  std::vector<StateObserver> observers;
  {
    std::lock_guard lock(observers_mutex_);
    observers = state_observers_;
  }

  for (const auto& observer : observers) {
    Guarded("state", [&] { observer(change.from, change.to); });
  }
}

} // namespace llrp::session
