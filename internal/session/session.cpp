#include "session.hpp"

#include <string>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace llrp::session {
namespace {

using std::chrono::milliseconds;

constexpr std::size_t kReadChunk = 64 * 1024;

std::int64_t NowNs() {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(util::SteadyNow().time_since_epoch()).count();
}

util::Error NotOperational(model::SessionState state) {
  return util::TransportFailure(util::TransportCode::kNotConnected,
                                std::string("session is ") + model::SessionStateName(state));
}

} // namespace

Session::Session(std::unique_ptr<transport::Transport> transport, SessionOptions options)
    : transport_(std::move(transport)),
      options_(options),
      codec_(options.max_frame_bytes),
      events_(std::make_shared<EventQueue>(options.event_capacity)),
      dispatcher_(events_, options.reader_label),
      keepalive_period_ms_(options.keepalive_period.count()) {
}

Session::~Session() {
  Shutdown();
}

// ------------------------------------------------------------
// State
// ------------------------------------------------------------

model::SessionState Session::State() const {
  std::lock_guard lock(state_mutex_);
  return state_;
}

std::optional<util::Error> Session::LastError() const {
  std::lock_guard lock(state_mutex_);
  return last_error_;
}

bool Session::Transition(model::SessionState to) {
  model::SessionState from;
  {
    std::lock_guard lock(state_mutex_);
    from = state_;
    if (!model::CanTransition(from, to)) {
      return false;
    }
    state_ = to;
  }
  state_cv_.notify_all();

  LLRP_LOG_INFO("session state",
                {observability::StringField("from", model::SessionStateName(from)),
                 observability::StringField("to", model::SessionStateName(to))});
  events_->Enqueue(StateChange{from, to});
  return true;
}

void Session::EnterError(const util::Error& error) {
  {
    std::lock_guard lock(state_mutex_);
    if (state_ == model::SessionState::kError || model::IsTerminal(state_)) {
      return;
    }
    last_error_ = error;
  }

  LLRP_LOG_ERROR("session failed",
                 {observability::StringField("class", util::ErrorClassName(error.error_class)),
                  observability::IntField("code", error.code), observability::StringField("error", error.message)});

  receiving_ = false;
  Transition(model::SessionState::kError);
  pending_.FailAll(error);
}

std::uint32_t Session::NextMessageId() {
  return next_message_id_.fetch_add(1);
}

void Session::SetKeepalivePeriod(milliseconds period) {
  last_keepalive_ns_   = NowNs();
  keepalive_period_ms_ = period.count();
}

void Session::AddReportObserver(ReportObserver observer) {
  dispatcher_.AddReportObserver(std::move(observer));
}

void Session::AddEventObserver(EventObserver observer) {
  dispatcher_.AddEventObserver(std::move(observer));
}

void Session::AddStateObserver(StateObserver observer) {
  dispatcher_.AddStateObserver(std::move(observer));
}

void Session::AddMessageObserver(MessageObserver observer) {
  dispatcher_.AddMessageObserver(std::move(observer));
}

// ------------------------------------------------------------
// Open / Close
// ------------------------------------------------------------

util::Status Session::Open() {
  observability::ReaderLogScope scope(options_.reader_label);
  if (State() != model::SessionState::kConnecting || transport_->IsOpen()) {
    return util::TransportFailure(util::TransportCode::kNotConnected, "session was already opened");
  }

  try {
    transport_->Connect();
  } catch (const std::exception& e) {
    auto error = util::ToError(e);
    EnterError(error);
    return error;
  }

  Transition(model::SessionState::kConnected);
  dispatcher_.Start();
  receiving_ = true;
  receiver_  = std::thread(&Session::ReceiveLoop, this);

  std::optional<std::uint16_t> status;
  {
    std::unique_lock lock(state_mutex_);
    state_cv_.wait_for(lock, options_.connect_timeout, [&] {
      return connection_status_.has_value() || state_ != model::SessionState::kConnected;
    });
    if (state_ == model::SessionState::kError && last_error_) {
      return *last_error_;
    }
    status = connection_status_;
  }

  if (!status) {
    auto error = util::TransportFailure(util::TransportCode::kTimeout, "reader sent no connection event");
    EnterError(error);
    return error;
  }
  if (*status != 0) {
    util::Error error{util::ErrorClass::kProtocol, *status,
                      "reader refused the connection (attempt status " + std::to_string(*status) + ")"};
    EnterError(error);
    return error;
  }

  last_keepalive_ns_ = NowNs();
  if (!Transition(model::SessionState::kOperational)) {
    auto error = LastError();
    return error ? *error : NotOperational(State());
  }
  return util::OkStatus();
}

util::Status Session::Close() {
  observability::ReaderLogScope scope(options_.reader_label);
  auto state = State();
  if (state == model::SessionState::kClosed) {
    return util::OkStatus();
  }

  util::Status result = util::OkStatus();
  if (state == model::SessionState::kConnected || state == model::SessionState::kOperational) {
    Transition(model::SessionState::kClosing);

    auto request  = codec::MakeMessage(codec::MessageType::kCloseConnection, NextMessageId());
    auto response = TransactUnchecked(request, options_.close_timeout);
    if (!response) {
      if (response.error_class() == util::ErrorClass::kProtocol) {
        result = response.error();
      } else {
        LLRP_LOG_INFO("close not acknowledged, forcing", {observability::StringField("reason", response.error().message)});
      }
    }
  }

  Shutdown();
  return result;
}

void Session::Shutdown() {
  receiving_ = false;
  if (receiver_.joinable()) {
    receiver_.join();
  }
  transport_->Close();

  pending_.FailAll(util::TransportFailure(util::TransportCode::kClosed, "session closed"));
  Transition(model::SessionState::kClosed);
  dispatcher_.Stop();
}

// ------------------------------------------------------------
// Commands
// ------------------------------------------------------------

util::Result<codec::Message> Session::Transact(const codec::Message& request) {
  return Transact(request, options_.command_timeout);
}

util::Result<codec::Message> Session::Transact(const codec::Message& request, milliseconds timeout) {
  auto state = State();
  if (state != model::SessionState::kOperational) {
    return NotOperational(state);
  }
  return TransactUnchecked(request, timeout);
}

util::Result<codec::Message> Session::TransactUnchecked(const codec::Message& request, milliseconds timeout) {
  observability::ReaderLogScope scope(options_.reader_label);
  auto expected = codec::ResponseTypeFor(request.type);
  if (!expected) {
    return util::Error{util::ErrorClass::kCodec, static_cast<std::int32_t>(util::CodecErrorCode::kSchemaMismatch),
                       std::string(codec::MessageTypeName(request.type)) + " has no response"};
  }

  if (!pending_.Insert(request.message_id, *expected)) {
    return util::TransportFailure(util::TransportCode::kDuplicateMessageId,
                                  "message id " + std::to_string(request.message_id) + " is already pending");
  }

  // EnterError may have failed the table between the state check and Insert.
  const auto state = State();
  if (state == model::SessionState::kError || state == model::SessionState::kClosed) {
    pending_.Remove(request.message_id);
    auto error = LastError();
    return error ? *error : NotOperational(state);
  }

  auto sent = Write(request);
  if (!sent) {
    pending_.Remove(request.message_id);
    return sent.error();
  }

  auto response = pending_.Wait(request.message_id, timeout);
  if (!response) {
    LLRP_LOG_WARN("command failed",
                  {observability::StringField("message", codec::MessageTypeName(request.type)),
                   observability::IntField("message_id", request.message_id),
                   observability::StringField("error", response.error().message)});
    return response;
  }

  auto status = codec::StatusOf(response.value());
  if (status && !status->ok()) {
    LLRP_LOG_WARN("reader returned error status",
                  {observability::StringField("message", codec::MessageTypeName(request.type)),
                   observability::IntField("message_id", request.message_id),
                   observability::StringField("status", model::StatusCodeName(status->code)),
                   observability::StringField("description", status->error_description)});
    return util::Error{util::ErrorClass::kProtocol, static_cast<std::int32_t>(status->code),
                       std::string(model::StatusCodeName(status->code)) + ": " + status->error_description};
  }
  return response;
}

util::Status Session::Send(const codec::Message& message) {
  observability::ReaderLogScope scope(options_.reader_label);
  auto state = State();
  if (state != model::SessionState::kOperational) {
    return NotOperational(state);
  }
  return Write(message);
}

bool Session::Cancel(std::uint32_t message_id) {
  return pending_.Cancel(message_id);
}

util::Status Session::Write(const codec::Message& message) {
  util::Bytes frame;
  try {
    frame = codec_.Encode(message);
  } catch (const std::exception& e) {
    return util::ToError(e);
  }

  try {
    std::lock_guard lock(write_mutex_);
    transport_->Write(frame.data(), frame.size());
  } catch (const std::exception& e) {
    auto error = util::ToError(e);
    EnterError(error);
    return error;
  }

  LLRP_LOG_DEBUG("message sent", {observability::StringField("message", codec::DescribeMessage(message))});
  return util::OkStatus();
}

// ------------------------------------------------------------
// Receive path
// ------------------------------------------------------------

void Session::ReceiveLoop() {
  observability::ReaderLogScope scope(options_.reader_label);
  std::vector<std::uint8_t> buffer(kReadChunk);

  while (receiving_) {
    std::size_t n = 0;
    try {
      n = transport_->Read(buffer.data(), buffer.size(), options_.poll_interval);
    } catch (const std::exception& e) {
      OnTransportFailure(util::ToError(e));
      return;
    }

    if (n > 0) {
      stream_.Append(buffer.data(), n);
      try {
        while (receiving_) {
          auto message = codec_.Decode(stream_);
          if (!message) {
            break;
          }
          HandleMessage(std::move(*message));
        }
      } catch (const util::CodecError& e) {
        stream_.Clear();
        EnterError(util::ToError(e));
        return;
      }
    }

    CheckKeepalive();
  }
}

void Session::OnTransportFailure(const util::Error& error) {
  if (State() == model::SessionState::kClosing) {
    // EOF while closing completes the close handshake.
    receiving_ = false;
    pending_.FailAll(util::TransportFailure(util::TransportCode::kConnectionLost, error.message));
    return;
  }
  EnterError(error);
}

void Session::CheckKeepalive() {
  const std::int64_t period_ms = keepalive_period_ms_.load();
  if (period_ms <= 0 || State() != model::SessionState::kOperational) {
    return;
  }

  const std::int64_t limit_ms   = period_ms + options_.keepalive_grace.count();
  const std::int64_t elapsed_ms = (NowNs() - last_keepalive_ns_.load()) / 1000000;
  if (elapsed_ms > limit_ms) {
    EnterError(util::TransportFailure(util::TransportCode::kConnectionLost,
                                      "no keepalive for " + std::to_string(elapsed_ms) + "ms (limit " +
                                          std::to_string(limit_ms) + "ms)"));
  }
}

void Session::HandleMessage(codec::Message message) {
  LLRP_LOG_DEBUG("message received", {observability::StringField("message", codec::DescribeMessage(message))});

  if (message.type == codec::MessageType::kKeepalive) {
    last_keepalive_ns_ = NowNs();
    auto ack           = Write(codec::MakeMessage(codec::MessageType::kKeepaliveAck, message.message_id));
    if (!ack) {
      LLRP_LOG_WARN("keepalive ack failed", {observability::StringField("error", ack.error().message)});
    }
    Publish(std::move(message));
    return;
  }

  if (pending_.Resolve(message)) {
    return;
  }

  if (const auto* notification = std::get_if<codec::ReaderEventNotification>(&message.body)) {
    ApplyNotification(notification->data);
  } else if (const auto* report = std::get_if<codec::RoAccessReport>(&message.body)) {
    RecordAccessResults(*report);
  } else if (message.type == codec::MessageType::kErrorMessage) {
    auto status = codec::StatusOf(message);
    LLRP_LOG_WARN("reader error message",
                  {observability::IntField("message_id", message.message_id),
                   observability::StringField("status", status ? model::StatusCodeName(status->code) : "none"),
                   observability::StringField("description", status ? status->error_description : "")});
  }

  Publish(std::move(message));
}

void Session::Publish(codec::Message message) {
  const auto type = message.type;
  if (!events_->Enqueue(std::move(message))) {
    LLRP_LOG_WARN("observer queue full, message dropped",
                  {observability::StringField("type", codec::MessageTypeName(type)),
                   observability::IntField("dropped", static_cast<std::int64_t>(events_->dropped()))});
  }
}

void Session::ApplyNotification(const model::ReaderEventNotificationData& data) {
  {
    std::lock_guard lock(state_mutex_);
    if (state_ == model::SessionState::kConnected && !connection_status_) {
      connection_status_ = data.connection_attempt ? data.connection_attempt->status : 0;
    }
  }
  state_cv_.notify_all();

  if (data.rospec) {
    auto result = rospecs_.ApplyRoSpecEvent(*data.rospec);
    if (!result) {
      LLRP_LOG_DEBUG("rospec event not applied", {observability::StringField("reason", result.message)});
    }
  }

  if (data.gpi) {
    auto changed = rospecs_.OnGpiEvent(data.gpi->gpi_port, data.gpi->level);
    for (auto id : changed) {
      LLRP_LOG_DEBUG("gpi trigger fired",
                     {observability::IntField("rospec_id", id), observability::IntField("port", data.gpi->gpi_port)});
    }
  }

  if (data.buffer_level_warning) {
    LLRP_LOG_WARN("reader report buffer filling",
                  {observability::IntField("percent_full", data.buffer_level_warning->percentage_full)});
  }
  if (data.buffer_overflow) {
    LLRP_LOG_WARN("reader report buffer overflowed");
  }
  if (data.reader_exception) {
    LLRP_LOG_WARN("reader exception", {observability::StringField("message", data.reader_exception->message)});
  }
  if (data.connection_close) {
    LLRP_LOG_INFO("reader is closing the connection");
  }
}

void Session::RecordAccessResults(const codec::RoAccessReport& report) {
  for (const auto& tag : report.tag_reports) {
    if (!tag.access_spec_id || tag.op_spec_results.empty()) {
      continue;
    }
    const auto spec = accessspecs_.Get(*tag.access_spec_id);
    if (!spec) {
      continue;
    }

    lifecycle::ExecutionRecord record;
    auto result =
        accessspecs_.RecordExecution(*tag.access_spec_id, tag.op_spec_results, spec->continue_on_failure, &record);
    if (result && !record.Succeeded()) {
      LLRP_LOG_INFO("access operation failed", {observability::IntField("accessspec_id", *tag.access_spec_id)});
    }
  }
}

} // namespace llrp::session
