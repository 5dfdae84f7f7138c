#include "client/cpp/reader_client.h"

#include <chrono>
#include <string>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace llrp::engine::client {

namespace {

util::Error UnexpectedBody(const codec::Message& message) {
  return {util::ErrorClass::kCodec, static_cast<std::int32_t>(util::CodecErrorCode::kSchemaMismatch),
          std::string("unexpected response body for ") + codec::MessageTypeName(message.type)};
}

template <typename Body>
util::Result<Body> ExpectBody(const util::Result<codec::Message>& response) {
  if (!response) {
    return response.error();
  }
  if (const auto* body = std::get_if<Body>(&response.value().body)) {
    return *body;
  }
  return UnexpectedBody(response.value());
}

codec::MessageType RoSpecMessageType(model::RoSpecCommand command) {
  switch (command) {
    case model::RoSpecCommand::kEnable: return codec::MessageType::kEnableRoSpec;
    case model::RoSpecCommand::kStart: return codec::MessageType::kStartRoSpec;
    case model::RoSpecCommand::kStop: return codec::MessageType::kStopRoSpec;
    case model::RoSpecCommand::kDisable: return codec::MessageType::kDisableRoSpec;
    case model::RoSpecCommand::kDelete: return codec::MessageType::kDeleteRoSpec;
  }
  return codec::MessageType::kDeleteRoSpec;
}

codec::MessageType AccessSpecMessageType(model::AccessSpecCommand command) {
  switch (command) {
    case model::AccessSpecCommand::kEnable: return codec::MessageType::kEnableAccessSpec;
    case model::AccessSpecCommand::kDisable: return codec::MessageType::kDisableAccessSpec;
    case model::AccessSpecCommand::kDelete: return codec::MessageType::kDeleteAccessSpec;
  }
  return codec::MessageType::kDeleteAccessSpec;
}

} // namespace

ReaderClient::ReaderClient(std::shared_ptr<session::Session> session) : session_(std::move(session)) {
}

util::Status ReaderClient::Connect() {
  return session_->Open();
}

util::Status ReaderClient::Close() {
  return session_->Close();
}

util::Result<codec::Message> ReaderClient::Transact(codec::MessageType type, codec::MessageBody body) {
  return session_->Transact(codec::MakeMessage(type, session_->NextMessageId(), std::move(body)));
}

// ------------------------------------------------------------
// Capabilities and configuration
// ------------------------------------------------------------

util::Result<std::shared_ptr<const model::ReaderCapabilities>> ReaderClient::GetReaderCapabilities(
    model::CapabilitiesRequest requested) {
  codec::GetReaderCapabilities request;
  request.requested = requested;

  auto response = ExpectBody<codec::GetReaderCapabilitiesResponse>(
      Transact(codec::MessageType::kGetReaderCapabilities, std::move(request)));
  if (!response) {
    return response.error();
  }

  auto capabilities = std::make_shared<const model::ReaderCapabilities>(std::move(response.value().capabilities));
  if (requested == model::CapabilitiesRequest::kAll) {
    std::lock_guard lock(cache_mutex_);
    capabilities_ = capabilities;
  }
  return capabilities;
}

util::Result<model::ReaderConfig> ReaderClient::GetReaderConfig(model::ConfigRequest requested,
                                                                std::uint16_t antenna_id, std::uint16_t gpi_port,
                                                                std::uint16_t gpo_port) {
  codec::GetReaderConfig request;
  request.requested  = requested;
  request.antenna_id = antenna_id;
  request.gpi_port   = gpi_port;
  request.gpo_port   = gpo_port;

  auto response =
      ExpectBody<codec::GetReaderConfigResponse>(Transact(codec::MessageType::kGetReaderConfig, std::move(request)));
  if (!response) {
    return response.error();
  }

  {
    std::lock_guard lock(cache_mutex_);
    model::MergeReaderConfig(&config_, response.value().config);
  }
  return std::move(response.value().config);
}

util::Status ReaderClient::SetReaderConfig(const model::ReaderConfig& partial, bool reset_to_factory_default) {
  codec::SetReaderConfig request;
  request.reset_to_factory_default = reset_to_factory_default;
  if (reset_to_factory_default) {
    if (partial != model::ReaderConfig{}) {
      LLRP_LOG_WARN("factory reset supersedes the other configuration groups");
    }
  } else {
    request.config = partial;
  }

  auto response = Transact(codec::MessageType::kSetReaderConfig, std::move(request));
  if (!response) {
    return response.error();
  }

  {
    std::lock_guard lock(cache_mutex_);
    if (reset_to_factory_default) {
      config_ = model::ReaderConfig{};
    } else {
      model::MergeReaderConfig(&config_, partial);
    }
  }

  if (reset_to_factory_default) {
    session_->SetKeepalivePeriod(std::chrono::milliseconds(0));
  } else if (partial.keepalive_spec) {
    const auto& keepalive = *partial.keepalive_spec;
    session_->SetKeepalivePeriod(std::chrono::milliseconds(
        keepalive.trigger == model::KeepaliveTriggerType::kPeriodic ? keepalive.period_ms : 0));
  }
  return util::OkStatus();
}

std::shared_ptr<const model::ReaderCapabilities> ReaderClient::capabilities() const {
  std::lock_guard lock(cache_mutex_);
  return capabilities_;
}

model::ReaderConfig ReaderClient::cached_config() const {
  std::lock_guard lock(cache_mutex_);
  return config_;
}

// ------------------------------------------------------------
// ROSpecs
// ------------------------------------------------------------

util::Status ReaderClient::AddROSpec(const model::RoSpec& rospec) {
  auto& registry = session_->rospecs();

  auto check = registry.CheckAdd(rospec);
  if (!check) {
    return check.ToError();
  }

  auto response = Transact(codec::MessageType::kAddRoSpec, codec::AddRoSpec{rospec});
  if (!response) {
    return response.error();
  }

  auto applied = registry.Add(rospec);
  if (!applied) {
    return applied.ToError();
  }
  return util::OkStatus();
}

util::Status ReaderClient::RoSpecCommand(model::RoSpecCommand command, std::uint32_t rospec_id) {
  auto& registry = session_->rospecs();

  auto check = registry.Begin(command, rospec_id);
  if (!check) {
    return check.ToError();
  }

  auto response = Transact(RoSpecMessageType(command), codec::RoSpecIdRequest{rospec_id});
  if (!response) {
    registry.Abandon(rospec_id);
    return response.error();
  }

  auto applied = registry.Confirm(command, rospec_id);
  if (!applied) {
    return applied.ToError();
  }
  return util::OkStatus();
}

util::Status ReaderClient::EnableROSpec(std::uint32_t rospec_id) {
  return RoSpecCommand(model::RoSpecCommand::kEnable, rospec_id);
}

util::Status ReaderClient::StartROSpec(std::uint32_t rospec_id) {
  return RoSpecCommand(model::RoSpecCommand::kStart, rospec_id);
}

util::Status ReaderClient::StopROSpec(std::uint32_t rospec_id) {
  return RoSpecCommand(model::RoSpecCommand::kStop, rospec_id);
}

util::Status ReaderClient::DisableROSpec(std::uint32_t rospec_id) {
  return RoSpecCommand(model::RoSpecCommand::kDisable, rospec_id);
}

util::Status ReaderClient::DeleteROSpec(std::uint32_t rospec_id) {
  return RoSpecCommand(model::RoSpecCommand::kDelete, rospec_id);
}

util::Result<std::vector<model::RoSpec>> ReaderClient::GetROSpecs() {
  auto response =
      ExpectBody<codec::GetRoSpecsResponse>(Transact(codec::MessageType::kGetRoSpecs, codec::EmptyBody{}));
  if (!response) {
    return response.error();
  }

  auto synced = session_->rospecs().ReplaceAll(response.value().rospecs);
  if (!synced) {
    return synced.ToError();
  }
  return std::move(response.value().rospecs);
}

// ------------------------------------------------------------
// AccessSpecs
// ------------------------------------------------------------

util::Status ReaderClient::AddAccessSpec(const model::AccessSpec& accessspec) {
  auto& registry = session_->accessspecs();

  auto check = registry.CheckAdd(accessspec);
  if (!check) {
    return check.ToError();
  }

  auto response = Transact(codec::MessageType::kAddAccessSpec, codec::AddAccessSpec{accessspec});
  if (!response) {
    return response.error();
  }

  auto applied = registry.Add(accessspec);
  if (!applied) {
    return applied.ToError();
  }
  return util::OkStatus();
}

util::Status ReaderClient::AccessSpecCommand(model::AccessSpecCommand command, std::uint32_t accessspec_id) {
  auto& registry = session_->accessspecs();

  auto check = registry.Check(command, accessspec_id);
  if (!check) {
    return check.ToError();
  }

  auto response = Transact(AccessSpecMessageType(command), codec::AccessSpecIdRequest{accessspec_id});
  if (!response) {
    return response.error();
  }

  auto applied = registry.Apply(command, accessspec_id);
  if (!applied) {
    return applied.ToError();
  }
  return util::OkStatus();
}

util::Status ReaderClient::EnableAccessSpec(std::uint32_t accessspec_id) {
  return AccessSpecCommand(model::AccessSpecCommand::kEnable, accessspec_id);
}

util::Status ReaderClient::DisableAccessSpec(std::uint32_t accessspec_id) {
  return AccessSpecCommand(model::AccessSpecCommand::kDisable, accessspec_id);
}

util::Status ReaderClient::DeleteAccessSpec(std::uint32_t accessspec_id) {
  return AccessSpecCommand(model::AccessSpecCommand::kDelete, accessspec_id);
}

util::Result<std::vector<model::AccessSpec>> ReaderClient::GetAccessSpecs() {
  auto response =
      ExpectBody<codec::GetAccessSpecsResponse>(Transact(codec::MessageType::kGetAccessSpecs, codec::EmptyBody{}));
  if (!response) {
    return response.error();
  }

  auto synced = session_->accessspecs().ReplaceAll(response.value().accessspecs);
  if (!synced) {
    return synced.ToError();
  }
  return std::move(response.value().accessspecs);
}

// ------------------------------------------------------------
// Reports and vendor extensions
// ------------------------------------------------------------

util::Status ReaderClient::GetReport() {
  return session_->Send(codec::MakeMessage(codec::MessageType::kGetReport, session_->NextMessageId()));
}

util::Status ReaderClient::EnableEventsAndReports() {
  return session_->Send(codec::MakeMessage(codec::MessageType::kEnableEventsAndReports, session_->NextMessageId()));
}

util::Result<codec::CustomMessage> ReaderClient::SendCustomMessage(std::uint32_t vendor_id, std::uint8_t subtype,
                                                                   const util::Bytes& data) {
  return ExpectBody<codec::CustomMessage>(
      Transact(codec::MessageType::kCustomMessage, codec::CustomMessage{vendor_id, subtype, data}));
}

util::Status ReaderClient::ScrubConfiguration() {
  if (auto status = DeleteAccessSpec(0); !status) {
    return status;
  }
  if (auto status = DeleteROSpec(0); !status) {
    return status;
  }
  return SetReaderConfig(model::ReaderConfig{}, true);
}

} // namespace llrp::engine::client
