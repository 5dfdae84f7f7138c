#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "llrp/engine/v1.hpp"

namespace llrp::engine::client {

/*
  ReaderClient

  Typed LLRP command API over a Session. Lifecycle commands are checked
  against the local registry before they are sent and applied to it only
  after the reader answers with a success status, so a rejected command
  never changes local state.
*/
class ReaderClient {
 public:
  explicit ReaderClient(std::shared_ptr<session::Session> session);

  util::Status Connect();

  util::Status Close();

  // ------------------------------------------------------------
  // Capabilities and configuration
  // ------------------------------------------------------------

  util::Result<std::shared_ptr<const model::ReaderCapabilities>> GetReaderCapabilities(
      model::CapabilitiesRequest requested = model::CapabilitiesRequest::kAll);

  util::Result<model::ReaderConfig> GetReaderConfig(model::ConfigRequest requested = model::ConfigRequest::kAll,
                                                    std::uint16_t antenna_id = 0, std::uint16_t gpi_port = 0,
                                                    std::uint16_t gpo_port = 0);

  // Applies only the groups present in `partial`. With
  // `reset_to_factory_default` the reader restores its defaults and the
  // other groups are not sent.
  util::Status SetReaderConfig(const model::ReaderConfig& partial, bool reset_to_factory_default = false);

  std::shared_ptr<const model::ReaderCapabilities> capabilities() const;
  model::ReaderConfig                              cached_config() const;

  // ------------------------------------------------------------
  // ROSpecs
  // ------------------------------------------------------------

  util::Status AddROSpec(const model::RoSpec& rospec);
  util::Status EnableROSpec(std::uint32_t rospec_id);
  util::Status StartROSpec(std::uint32_t rospec_id);
  util::Status StopROSpec(std::uint32_t rospec_id);
  util::Status DisableROSpec(std::uint32_t rospec_id);
  util::Status DeleteROSpec(std::uint32_t rospec_id);  // 0 = all

  util::Result<std::vector<model::RoSpec>> GetROSpecs();

  // ------------------------------------------------------------
  // AccessSpecs
  // ------------------------------------------------------------

  util::Status AddAccessSpec(const model::AccessSpec& accessspec);
  util::Status EnableAccessSpec(std::uint32_t accessspec_id);
  util::Status DisableAccessSpec(std::uint32_t accessspec_id);
  util::Status DeleteAccessSpec(std::uint32_t accessspec_id);  // 0 = all

  util::Result<std::vector<model::AccessSpec>> GetAccessSpecs();

  // ------------------------------------------------------------
  // Reports and vendor extensions
  // ------------------------------------------------------------

  // Reports arrive through the session's report observers.
  util::Status GetReport();
  util::Status EnableEventsAndReports();

  util::Result<codec::CustomMessage> SendCustomMessage(std::uint32_t vendor_id, std::uint8_t subtype,
                                                       const util::Bytes& data);

  // Deletes every AccessSpec and ROSpec, then restores factory defaults.
  util::Status ScrubConfiguration();

  session::Session& session() {
    return *session_;
  }

 private:
  util::Result<codec::Message> Transact(codec::MessageType type, codec::MessageBody body);

  util::Status RoSpecCommand(model::RoSpecCommand command, std::uint32_t rospec_id);
  util::Status AccessSpecCommand(model::AccessSpecCommand command, std::uint32_t accessspec_id);

  std::shared_ptr<session::Session> session_;

  mutable std::mutex                               cache_mutex_;
  std::shared_ptr<const model::ReaderCapabilities> capabilities_;
  model::ReaderConfig                              config_;
};

} // namespace llrp::engine::client
