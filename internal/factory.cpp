#include "factory.hpp"

#include <memory>
#include <optional>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/transport/tcp_transport.hpp"

namespace llrp::factory {

std::shared_ptr<session::Session> BuildSession(const llrp::runtime::config::RuntimeConfig& config) {
  auto settings = config::ResolveReaderSettings(config);

  LLRP_LOG_INFO("building session",
                {observability::StringField("host", settings.endpoint.host),
                 observability::IntField("port", settings.endpoint.port),
                 observability::IntField("keepalive_ms", settings.session.keepalive_period.count())});

  auto transport = std::make_unique<transport::TcpTransport>(settings.endpoint);
  return std::make_shared<session::Session>(std::move(transport), settings.session);
}

model::RoSpec BuildInventoryRoSpec(const llrp::runtime::config::InventoryConfig& inventory,
                                   const model::ReaderCapabilities*              capabilities) {
  model::RoSpec rospec;
  rospec.id       = inventory.rospec_id() ? inventory.rospec_id() : 1;
  rospec.priority = static_cast<std::uint8_t>(inventory.priority());

  rospec.boundary.start_trigger.type = model::StartTriggerType::kNull;
  rospec.boundary.stop_trigger.type  = model::StopTriggerType::kNull;

  model::AiSpec ai;
  for (auto antenna : inventory.antennas()) {
    ai.antenna_ids.push_back(static_cast<std::uint16_t>(antenna));
  }
  if (ai.antenna_ids.empty()) {
    ai.antenna_ids.push_back(0);
  }

  if (inventory.duration_ms()) {
    ai.stop_trigger.type        = model::AiSpecStopTriggerType::kDuration;
    ai.stop_trigger.duration_ms = inventory.duration_ms();
  }

  model::C1G2InventoryCommand command;
  if (inventory.mode_index()) {
    command.rf_control = model::C1G2RfControl{static_cast<std::uint16_t>(inventory.mode_index()), 0};
  }
  model::C1G2SingulationControl singulation;
  singulation.session        = static_cast<std::uint8_t>(inventory.session() & 0x3);
  singulation.tag_population = static_cast<std::uint16_t>(inventory.tag_population());
  command.singulation_control  = singulation;

  std::optional<std::uint16_t> power_index;
  if (inventory.transmit_power_dbm() > 0 && capabilities) {
    power_index = capabilities->TransmitPowerIndexFor(inventory.transmit_power_dbm());
    if (!power_index) {
      LLRP_LOG_WARN("requested transmit power below the reader's table; using reader default",
                    {observability::IntField("dbm", static_cast<std::int64_t>(inventory.transmit_power_dbm()))});
    }
  }

  model::InventoryParameterSpec spec;
  spec.spec_id = 1;
  for (auto antenna : ai.antenna_ids) {
    model::AntennaConfiguration antenna_config;
    antenna_config.antenna_id = antenna;
    if (power_index) {
      antenna_config.rf_transmitter = model::RfTransmitter{1, 1, *power_index};
    }
    antenna_config.inventory_commands.push_back(command);
    spec.antenna_configurations.push_back(std::move(antenna_config));
  }
  ai.inventory_parameter_specs.push_back(std::move(spec));
  rospec.specs.push_back(std::move(ai));

  model::RoReportSpec report;
  report.trigger = model::RoReportTrigger::kUponNTagsOrEndOfAiSpec;
  report.n       = static_cast<std::uint16_t>(inventory.report_every_n_tags() ? inventory.report_every_n_tags() : 1);

  auto& content                       = report.content_selector;
  content.enable_rospec_id            = true;
  content.enable_antenna_id           = true;
  content.enable_peak_rssi            = inventory.include_peak_rssi();
  content.enable_first_seen_timestamp = inventory.include_first_seen();
  content.enable_last_seen_timestamp  = inventory.include_last_seen();
  content.enable_tag_seen_count       = inventory.include_seen_count();
  rospec.report_spec                  = std::move(report);

  return rospec;
}

model::ReaderConfig BuildSessionReaderConfig(const llrp::runtime::config::RuntimeConfig& config) {
  model::ReaderConfig reader_config;

  model::KeepaliveSpec keepalive;
  if (config.keepalive().period_ms()) {
    keepalive.trigger   = model::KeepaliveTriggerType::kPeriodic;
    keepalive.period_ms = config.keepalive().period_ms();
  }
  reader_config.keepalive_spec = keepalive;

  model::ReaderEventNotificationSpec events;
  for (auto type : {model::ReaderEventType::kRoSpec, model::ReaderEventType::kAiSpec, model::ReaderEventType::kGpi,
                    model::ReaderEventType::kReaderException, model::ReaderEventType::kReportBufferFillWarning,
                    model::ReaderEventType::kAntenna}) {
    events.states.push_back(model::EventNotificationState{static_cast<std::uint16_t>(type), true});
  }
  reader_config.event_notification_spec = std::move(events);

  return reader_config;
}

} // namespace llrp::factory
