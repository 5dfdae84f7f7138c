#include "reader_config.hpp"

#include <algorithm>

namespace llrp::model {

namespace {

template <typename T, typename Key>
void MergeByKey(std::vector<T>* dst, const std::vector<T>& src, Key key) {
  for (const auto& entry : src) {
    auto it = std::find_if(dst->begin(), dst->end(),
                           [&](const T& existing) { return key(existing) == key(entry); });
    if (it == dst->end()) {
      dst->push_back(entry);
    } else {
      *it = entry;
    }
  }
}

template <typename T>
void MergeOptional(std::optional<T>* dst, const std::optional<T>& src) {
  if (src) {
    *dst = src;
  }
}

} // namespace

void MergeReaderConfig(ReaderConfig* dst, const ReaderConfig& partial) {
  MergeOptional(&dst->identification, partial.identification);

  MergeByKey(&dst->antenna_properties, partial.antenna_properties,
             [](const AntennaProperties& p) { return p.antenna_id; });

  // Antenna id 0 addresses every antenna, so it overwrites all entries.
  for (const auto& cfg : partial.antenna_configurations) {
    if (cfg.antenna_id == 0) {
      for (auto& existing : dst->antenna_configurations) {
        auto id  = existing.antenna_id;
        existing = cfg;
        existing.antenna_id = id;
      }
    }
  }
  std::vector<AntennaConfiguration> addressed;
  for (const auto& cfg : partial.antenna_configurations) {
    if (cfg.antenna_id != 0) {
      addressed.push_back(cfg);
    }
  }
  MergeByKey(&dst->antenna_configurations, addressed,
             [](const AntennaConfiguration& c) { return c.antenna_id; });

  if (partial.event_notification_spec) {
    if (!dst->event_notification_spec) {
      dst->event_notification_spec = partial.event_notification_spec;
    } else {
      MergeByKey(&dst->event_notification_spec->states, partial.event_notification_spec->states,
                 [](const EventNotificationState& s) { return s.event_type; });
    }
  }

  MergeOptional(&dst->ro_report_spec, partial.ro_report_spec);
  MergeOptional(&dst->access_report_spec, partial.access_report_spec);
  MergeOptional(&dst->configuration_state, partial.configuration_state);
  MergeOptional(&dst->keepalive_spec, partial.keepalive_spec);

  MergeByKey(&dst->gpi_port_states, partial.gpi_port_states,
             [](const GpiPortCurrentState& s) { return s.port; });
  MergeByKey(&dst->gpo_write_data, partial.gpo_write_data,
             [](const GpoWriteData& d) { return d.port; });

  MergeOptional(&dst->events_and_reports, partial.events_and_reports);

  MergeByKey(&dst->custom, partial.custom, [](const CustomParameter& c) {
    return (static_cast<std::uint64_t>(c.vendor_id) << 32) | c.subtype;
  });
}

} // namespace llrp::model
