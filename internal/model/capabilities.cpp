#include "capabilities.hpp"

#include <algorithm>
#include <cmath>

namespace llrp::model {

std::uint16_t ReaderCapabilities::MaxAntennas() const {
  return general ? general->max_antennas : 0;
}

bool ReaderCapabilities::SupportsAirProtocol(std::uint8_t protocol_id,
                                             std::uint16_t antenna_id) const {
  if (!general) {
    return false;
  }
  for (const auto& entry : general->air_protocols) {
    if (antenna_id != 0 && entry.antenna_id != antenna_id) {
      continue;
    }
    const auto& ids = entry.protocol_ids;
    if (std::find(ids.begin(), ids.end(), protocol_id) != ids.end()) {
      return true;
    }
  }
  return false;
}

std::optional<std::uint16_t> ReaderCapabilities::TransmitPowerIndexFor(double dbm) const {
  if (!regulatory || !regulatory->uhf_band) {
    return std::nullopt;
  }

  const auto limit = static_cast<long>(std::lround(dbm * 100.0));

  std::optional<std::uint16_t> best;
  std::int16_t                 best_power = 0;
  for (const auto& entry : regulatory->uhf_band->transmit_power_table) {
    if (entry.power > limit) {
      continue;
    }
    if (!best || entry.power > best_power) {
      best       = entry.index;
      best_power = entry.power;
    }
  }
  return best;
}

} // namespace llrp::model
