#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "internal/model/accessspec.hpp"
#include "internal/model/common.hpp"
#include "internal/model/events.hpp"

namespace llrp::model {

// Which EPC parameter carried the tag id on the wire.
enum class EpcFormat : std::uint8_t {
  kEpc96,    // TV 13, fixed 96 bits
  kEpcData,  // TLV 241, variable bit length
};

/*
  One tag observation.

  Every optional field is present only when the reader included the
  matching parameter. The decoder never fills in defaults.
*/
struct TagReportData {
  Bytes         epc;
  EpcFormat     epc_format    = EpcFormat::kEpc96;
  std::uint16_t epc_bit_count = 96;

  std::optional<std::uint32_t> rospec_id;
  std::optional<std::uint16_t> spec_index;
  std::optional<std::uint16_t> inventory_parameter_spec_id;
  std::optional<std::uint16_t> antenna_id;
  std::optional<std::int8_t>   peak_rssi;  // dBm
  std::optional<std::uint16_t> channel_index;
  std::optional<std::uint64_t> first_seen_utc;
  std::optional<std::uint64_t> first_seen_uptime;
  std::optional<std::uint64_t> last_seen_utc;
  std::optional<std::uint64_t> last_seen_uptime;
  std::optional<std::uint16_t> seen_count;
  std::optional<std::uint16_t> pc_bits;
  std::optional<std::uint16_t>          crc;
  std::optional<C1G2SingulationDetails> singulation_details;
  std::optional<std::uint32_t>          access_spec_id;
  std::vector<OpSpecResult>             op_spec_results;
  std::vector<CustomParameter>          custom;
  std::vector<OpaqueParameter>          unknown;

  // UTC timestamp when present, else uptime.
  std::optional<std::uint64_t> FirstSeen() const {
    return first_seen_utc ? first_seen_utc : first_seen_uptime;
  }

  std::optional<std::uint64_t> LastSeen() const {
    return last_seen_utc ? last_seen_utc : last_seen_uptime;
  }

  bool operator==(const TagReportData&) const = default;
};

} // namespace llrp::model
