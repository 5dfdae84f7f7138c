#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "internal/model/common.hpp"

namespace llrp::model {

struct RfReceiver {
  std::uint16_t receiver_sensitivity = 0;

  bool operator==(const RfReceiver&) const = default;
};

struct RfTransmitter {
  std::uint16_t hop_table_id   = 0;
  std::uint16_t channel_index  = 0;
  std::uint16_t transmit_power = 0;  // index into the TransmitPowerLevelTable

  bool operator==(const RfTransmitter&) const = default;
};

// ------------------------------------------------------------
// C1G2 inventory command
// ------------------------------------------------------------

struct C1G2TagInventoryMask {
  std::uint8_t  memory_bank    = 0;  // 2 bits
  std::uint16_t pointer        = 0;  // bit address
  Bytes         tag_mask;
  std::uint16_t mask_bit_count = 0;

  bool operator==(const C1G2TagInventoryMask&) const = default;
};

struct C1G2TagInventoryStateAwareFilterAction {
  std::uint8_t target = 0;
  std::uint8_t action = 0;

  bool operator==(const C1G2TagInventoryStateAwareFilterAction&) const = default;
};

struct C1G2TagInventoryStateUnawareFilterAction {
  std::uint8_t action = 0;

  bool operator==(const C1G2TagInventoryStateUnawareFilterAction&) const = default;
};

struct C1G2Filter {
  std::uint8_t                                            truncate = 0;  // 2 bits
  C1G2TagInventoryMask                                    mask;
  std::optional<C1G2TagInventoryStateAwareFilterAction>   state_aware_action;
  std::optional<C1G2TagInventoryStateUnawareFilterAction> state_unaware_action;
  std::vector<OpaqueParameter>                            unknown;

  bool operator==(const C1G2Filter&) const = default;
};

struct C1G2RfControl {
  std::uint16_t mode_index = 0;
  std::uint16_t tari       = 0;

  bool operator==(const C1G2RfControl&) const = default;
};

struct C1G2TagInventoryStateAwareSingulationAction {
  bool inventoried_state_b = false;  // I
  bool sl_deasserted       = false;  // S

  bool operator==(const C1G2TagInventoryStateAwareSingulationAction&) const = default;
};

struct C1G2SingulationControl {
  std::uint8_t                                               session          = 0;  // 2 bits
  std::uint16_t                                              tag_population   = 0;
  std::uint32_t                                              tag_transit_time = 0;
  std::optional<C1G2TagInventoryStateAwareSingulationAction> state_aware_action;
  std::vector<OpaqueParameter>                               unknown;

  bool operator==(const C1G2SingulationControl&) const = default;
};

struct C1G2InventoryCommand {
  bool                                  tag_inventory_state_aware = false;
  std::vector<C1G2Filter>               filters;
  std::optional<C1G2RfControl>          rf_control;
  std::optional<C1G2SingulationControl> singulation_control;
  std::vector<CustomParameter>          custom;
  std::vector<OpaqueParameter>          unknown;

  bool operator==(const C1G2InventoryCommand&) const = default;
};

// ------------------------------------------------------------
// Per-antenna configuration and properties
// ------------------------------------------------------------

struct AntennaConfiguration {
  std::uint16_t                     antenna_id = 0;  // 0 = all antennas
  std::optional<RfReceiver>         rf_receiver;
  std::optional<RfTransmitter>      rf_transmitter;
  std::vector<C1G2InventoryCommand> inventory_commands;
  std::vector<CustomParameter>      custom;
  std::vector<OpaqueParameter>      unknown;

  bool operator==(const AntennaConfiguration&) const = default;
};

struct AntennaProperties {
  bool          connected  = false;
  std::uint16_t antenna_id = 0;
  std::int16_t  gain       = 0;  // dBi * 100

  bool operator==(const AntennaProperties&) const = default;
};

} // namespace llrp::model
