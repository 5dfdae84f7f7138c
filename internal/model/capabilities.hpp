#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/common.hpp"

namespace llrp::model {

// GET_READER_CAPABILITIES RequestedData selector.
enum class CapabilitiesRequest : std::uint8_t {
  kAll                         = 0,
  kGeneralDeviceCapabilities   = 1,
  kLlrpCapabilities            = 2,
  kRegulatoryCapabilities      = 3,
  kAirProtocolLlrpCapabilities = 4,
};

// ------------------------------------------------------------
// General device
// ------------------------------------------------------------

struct ReceiveSensitivityTableEntry {
  std::uint16_t index       = 0;
  std::int16_t  sensitivity = 0;  // dB relative to maximum sensitivity

  bool operator==(const ReceiveSensitivityTableEntry&) const = default;
};

struct PerAntennaReceiveSensitivityRange {
  std::uint16_t antenna_id = 0;
  std::uint16_t min_index  = 0;
  std::uint16_t max_index  = 0;

  bool operator==(const PerAntennaReceiveSensitivityRange&) const = default;
};

struct PerAntennaAirProtocol {
  std::uint16_t antenna_id = 0;
  Bytes         protocol_ids;

  bool operator==(const PerAntennaAirProtocol&) const = default;
};

struct GpioCapabilities {
  std::uint16_t num_gpis = 0;
  std::uint16_t num_gpos = 0;

  bool operator==(const GpioCapabilities&) const = default;
};

struct GeneralDeviceCapabilities {
  std::uint16_t max_antennas               = 0;
  bool          can_set_antenna_properties = false;
  bool          has_utc_clock              = false;
  std::uint32_t manufacturer               = 0;  // IANA enterprise number
  std::uint32_t model                      = 0;
  std::string   firmware_version;
  std::vector<ReceiveSensitivityTableEntry>      receive_sensitivity_table;
  std::vector<PerAntennaReceiveSensitivityRange> receive_sensitivity_ranges;
  GpioCapabilities                               gpio;
  std::vector<PerAntennaAirProtocol>             air_protocols;
  std::vector<OpaqueParameter>                   unknown;

  bool operator==(const GeneralDeviceCapabilities&) const = default;
};

// ------------------------------------------------------------
// LLRP limits
// ------------------------------------------------------------

struct LlrpCapabilities {
  bool          can_do_rf_survey                     = false;
  bool          can_report_buffer_fill_warning       = false;
  bool          supports_client_request_op_spec      = false;
  bool          can_do_state_aware_singulation       = false;
  bool          supports_event_and_report_holding    = false;
  std::uint8_t  max_priority_levels                  = 0;
  std::uint16_t client_request_op_spec_timeout       = 0;
  std::uint32_t max_rospecs                          = 0;
  std::uint32_t max_specs_per_rospec                 = 0;
  std::uint32_t max_inventory_parameter_specs_per_aispec = 0;
  std::uint32_t max_accessspecs                      = 0;
  std::uint32_t max_opspecs_per_accessspec           = 0;

  bool operator==(const LlrpCapabilities&) const = default;
};

// ------------------------------------------------------------
// Regulatory
// ------------------------------------------------------------

struct TransmitPowerLevelTableEntry {
  std::uint16_t index = 0;
  std::int16_t  power = 0;  // dBm * 100

  bool operator==(const TransmitPowerLevelTableEntry&) const = default;
};

struct FrequencyHopTable {
  std::uint8_t               hop_table_id = 0;
  std::vector<std::uint32_t> frequencies;  // kHz

  bool operator==(const FrequencyHopTable&) const = default;
};

struct FixedFrequencyTable {
  std::vector<std::uint32_t> frequencies;  // kHz

  bool operator==(const FixedFrequencyTable&) const = default;
};

struct FrequencyInformation {
  bool                               hopping = false;
  std::vector<FrequencyHopTable>     hop_tables;
  std::optional<FixedFrequencyTable> fixed_frequencies;
  std::vector<OpaqueParameter>       unknown;

  bool operator==(const FrequencyInformation&) const = default;
};

struct UhfC1G2RfModeTableEntry {
  std::uint32_t mode_id                  = 0;
  bool          dr_value                 = false;  // 0 DR=8, 1 DR=64/3
  bool          epc_hag_conformance      = false;
  std::uint8_t  modulation               = 0;      // M: 0 FM0, 1 Miller 2, 2 Miller 4, 3 Miller 8
  std::uint8_t  forward_link_modulation  = 0;
  std::uint8_t  spectral_mask_indicator  = 0;
  std::uint32_t bdr                      = 0;      // bps
  std::uint32_t pie                      = 0;      // ratio * 1000
  std::uint32_t min_tari                 = 0;      // ns
  std::uint32_t max_tari                 = 0;
  std::uint32_t step_tari                = 0;

  bool operator==(const UhfC1G2RfModeTableEntry&) const = default;
};

struct UhfC1G2RfModeTable {
  std::vector<UhfC1G2RfModeTableEntry> entries;
  std::vector<OpaqueParameter>         unknown;

  bool operator==(const UhfC1G2RfModeTable&) const = default;
};

struct UhfBandCapabilities {
  std::vector<TransmitPowerLevelTableEntry> transmit_power_table;
  FrequencyInformation                      frequency_information;
  std::vector<UhfC1G2RfModeTable>           rf_mode_tables;
  std::vector<OpaqueParameter>              unknown;

  bool operator==(const UhfBandCapabilities&) const = default;
};

struct RegulatoryCapabilities {
  std::uint16_t                      country_code            = 0;  // ISO 3166
  std::uint16_t                      communications_standard = 0;
  std::optional<UhfBandCapabilities> uhf_band;
  std::vector<CustomParameter>       custom;
  std::vector<OpaqueParameter>       unknown;

  bool operator==(const RegulatoryCapabilities&) const = default;
};

struct C1G2LlrpCapabilities {
  bool          can_support_block_erase   = false;
  bool          can_support_block_write   = false;
  std::uint16_t max_select_filters_per_query = 0;

  bool operator==(const C1G2LlrpCapabilities&) const = default;
};

/*
  ReaderCapabilities

  Immutable snapshot built from GET_READER_CAPABILITIES_RESPONSE. An absent
  group means the reader does not support it or it was not requested.
*/
struct ReaderCapabilities {
  std::optional<GeneralDeviceCapabilities> general;
  std::optional<LlrpCapabilities>          llrp;
  std::optional<RegulatoryCapabilities>    regulatory;
  std::optional<C1G2LlrpCapabilities>      air_protocol;
  std::vector<CustomParameter>             custom;
  std::vector<OpaqueParameter>             unknown;

  // 0 when the general group is absent.
  std::uint16_t MaxAntennas() const;

  // Checks the per-antenna protocol lists. Antenna 0 asks whether any
  // antenna supports the protocol.
  bool SupportsAirProtocol(std::uint8_t protocol_id, std::uint16_t antenna_id = 0) const;

  // Index of the highest table entry whose power does not exceed `dbm`.
  // nullopt when the table is absent or every entry is above `dbm`.
  std::optional<std::uint16_t> TransmitPowerIndexFor(double dbm) const;

  bool operator==(const ReaderCapabilities&) const = default;
};

} // namespace llrp::model
