#pragma once

#include <cstdint>
#include <optional>
#include <variant>
#include <vector>

#include "internal/model/common.hpp"

namespace llrp::model {

enum class AccessSpecState : std::uint8_t {
  kDisabled = 0,
  kEnabled  = 1,
};

const char* AccessSpecStateName(AccessSpecState state);

enum class AccessSpecStopTriggerType : std::uint8_t {
  kNull           = 0,
  kOperationCount = 1,
};

struct AccessSpecStopTrigger {
  AccessSpecStopTriggerType type            = AccessSpecStopTriggerType::kNull;
  std::uint16_t             operation_count = 0;

  bool operator==(const AccessSpecStopTrigger&) const = default;
};

// ------------------------------------------------------------
// Tag matching
// ------------------------------------------------------------

struct C1G2TargetTag {
  std::uint8_t  memory_bank    = 1;  // 0 reserved, 1 EPC, 2 TID, 3 user
  bool          match          = true;
  std::uint16_t pointer        = 0;
  Bytes         tag_mask;
  std::uint16_t mask_bit_count = 0;
  Bytes         tag_data;
  std::uint16_t data_bit_count = 0;

  bool operator==(const C1G2TargetTag&) const = default;
};

struct C1G2TagSpec {
  std::vector<C1G2TargetTag>   target_tags;  // 1..2
  std::vector<OpaqueParameter> unknown;

  bool operator==(const C1G2TagSpec&) const = default;
};

// ------------------------------------------------------------
// Operations
// ------------------------------------------------------------

struct C1G2Read {
  std::uint16_t op_spec_id      = 0;
  std::uint32_t access_password = 0;
  std::uint8_t  memory_bank     = 0;
  std::uint16_t word_pointer    = 0;
  std::uint16_t word_count      = 0;

  bool operator==(const C1G2Read&) const = default;
};

struct C1G2Write {
  std::uint16_t              op_spec_id      = 0;
  std::uint32_t              access_password = 0;
  std::uint8_t               memory_bank     = 0;
  std::uint16_t              word_pointer    = 0;
  std::vector<std::uint16_t> data;

  bool operator==(const C1G2Write&) const = default;
};

struct C1G2Kill {
  std::uint16_t op_spec_id    = 0;
  std::uint32_t kill_password = 0;

  bool operator==(const C1G2Kill&) const = default;
};

struct C1G2LockPayload {
  std::uint8_t privilege  = 0;  // 0 read/write, 1 perma-lock, 2 perma-unlock, 3 unlock
  std::uint8_t data_field = 0;  // 0 kill pw, 1 access pw, 2 EPC, 3 TID, 4 user

  bool operator==(const C1G2LockPayload&) const = default;
};

struct C1G2Lock {
  std::uint16_t                op_spec_id      = 0;
  std::uint32_t                access_password = 0;
  std::vector<C1G2LockPayload> payloads;
  std::vector<OpaqueParameter> unknown;

  bool operator==(const C1G2Lock&) const = default;
};

using OpSpec = std::variant<C1G2Read, C1G2Write, C1G2Lock, C1G2Kill, CustomParameter>;

// OpSpecID of a standard op; nullopt for a vendor op.
std::optional<std::uint16_t> OpSpecIdOf(const OpSpec& op);

// Custom parameters after the standard OpSpecs are kept in `op_specs` as
// vendor operations, in wire order.
struct AccessCommand {
  C1G2TagSpec                  tag_spec;
  std::vector<OpSpec>          op_specs;
  std::vector<OpaqueParameter> unknown;

  bool operator==(const AccessCommand&) const = default;
};

struct AccessReportSpec {
  std::uint8_t trigger = 0;  // 0 whenever ROReport is generated, 1 end of AccessSpec

  bool operator==(const AccessReportSpec&) const = default;
};

struct AccessSpec {
  std::uint32_t                   id            = 0;
  std::uint16_t                   antenna_id    = 0;  // 0 = any antenna
  std::uint8_t                    protocol_id   = 1;
  AccessSpecState                 current_state = AccessSpecState::kDisabled;
  std::uint32_t                   rospec_id     = 0;  // 0 = any ROSpec
  AccessSpecStopTrigger           stop_trigger;
  AccessCommand                   command;
  std::optional<AccessReportSpec> report_spec;
  std::vector<CustomParameter>    custom;
  std::vector<OpaqueParameter>    unknown;

  // Client-side policy, not carried on the wire: keep evaluating results
  // after an operation fails.
  bool continue_on_failure = false;

  bool operator==(const AccessSpec&) const = default;
};

// ------------------------------------------------------------
// Operation results
// ------------------------------------------------------------

struct C1G2ReadOpSpecResult {
  std::uint8_t               result     = 0;  // 0 success
  std::uint16_t              op_spec_id = 0;
  std::vector<std::uint16_t> read_data;

  bool operator==(const C1G2ReadOpSpecResult&) const = default;
};

struct C1G2WriteOpSpecResult {
  std::uint8_t  result            = 0;
  std::uint16_t op_spec_id        = 0;
  std::uint16_t num_words_written = 0;

  bool operator==(const C1G2WriteOpSpecResult&) const = default;
};

struct C1G2KillOpSpecResult {
  std::uint8_t  result     = 0;
  std::uint16_t op_spec_id = 0;

  bool operator==(const C1G2KillOpSpecResult&) const = default;
};

struct C1G2LockOpSpecResult {
  std::uint8_t  result     = 0;
  std::uint16_t op_spec_id = 0;

  bool operator==(const C1G2LockOpSpecResult&) const = default;
};

using OpSpecResult = std::variant<C1G2ReadOpSpecResult,
                                  C1G2WriteOpSpecResult,
                                  C1G2KillOpSpecResult,
                                  C1G2LockOpSpecResult,
                                  CustomParameter>;

// Result code 0 is success for every C1G2 result; vendor results count as
// successful since their encoding is opaque.
bool Succeeded(const OpSpecResult& result);

std::optional<std::uint16_t> OpSpecIdOf(const OpSpecResult& result);

// True when `result` is the result type `op` produces.
bool ResultMatches(const OpSpec& op, const OpSpecResult& result);

} // namespace llrp::model
