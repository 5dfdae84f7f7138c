#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/bytes.hpp"

namespace llrp::model {

using util::Bytes;

/*
  Vendor extension parameter (TLV type 1023).

  The payload is opaque to the engine and must survive decode/encode
  byte for byte.
*/
struct CustomParameter {
  std::uint32_t vendor_id = 0;
  std::uint32_t subtype   = 0;
  Bytes         payload;

  bool operator==(const CustomParameter&) const = default;
};

// A TLV parameter whose type the engine does not know. `body` excludes the
// 4-byte header; the length is recomputed on encode.
struct OpaqueParameter {
  std::uint16_t type = 0;
  Bytes         body;

  bool operator==(const OpaqueParameter&) const = default;
};

// LLRPStatus codes (LLRP v1.0.1 section 14.2.2).
enum class StatusCode : std::uint16_t {
  kSuccess                 = 0,
  kMsgParameterError       = 100,
  kMsgFieldError           = 101,
  kMsgUnexpectedParameter  = 102,
  kMsgMissingParameter     = 103,
  kMsgDuplicateParameter   = 104,
  kMsgOverflowParameter    = 105,
  kMsgOverflowField        = 106,
  kMsgUnknownParameter     = 107,
  kMsgUnknownField         = 108,
  kMsgUnsupportedMessage   = 109,
  kMsgUnsupportedVersion   = 110,
  kMsgUnsupportedParameter = 111,
  kParParameterError       = 200,
  kParFieldError           = 201,
  kParUnexpectedParameter  = 202,
  kParMissingParameter     = 203,
  kParDuplicateParameter   = 204,
  kParOverflowParameter    = 205,
  kParOverflowField        = 206,
  kParUnknownParameter     = 207,
  kParUnknownField         = 208,
  kParUnsupportedParameter = 209,
  kFieldInvalid            = 300,
  kFieldOutOfRange         = 301,
  kDeviceError             = 401,
};

const char* StatusCodeName(std::uint16_t code);

struct FieldError {
  std::uint16_t field_num  = 0;
  std::uint16_t error_code = 0;

  bool operator==(const FieldError&) const = default;
};

struct ParameterError {
  std::uint16_t             parameter_type = 0;
  std::uint16_t             error_code     = 0;
  std::optional<FieldError> field_error;
  // Nested error for a sub-parameter; at most one element.
  std::vector<ParameterError>  parameter_error;
  std::vector<OpaqueParameter> unknown;

  bool operator==(const ParameterError&) const = default;
};

struct LlrpStatus {
  std::uint16_t                 code = 0;
  std::string                   error_description;
  std::optional<FieldError>     field_error;
  std::optional<ParameterError> parameter_error;
  std::vector<OpaqueParameter>  unknown;

  bool ok() const {
    return code == static_cast<std::uint16_t>(StatusCode::kSuccess);
  }

  bool operator==(const LlrpStatus&) const = default;
};

// Event timestamps are either wall-clock (UTCTimestamp) or reader uptime.
struct Timestamp {
  enum class Kind : std::uint8_t { kUtc, kUptime };

  Kind          kind         = Kind::kUtc;
  std::uint64_t microseconds = 0;

  bool operator==(const Timestamp&) const = default;
};

} // namespace llrp::model
