#include "common.hpp"

namespace llrp::model {

const char* StatusCodeName(std::uint16_t code) {
  switch (static_cast<StatusCode>(code)) {
    case StatusCode::kSuccess: return "M_Success";
    case StatusCode::kMsgParameterError: return "M_ParameterError";
    case StatusCode::kMsgFieldError: return "M_FieldError";
    case StatusCode::kMsgUnexpectedParameter: return "M_UnexpectedParameter";
    case StatusCode::kMsgMissingParameter: return "M_MissingParameter";
    case StatusCode::kMsgDuplicateParameter: return "M_DuplicateParameter";
    case StatusCode::kMsgOverflowParameter: return "M_OverflowParameter";
    case StatusCode::kMsgOverflowField: return "M_OverflowField";
    case StatusCode::kMsgUnknownParameter: return "M_UnknownParameter";
    case StatusCode::kMsgUnknownField: return "M_UnknownField";
    case StatusCode::kMsgUnsupportedMessage: return "M_UnsupportedMessage";
    case StatusCode::kMsgUnsupportedVersion: return "M_UnsupportedVersion";
    case StatusCode::kMsgUnsupportedParameter: return "M_UnsupportedParameter";
    case StatusCode::kParParameterError: return "P_ParameterError";
    case StatusCode::kParFieldError: return "P_FieldError";
    case StatusCode::kParUnexpectedParameter: return "P_UnexpectedParameter";
    case StatusCode::kParMissingParameter: return "P_MissingParameter";
    case StatusCode::kParDuplicateParameter: return "P_DuplicateParameter";
    case StatusCode::kParOverflowParameter: return "P_OverflowParameter";
    case StatusCode::kParOverflowField: return "P_OverflowField";
    case StatusCode::kParUnknownParameter: return "P_UnknownParameter";
    case StatusCode::kParUnknownField: return "P_UnknownField";
    case StatusCode::kParUnsupportedParameter: return "P_UnsupportedParameter";
    case StatusCode::kFieldInvalid: return "A_Invalid";
    case StatusCode::kFieldOutOfRange: return "A_OutOfRange";
    case StatusCode::kDeviceError: return "R_DeviceError";
  }
  return "UnknownStatus";
}

} // namespace llrp::model
