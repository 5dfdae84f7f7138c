#include "result.hpp"

#include "internal/util/errors.hpp"

namespace llrp::util {

const char* ErrorClassName(ErrorClass error_class) {
  switch (error_class) {
    case ErrorClass::kNone:
      return "none";
    case ErrorClass::kCodec:
      return "codec";
    case ErrorClass::kProtocol:
      return "protocol";
    case ErrorClass::kTransport:
      return "transport";
  }
  return "unknown";
}

const char* CodecErrorName(CodecErrorCode code) {
  switch (code) {
    case CodecErrorCode::kTruncated:
      return "Truncated";
    case CodecErrorCode::kBadLength:
      return "BadLength";
    case CodecErrorCode::kUnknownTvType:
      return "UnknownTvType";
    case CodecErrorCode::kUnexpectedParameter:
      return "UnexpectedParameter";
    case CodecErrorCode::kMissingParameter:
      return "MissingParameter";
    case CodecErrorCode::kSchemaMismatch:
      return "SchemaMismatch";
    case CodecErrorCode::kFieldOutOfRange:
      return "FieldOutOfRange";
    case CodecErrorCode::kFrameTooLarge:
      return "FrameTooLarge";
  }
  return "CodecError";
}

std::string ToString(const Error& error) {
  return std::string(ErrorClassName(error.error_class)) + " error " + std::to_string(error.code) + ": " + error.message;
}

Error ToError(const std::exception& e) {
  if (const auto* codec = dynamic_cast<const CodecError*>(&e)) {
    return {ErrorClass::kCodec, static_cast<std::int32_t>(codec->code()), e.what()};
  }
  if (dynamic_cast<const TimeoutError*>(&e)) {
    return TransportFailure(TransportCode::kTimeout, e.what());
  }
  if (dynamic_cast<const ConnectionLost*>(&e)) {
    return TransportFailure(TransportCode::kConnectionLost, e.what());
  }
  if (dynamic_cast<const TransportError*>(&e)) {
    return TransportFailure(TransportCode::kIOError, e.what());
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return TransportFailure(TransportCode::kNotConnected, e.what());
  }

  return TransportFailure(TransportCode::kIOError, e.what());
}

} // namespace llrp::util
