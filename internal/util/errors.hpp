#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace llrp::util {

/*
  Central error types.

  Internal layers throw these. The command surface translates them into
  util::Result values (see result.hpp) so callers can tell codec, protocol
  and transport failures apart.
*/

enum class CodecErrorCode : std::uint8_t {
  kTruncated = 1,
  kBadLength,
  kUnknownTvType,
  kUnexpectedParameter,
  kMissingParameter,
  kSchemaMismatch,
  kFieldOutOfRange,
  kFrameTooLarge,
};

const char* CodecErrorName(CodecErrorCode code);

class CodecError : public std::runtime_error {
 public:
  CodecError(CodecErrorCode code, const std::string& msg)
      : std::runtime_error(std::string(CodecErrorName(code)) + ": " + msg), code_(code) {
  }

  CodecErrorCode code() const {
    return code_;
  }

 private:
  CodecErrorCode code_;
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TimeoutError : public TransportError {
 public:
  explicit TimeoutError(const std::string& msg) : TransportError(msg) {
  }
};

class ConnectionLost : public TransportError {
 public:
  explicit ConnectionLost(const std::string& msg) : TransportError(msg) {
  }
};

} // namespace llrp::util
