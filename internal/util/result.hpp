#pragma once

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <utility>

namespace llrp::util {

/*
  Portable command results.

  Every command returns one of these. The error class is never conflated:
    kCodec      the byte stream is desynchronized; the session is in Error
    kProtocol   the reader (or the local registry) rejected the command
    kTransport  socket failure, timeout, or connection loss
*/

enum class ErrorClass : std::uint8_t {
  kNone = 0,
  kCodec,
  kProtocol,
  kTransport,
};

// Transport-class codes.
enum class TransportCode : std::int32_t {
  kIOError = 1,
  kTimeout,
  kConnectionLost,
  kNotConnected,
  kCancelled,
  kClosed,
  kDuplicateMessageId,
};

struct Error {
  ErrorClass  error_class = ErrorClass::kNone;
  std::int32_t code       = 0;
  std::string message;
};

const char* ErrorClassName(ErrorClass error_class);

std::string ToString(const Error& error);

// Translates an exception thrown inside the engine into a classified Error.
Error ToError(const std::exception& e);

inline Error TransportFailure(TransportCode code, std::string message) {
  return {ErrorClass::kTransport, static_cast<std::int32_t>(code), std::move(message)};
}

template <typename T>
class Result {
 public:
  Result(T value) : value_(std::move(value)) {
  }

  Result(Error error) : error_(std::move(error)) {
  }

  static Result Err(ErrorClass error_class, std::int32_t code, std::string message) {
    return Result(Error{error_class, code, std::move(message)});
  }

  bool ok() const {
    return value_.has_value();
  }

  explicit operator bool() const {
    return ok();
  }

  const T& value() const& {
    return *value_;
  }

  T& value() & {
    return *value_;
  }

  T&& value() && {
    return std::move(*value_);
  }

  const T* operator->() const {
    return &*value_;
  }

  const Error& error() const {
    return error_;
  }

  ErrorClass error_class() const {
    return ok() ? ErrorClass::kNone : error_.error_class;
  }

 private:
  std::optional<T> value_;
  Error            error_;
};

// Result for commands with no payload.
struct Unit {};

using Status = Result<Unit>;

inline Status OkStatus() {
  return Status(Unit{});
}

} // namespace llrp::util
