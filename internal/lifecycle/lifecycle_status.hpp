#pragma once

#include <cstdint>
#include <string>
#include <utility>

#include "internal/util/result.hpp"

namespace llrp::lifecycle {

/*
  Local lifecycle result codes.

  Registries report rejected commands with these. The values sit above the
  LLRP status code range so a kProtocol error code identifies its origin.
*/

enum class LifecycleStatus : std::int32_t {
  kOk = 0,

  kROSpecNotFound = 1001,
  kAccessSpecNotFound,
  kInvalidState,
  kDuplicateId,
  kInvalidId,
  kTriggerMismatch,
};

const char* LifecycleStatusName(LifecycleStatus status);

struct LifecycleResult {
  LifecycleStatus status = LifecycleStatus::kOk;
  std::string     message;

  static LifecycleResult Ok() {
    return {};
  }

  static LifecycleResult Fail(LifecycleStatus s, std::string msg = {}) {
    return {s, std::move(msg)};
  }

  bool ok() const {
    return status == LifecycleStatus::kOk;
  }

  explicit operator bool() const {
    return ok();
  }

  util::Error ToError() const {
    return {util::ErrorClass::kProtocol, static_cast<std::int32_t>(status),
            std::string(LifecycleStatusName(status)) + ": " + message};
  }
};

} // namespace llrp::lifecycle
