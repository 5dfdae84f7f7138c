#include "lifecycle_status.hpp"

namespace llrp::lifecycle {

const char* LifecycleStatusName(LifecycleStatus status) {
  switch (status) {
    case LifecycleStatus::kOk: return "Ok";
    case LifecycleStatus::kROSpecNotFound: return "ROSpecNotFound";
    case LifecycleStatus::kAccessSpecNotFound: return "AccessSpecNotFound";
    case LifecycleStatus::kInvalidState: return "InvalidState";
    case LifecycleStatus::kDuplicateId: return "DuplicateId";
    case LifecycleStatus::kInvalidId: return "InvalidId";
    case LifecycleStatus::kTriggerMismatch: return "TriggerMismatch";
  }
  return "Unknown";
}

} // namespace llrp::lifecycle
