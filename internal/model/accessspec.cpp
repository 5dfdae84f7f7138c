#include "accessspec.hpp"

namespace llrp::model {

const char* AccessSpecStateName(AccessSpecState state) {
  switch (state) {
    case AccessSpecState::kDisabled: return "Disabled";
    case AccessSpecState::kEnabled: return "Enabled";
  }
  return "Unknown";
}

std::optional<std::uint16_t> OpSpecIdOf(const OpSpec& op) {
  return std::visit(
      [](const auto& v) -> std::optional<std::uint16_t> {
        if constexpr (requires { v.op_spec_id; }) {
          return v.op_spec_id;
        } else {
          return std::nullopt;
        }
      },
      op);
}

bool Succeeded(const OpSpecResult& result) {
  return std::visit(
      [](const auto& v) -> bool {
        if constexpr (requires { v.result; }) {
          return v.result == 0;
        } else {
          return true;
        }
      },
      result);
}

std::optional<std::uint16_t> OpSpecIdOf(const OpSpecResult& result) {
  return std::visit(
      [](const auto& v) -> std::optional<std::uint16_t> {
        if constexpr (requires { v.op_spec_id; }) {
          return v.op_spec_id;
        } else {
          return std::nullopt;
        }
      },
      result);
}

bool ResultMatches(const OpSpec& op, const OpSpecResult& result) {
  if (std::holds_alternative<C1G2Read>(op)) {
    return std::holds_alternative<C1G2ReadOpSpecResult>(result);
  }
  if (std::holds_alternative<C1G2Write>(op)) {
    return std::holds_alternative<C1G2WriteOpSpecResult>(result);
  }
  if (std::holds_alternative<C1G2Lock>(op)) {
    return std::holds_alternative<C1G2LockOpSpecResult>(result);
  }
  if (std::holds_alternative<C1G2Kill>(op)) {
    return std::holds_alternative<C1G2KillOpSpecResult>(result);
  }
  return std::holds_alternative<CustomParameter>(result);
}

} // namespace llrp::model
