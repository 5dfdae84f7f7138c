#pragma once

#include <cstdint>
#include <optional>

#include "internal/model/accessspec.hpp"
#include "internal/model/rospec.hpp"

namespace llrp::model {

// ------------------------------------------------------------
// ROSpec
// ------------------------------------------------------------

enum class RoSpecCommand : std::uint8_t {
  kEnable,
  kStart,
  kStop,
  kDisable,
  kDelete,
};

const char* RoSpecCommandName(RoSpecCommand command);

// Disabled --Enable--> Inactive --Start--> Active --Stop--> Inactive
// Inactive --Disable--> Disabled. Delete is accepted from any state.
constexpr bool CanApply(RoSpecState from, RoSpecCommand command) {
  switch (command) {
    case RoSpecCommand::kEnable: return from == RoSpecState::kDisabled;
    case RoSpecCommand::kStart: return from == RoSpecState::kInactive;
    case RoSpecCommand::kStop: return from == RoSpecState::kActive;
    case RoSpecCommand::kDisable: return from == RoSpecState::kInactive;
    case RoSpecCommand::kDelete: return true;
  }
  return false;
}

// State after a successful command; nullopt for Delete.
constexpr std::optional<RoSpecState> TargetState(RoSpecCommand command) {
  switch (command) {
    case RoSpecCommand::kEnable: return RoSpecState::kInactive;
    case RoSpecCommand::kStart: return RoSpecState::kActive;
    case RoSpecCommand::kStop: return RoSpecState::kInactive;
    case RoSpecCommand::kDisable: return RoSpecState::kDisabled;
    case RoSpecCommand::kDelete: return std::nullopt;
  }
  return std::nullopt;
}

// ------------------------------------------------------------
// AccessSpec
// ------------------------------------------------------------

enum class AccessSpecCommand : std::uint8_t {
  kEnable,
  kDisable,
  kDelete,
};

const char* AccessSpecCommandName(AccessSpecCommand command);

constexpr bool CanApply(AccessSpecState from, AccessSpecCommand command) {
  switch (command) {
    case AccessSpecCommand::kEnable: return from == AccessSpecState::kDisabled;
    case AccessSpecCommand::kDisable: return from == AccessSpecState::kEnabled;
    case AccessSpecCommand::kDelete: return true;
  }
  return false;
}

// ------------------------------------------------------------
// Session
// ------------------------------------------------------------

enum class SessionState : std::uint8_t {
  kConnecting  = 0,
  kConnected   = 1,
  kOperational = 2,
  kClosing     = 3,
  kClosed      = 4,
  kError       = 5,
};

const char* SessionStateName(SessionState state);

constexpr bool IsTerminal(SessionState state) {
  return state == SessionState::kClosed;
}

constexpr bool CanTransition(SessionState from, SessionState to) {
  if (from == to || IsTerminal(from)) {
    return false;
  }
  if (to == SessionState::kError) {
    return from != SessionState::kError;
  }
  switch (from) {
    case SessionState::kConnecting: return to == SessionState::kConnected || to == SessionState::kClosed;
    case SessionState::kConnected:
      return to == SessionState::kOperational || to == SessionState::kClosing ||
             to == SessionState::kClosed;
    case SessionState::kOperational: return to == SessionState::kClosing || to == SessionState::kClosed;
    case SessionState::kClosing: return to == SessionState::kClosed;
    case SessionState::kError: return to == SessionState::kClosed;
    case SessionState::kClosed: return false;
  }
  return false;
}

} // namespace llrp::model
