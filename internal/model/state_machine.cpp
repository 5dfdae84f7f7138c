#include "state_machine.hpp"

namespace llrp::model {

const char* RoSpecCommandName(RoSpecCommand command) {
  switch (command) {
    case RoSpecCommand::kEnable: return "EnableROSpec";
    case RoSpecCommand::kStart: return "StartROSpec";
    case RoSpecCommand::kStop: return "StopROSpec";
    case RoSpecCommand::kDisable: return "DisableROSpec";
    case RoSpecCommand::kDelete: return "DeleteROSpec";
  }
  return "Unknown";
}

const char* AccessSpecCommandName(AccessSpecCommand command) {
  switch (command) {
    case AccessSpecCommand::kEnable: return "EnableAccessSpec";
    case AccessSpecCommand::kDisable: return "DisableAccessSpec";
    case AccessSpecCommand::kDelete: return "DeleteAccessSpec";
  }
  return "Unknown";
}

const char* SessionStateName(SessionState state) {
  switch (state) {
    case SessionState::kConnecting: return "Connecting";
    case SessionState::kConnected: return "Connected";
    case SessionState::kOperational: return "Operational";
    case SessionState::kClosing: return "Closing";
    case SessionState::kClosed: return "Closed";
    case SessionState::kError: return "Error";
  }
  return "Unknown";
}

} // namespace llrp::model
