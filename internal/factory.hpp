#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/model/capabilities.hpp"
#include "internal/model/reader_config.hpp"
#include "internal/model/rospec.hpp"
#include "internal/session/session.hpp"

namespace llrp::factory {

/*
  BuildSession

  Composition root: the only place that knows the concrete transport. The
  session is returned unopened.
*/
std::shared_ptr<session::Session> BuildSession(const llrp::runtime::config::RuntimeConfig& config);

// Inventory ROSpec for the CLI. `capabilities` maps a requested transmit
// power in dBm to the reader's power table; without it the reader default
// is kept.
model::RoSpec BuildInventoryRoSpec(const llrp::runtime::config::InventoryConfig& inventory,
                                   const model::ReaderCapabilities*              capabilities);

// Keepalive and event settings pushed to the reader after connecting.
model::ReaderConfig BuildSessionReaderConfig(const llrp::runtime::config::RuntimeConfig& config);

} // namespace llrp::factory
