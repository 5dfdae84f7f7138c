#pragma once

#include "internal/codec/message.hpp"
#include "internal/codec/message_codec.hpp"
#include "internal/codec/parameters.hpp"

#include "internal/model/accessspec.hpp"
#include "internal/model/capabilities.hpp"
#include "internal/model/common.hpp"
#include "internal/model/events.hpp"
#include "internal/model/reader_config.hpp"
#include "internal/model/report.hpp"
#include "internal/model/rospec.hpp"
#include "internal/model/state_machine.hpp"

#include "internal/lifecycle/accessspec_registry.hpp"
#include "internal/lifecycle/lifecycle_status.hpp"
#include "internal/lifecycle/rospec_registry.hpp"

#include "internal/report/report_decoder.hpp"

#include "internal/session/session.hpp"
#include "internal/transport/tcp_transport.hpp"

#include "internal/util/bytes.hpp"
#include "internal/util/result.hpp"
#include "internal/util/time.hpp"

namespace llrp::engine::v1 {
using namespace ::llrp::model;
using namespace ::llrp::codec;
using namespace ::llrp::lifecycle;
using namespace ::llrp::report;
using namespace ::llrp::session;
using namespace ::llrp::util;
}
