#pragma once

#include "internal/codec/parameter_codec.hpp"
#include "internal/model/accessspec.hpp"
#include "internal/model/antenna.hpp"
#include "internal/model/capabilities.hpp"
#include "internal/model/common.hpp"
#include "internal/model/events.hpp"
#include "internal/model/reader_config.hpp"
#include "internal/model/report.hpp"
#include "internal/model/rospec.hpp"

namespace llrp::codec {

/*
  Typed parameter codecs.

  Encode(w, x) appends the full parameter (header included). DecodeX(view)
  requires `view` to be of the matching type, decodes fixed fields and
  children in schema order, and throws CodecError when the body is not
  consumed exactly.
*/

// ------------------------------------------------------------
// Common
// ------------------------------------------------------------

void              Encode(ByteWriter& w, const model::FieldError& v);
model::FieldError DecodeFieldError(const ParameterView& view);

void                  Encode(ByteWriter& w, const model::ParameterError& v);
model::ParameterError DecodeParameterError(const ParameterView& view);

void              Encode(ByteWriter& w, const model::LlrpStatus& v);
model::LlrpStatus DecodeLlrpStatus(const ParameterView& view);

// UTCTimestamp or Uptime, by kind.
void             Encode(ByteWriter& w, const model::Timestamp& v);
model::Timestamp DecodeTimestamp(const ParameterView& view);

// ------------------------------------------------------------
// Antenna and RF
// ------------------------------------------------------------

void              Encode(ByteWriter& w, const model::RfReceiver& v);
model::RfReceiver DecodeRfReceiver(const ParameterView& view);

void                 Encode(ByteWriter& w, const model::RfTransmitter& v);
model::RfTransmitter DecodeRfTransmitter(const ParameterView& view);

void                        Encode(ByteWriter& w, const model::C1G2TagInventoryMask& v);
model::C1G2TagInventoryMask DecodeC1G2TagInventoryMask(const ParameterView& view);

void              Encode(ByteWriter& w, const model::C1G2Filter& v);
model::C1G2Filter DecodeC1G2Filter(const ParameterView& view);

void                 Encode(ByteWriter& w, const model::C1G2RfControl& v);
model::C1G2RfControl DecodeC1G2RfControl(const ParameterView& view);

void                          Encode(ByteWriter& w, const model::C1G2SingulationControl& v);
model::C1G2SingulationControl DecodeC1G2SingulationControl(const ParameterView& view);

void                        Encode(ByteWriter& w, const model::C1G2InventoryCommand& v);
model::C1G2InventoryCommand DecodeC1G2InventoryCommand(const ParameterView& view);

void                        Encode(ByteWriter& w, const model::AntennaConfiguration& v);
model::AntennaConfiguration DecodeAntennaConfiguration(const ParameterView& view);

void                     Encode(ByteWriter& w, const model::AntennaProperties& v);
model::AntennaProperties DecodeAntennaProperties(const ParameterView& view);

// ------------------------------------------------------------
// ROSpec
// ------------------------------------------------------------

void                   Encode(ByteWriter& w, const model::GpiTriggerValue& v);
model::GpiTriggerValue DecodeGpiTriggerValue(const ParameterView& view);

void                      Encode(ByteWriter& w, const model::RoSpecStartTrigger& v);
model::RoSpecStartTrigger DecodeRoSpecStartTrigger(const ParameterView& view);

void                     Encode(ByteWriter& w, const model::RoSpecStopTrigger& v);
model::RoSpecStopTrigger DecodeRoSpecStopTrigger(const ParameterView& view);

void                  Encode(ByteWriter& w, const model::RoBoundarySpec& v);
model::RoBoundarySpec DecodeRoBoundarySpec(const ParameterView& view);

void                     Encode(ByteWriter& w, const model::AiSpecStopTrigger& v);
model::AiSpecStopTrigger DecodeAiSpecStopTrigger(const ParameterView& view);

void                          Encode(ByteWriter& w, const model::InventoryParameterSpec& v);
model::InventoryParameterSpec DecodeInventoryParameterSpec(const ParameterView& view);

void          Encode(ByteWriter& w, const model::AiSpec& v);
model::AiSpec DecodeAiSpec(const ParameterView& view);

void                Encode(ByteWriter& w, const model::RfSurveySpec& v);
model::RfSurveySpec DecodeRfSurveySpec(const ParameterView& view);

void                            Encode(ByteWriter& w, const model::TagReportContentSelector& v);
model::TagReportContentSelector DecodeTagReportContentSelector(const ParameterView& view);

void                Encode(ByteWriter& w, const model::RoReportSpec& v);
model::RoReportSpec DecodeRoReportSpec(const ParameterView& view);

void          Encode(ByteWriter& w, const model::RoSpec& v);
model::RoSpec DecodeRoSpec(const ParameterView& view);

// ------------------------------------------------------------
// AccessSpec
// ------------------------------------------------------------

void               Encode(ByteWriter& w, const model::C1G2TagSpec& v);
model::C1G2TagSpec DecodeC1G2TagSpec(const ParameterView& view);

void          Encode(ByteWriter& w, const model::OpSpec& v);
model::OpSpec DecodeOpSpec(const ParameterView& view);

void                 Encode(ByteWriter& w, const model::AccessCommand& v);
model::AccessCommand DecodeAccessCommand(const ParameterView& view);

void                    Encode(ByteWriter& w, const model::AccessReportSpec& v);
model::AccessReportSpec DecodeAccessReportSpec(const ParameterView& view);

void              Encode(ByteWriter& w, const model::AccessSpec& v);
model::AccessSpec DecodeAccessSpec(const ParameterView& view);

void                Encode(ByteWriter& w, const model::OpSpecResult& v);
model::OpSpecResult DecodeOpSpecResult(const ParameterView& view);

// ------------------------------------------------------------
// Capabilities
// ------------------------------------------------------------

void                             Encode(ByteWriter& w, const model::GeneralDeviceCapabilities& v);
model::GeneralDeviceCapabilities DecodeGeneralDeviceCapabilities(const ParameterView& view);

void                    Encode(ByteWriter& w, const model::LlrpCapabilities& v);
model::LlrpCapabilities DecodeLlrpCapabilities(const ParameterView& view);

void                          Encode(ByteWriter& w, const model::RegulatoryCapabilities& v);
model::RegulatoryCapabilities DecodeRegulatoryCapabilities(const ParameterView& view);

void                        Encode(ByteWriter& w, const model::C1G2LlrpCapabilities& v);
model::C1G2LlrpCapabilities DecodeC1G2LlrpCapabilities(const ParameterView& view);

// ------------------------------------------------------------
// Configuration
// ------------------------------------------------------------

void                  Encode(ByteWriter& w, const model::Identification& v);
model::Identification DecodeIdentification(const ParameterView& view);

void                               Encode(ByteWriter& w, const model::ReaderEventNotificationSpec& v);
model::ReaderEventNotificationSpec DecodeReaderEventNotificationSpec(const ParameterView& view);

void                 Encode(ByteWriter& w, const model::KeepaliveSpec& v);
model::KeepaliveSpec DecodeKeepaliveSpec(const ParameterView& view);

void                       Encode(ByteWriter& w, const model::GpiPortCurrentState& v);
model::GpiPortCurrentState DecodeGpiPortCurrentState(const ParameterView& view);

void                Encode(ByteWriter& w, const model::GpoWriteData& v);
model::GpoWriteData DecodeGpoWriteData(const ParameterView& view);

void                    Encode(ByteWriter& w, const model::EventsAndReports& v);
model::EventsAndReports DecodeEventsAndReports(const ParameterView& view);

void          EncodeConfigurationStateValue(ByteWriter& w, std::uint32_t v);
std::uint32_t DecodeConfigurationStateValue(const ParameterView& view);

// ------------------------------------------------------------
// Reports and events
// ------------------------------------------------------------

void                 Encode(ByteWriter& w, const model::TagReportData& v);
model::TagReportData DecodeTagReportData(const ParameterView& view);

void                               Encode(ByteWriter& w, const model::ReaderEventNotificationData& v);
model::ReaderEventNotificationData DecodeReaderEventNotificationData(const ParameterView& view);

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------

template <typename T>
Bytes EncodeToBytes(const T& value) {
  ByteWriter w;
  Encode(w, value);
  return w.Take();
}

// View over a buffer that must hold exactly one parameter.
ParameterView SingleParameter(const Bytes& bytes);

} // namespace llrp::codec
