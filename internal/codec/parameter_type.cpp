#include "parameter_type.hpp"

#include <string_view>

namespace llrp::codec {

std::optional<std::uint16_t> TvPayloadLength(std::uint16_t type) {
  switch (static_cast<ParameterType>(type)) {
    case ParameterType::kAntennaId:
      return 2;
    case ParameterType::kFirstSeenTimestampUtc:
    case ParameterType::kFirstSeenTimestampUptime:
    case ParameterType::kLastSeenTimestampUtc:
    case ParameterType::kLastSeenTimestampUptime:
      return 8;
    case ParameterType::kPeakRssi:
      return 1;
    case ParameterType::kChannelIndex:
    case ParameterType::kTagSeenCount:
    case ParameterType::kInventoryParameterSpecId:
    case ParameterType::kC1G2Crc:
    case ParameterType::kC1G2Pc:
    case ParameterType::kSpecIndex:
    case ParameterType::kClientRequestOpSpecResult:
    case ParameterType::kOpSpecId:
      return 2;
    case ParameterType::kRoSpecId:
    case ParameterType::kAccessSpecId:
    case ParameterType::kC1G2SingulationDetails:
      return 4;
    case ParameterType::kEpc96:
      return 12;
    default:
      return std::nullopt;
  }
}

const char* ParameterTypeName(std::uint16_t type) {
  switch (static_cast<ParameterType>(type)) {
    case ParameterType::kAntennaId: return "AntennaID";
    case ParameterType::kFirstSeenTimestampUtc: return "FirstSeenTimestampUTC";
    case ParameterType::kFirstSeenTimestampUptime: return "FirstSeenTimestampUptime";
    case ParameterType::kLastSeenTimestampUtc: return "LastSeenTimestampUTC";
    case ParameterType::kLastSeenTimestampUptime: return "LastSeenTimestampUptime";
    case ParameterType::kPeakRssi: return "PeakRSSI";
    case ParameterType::kChannelIndex: return "ChannelIndex";
    case ParameterType::kTagSeenCount: return "TagSeenCount";
    case ParameterType::kRoSpecId: return "ROSpecID";
    case ParameterType::kInventoryParameterSpecId: return "InventoryParameterSpecID";
    case ParameterType::kC1G2Crc: return "C1G2_CRC";
    case ParameterType::kC1G2Pc: return "C1G2_PC";
    case ParameterType::kEpc96: return "EPC-96";
    case ParameterType::kSpecIndex: return "SpecIndex";
    case ParameterType::kClientRequestOpSpecResult: return "ClientRequestOpSpecResult";
    case ParameterType::kAccessSpecId: return "AccessSpecID";
    case ParameterType::kOpSpecId: return "OpSpecID";
    case ParameterType::kC1G2SingulationDetails: return "C1G2SingulationDetails";
    case ParameterType::kUtcTimestamp: return "UTCTimestamp";
    case ParameterType::kUptime: return "Uptime";
    case ParameterType::kGeneralDeviceCapabilities: return "GeneralDeviceCapabilities";
    case ParameterType::kReceiveSensitivityTableEntry: return "ReceiveSensitivityTableEntry";
    case ParameterType::kPerAntennaAirProtocol: return "PerAntennaAirProtocol";
    case ParameterType::kGpioCapabilities: return "GPIOCapabilities";
    case ParameterType::kLlrpCapabilities: return "LLRPCapabilities";
    case ParameterType::kRegulatoryCapabilities: return "RegulatoryCapabilities";
    case ParameterType::kUhfBandCapabilities: return "UHFBandCapabilities";
    case ParameterType::kTransmitPowerLevelTableEntry: return "TransmitPowerLevelTableEntry";
    case ParameterType::kFrequencyInformation: return "FrequencyInformation";
    case ParameterType::kFrequencyHopTable: return "FrequencyHopTable";
    case ParameterType::kFixedFrequencyTable: return "FixedFrequencyTable";
    case ParameterType::kPerAntennaReceiveSensitivityRange: return "PerAntennaReceiveSensitivityRange";
    case ParameterType::kRoSpec: return "ROSpec";
    case ParameterType::kRoBoundarySpec: return "ROBoundarySpec";
    case ParameterType::kRoSpecStartTrigger: return "ROSpecStartTrigger";
    case ParameterType::kPeriodicTriggerValue: return "PeriodicTriggerValue";
    case ParameterType::kGpiTriggerValue: return "GPITriggerValue";
    case ParameterType::kRoSpecStopTrigger: return "ROSpecStopTrigger";
    case ParameterType::kAiSpec: return "AISpec";
    case ParameterType::kAiSpecStopTrigger: return "AISpecStopTrigger";
    case ParameterType::kTagObservationTrigger: return "TagObservationTrigger";
    case ParameterType::kInventoryParameterSpec: return "InventoryParameterSpec";
    case ParameterType::kRfSurveySpec: return "RFSurveySpec";
    case ParameterType::kRfSurveySpecStopTrigger: return "RFSurveySpecStopTrigger";
    case ParameterType::kAccessSpec: return "AccessSpec";
    case ParameterType::kAccessSpecStopTrigger: return "AccessSpecStopTrigger";
    case ParameterType::kAccessCommand: return "AccessCommand";
    case ParameterType::kLlrpConfigurationStateValue: return "LLRPConfigurationStateValue";
    case ParameterType::kIdentification: return "Identification";
    case ParameterType::kGpoWriteData: return "GPOWriteData";
    case ParameterType::kKeepaliveSpec: return "KeepaliveSpec";
    case ParameterType::kAntennaProperties: return "AntennaProperties";
    case ParameterType::kAntennaConfiguration: return "AntennaConfiguration";
    case ParameterType::kRfReceiver: return "RFReceiver";
    case ParameterType::kRfTransmitter: return "RFTransmitter";
    case ParameterType::kGpiPortCurrentState: return "GPIPortCurrentState";
    case ParameterType::kEventsAndReports: return "EventsAndReports";
    case ParameterType::kRoReportSpec: return "ROReportSpec";
    case ParameterType::kTagReportContentSelector: return "TagReportContentSelector";
    case ParameterType::kAccessReportSpec: return "AccessReportSpec";
    case ParameterType::kTagReportData: return "TagReportData";
    case ParameterType::kEpcData: return "EPCData";
    case ParameterType::kReaderEventNotificationSpec: return "ReaderEventNotificationSpec";
    case ParameterType::kEventNotificationState: return "EventNotificationState";
    case ParameterType::kReaderEventNotificationData: return "ReaderEventNotificationData";
    case ParameterType::kHoppingEvent: return "HoppingEvent";
    case ParameterType::kGpiEvent: return "GPIEvent";
    case ParameterType::kRoSpecEvent: return "ROSpecEvent";
    case ParameterType::kReportBufferLevelWarningEvent: return "ReportBufferLevelWarningEvent";
    case ParameterType::kReportBufferOverflowErrorEvent: return "ReportBufferOverflowErrorEvent";
    case ParameterType::kReaderExceptionEvent: return "ReaderExceptionEvent";
    case ParameterType::kRfSurveyEvent: return "RFSurveyEvent";
    case ParameterType::kAiSpecEvent: return "AISpecEvent";
    case ParameterType::kAntennaEvent: return "AntennaEvent";
    case ParameterType::kConnectionAttemptEvent: return "ConnectionAttemptEvent";
    case ParameterType::kConnectionCloseEvent: return "ConnectionCloseEvent";
    case ParameterType::kLlrpStatus: return "LLRPStatus";
    case ParameterType::kFieldError: return "FieldError";
    case ParameterType::kParameterError: return "ParameterError";
    case ParameterType::kC1G2LlrpCapabilities: return "C1G2LLRPCapabilities";
    case ParameterType::kUhfC1G2RfModeTable: return "UHFC1G2RFModeTable";
    case ParameterType::kUhfC1G2RfModeTableEntry: return "UHFC1G2RFModeTableEntry";
    case ParameterType::kC1G2InventoryCommand: return "C1G2InventoryCommand";
    case ParameterType::kC1G2Filter: return "C1G2Filter";
    case ParameterType::kC1G2TagInventoryMask: return "C1G2TagInventoryMask";
    case ParameterType::kC1G2TagInventoryStateAwareFilterAction: return "C1G2TagInventoryStateAwareFilterAction";
    case ParameterType::kC1G2TagInventoryStateUnawareFilterAction: return "C1G2TagInventoryStateUnawareFilterAction";
    case ParameterType::kC1G2RfControl: return "C1G2RFControl";
    case ParameterType::kC1G2SingulationControl: return "C1G2SingulationControl";
    case ParameterType::kC1G2TagInventoryStateAwareSingulationAction: return "C1G2TagInventoryStateAwareSingulationAction";
    case ParameterType::kC1G2TagSpec: return "C1G2TagSpec";
    case ParameterType::kC1G2TargetTag: return "C1G2TargetTag";
    case ParameterType::kC1G2Read: return "C1G2Read";
    case ParameterType::kC1G2Write: return "C1G2Write";
    case ParameterType::kC1G2Kill: return "C1G2Kill";
    case ParameterType::kC1G2Lock: return "C1G2Lock";
    case ParameterType::kC1G2LockPayload: return "C1G2LockPayload";
    case ParameterType::kC1G2EpcMemorySelector: return "C1G2EPCMemorySelector";
    case ParameterType::kC1G2ReadOpSpecResult: return "C1G2ReadOpSpecResult";
    case ParameterType::kC1G2WriteOpSpecResult: return "C1G2WriteOpSpecResult";
    case ParameterType::kC1G2KillOpSpecResult: return "C1G2KillOpSpecResult";
    case ParameterType::kC1G2LockOpSpecResult: return "C1G2LockOpSpecResult";
    case ParameterType::kCustom: return "Custom";
  }
  return "Unknown";
}

bool IsKnownParameterType(std::uint16_t type) {
  return std::string_view(ParameterTypeName(type)) != "Unknown";
}

} // namespace llrp::codec
