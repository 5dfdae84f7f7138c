#pragma once

#include <cstdint>
#include <optional>

namespace llrp::codec {

/*
  LLRP v1.0.1 parameter type registry.

  Types 1..127 are TV encoded (1-byte header with the top bit set, payload
  length fixed per type). Types 128..1023 are TLV encoded (16-bit type with 6
  reserved bits, 16-bit total length including the 4-byte header).
*/
enum class ParameterType : std::uint16_t {
  // TV
  kAntennaId                  = 1,
  kFirstSeenTimestampUtc      = 2,
  kFirstSeenTimestampUptime   = 3,
  kLastSeenTimestampUtc       = 4,
  kLastSeenTimestampUptime    = 5,
  kPeakRssi                   = 6,
  kChannelIndex               = 7,
  kTagSeenCount               = 8,
  kRoSpecId                   = 9,
  kInventoryParameterSpecId   = 10,
  kC1G2Crc                    = 11,
  kC1G2Pc                     = 12,
  kEpc96                      = 13,
  kSpecIndex                  = 14,
  kClientRequestOpSpecResult  = 15,
  kAccessSpecId               = 16,
  kOpSpecId                   = 17,
  kC1G2SingulationDetails     = 18,

  // TLV
  kUtcTimestamp                      = 128,
  kUptime                            = 129,
  kGeneralDeviceCapabilities         = 137,
  kReceiveSensitivityTableEntry      = 139,
  kPerAntennaAirProtocol             = 140,
  kGpioCapabilities                  = 141,
  kLlrpCapabilities                  = 142,
  kRegulatoryCapabilities            = 143,
  kUhfBandCapabilities               = 144,
  kTransmitPowerLevelTableEntry      = 145,
  kFrequencyInformation              = 146,
  kFrequencyHopTable                 = 147,
  kFixedFrequencyTable               = 148,
  kPerAntennaReceiveSensitivityRange = 149,
  kRoSpec                            = 177,
  kRoBoundarySpec                    = 178,
  kRoSpecStartTrigger                = 179,
  kPeriodicTriggerValue              = 180,
  kGpiTriggerValue                   = 181,
  kRoSpecStopTrigger                 = 182,
  kAiSpec                            = 183,
  kAiSpecStopTrigger                 = 184,
  kTagObservationTrigger             = 185,
  kInventoryParameterSpec            = 186,
  kRfSurveySpec                      = 187,
  kRfSurveySpecStopTrigger           = 188,
  kAccessSpec                        = 207,
  kAccessSpecStopTrigger             = 208,
  kAccessCommand                     = 209,
  kLlrpConfigurationStateValue       = 217,
  kIdentification                    = 218,
  kGpoWriteData                      = 219,
  kKeepaliveSpec                     = 220,
  kAntennaProperties                 = 221,
  kAntennaConfiguration              = 222,
  kRfReceiver                        = 223,
  kRfTransmitter                     = 224,
  kGpiPortCurrentState               = 225,
  kEventsAndReports                  = 226,
  kRoReportSpec                      = 237,
  kTagReportContentSelector          = 238,
  kAccessReportSpec                  = 239,
  kTagReportData                     = 240,
  kEpcData                           = 241,
  kReaderEventNotificationSpec       = 244,
  kEventNotificationState            = 245,
  kReaderEventNotificationData       = 246,
  kHoppingEvent                      = 247,
  kGpiEvent                          = 248,
  kRoSpecEvent                       = 249,
  kReportBufferLevelWarningEvent     = 250,
  kReportBufferOverflowErrorEvent    = 251,
  kReaderExceptionEvent              = 252,
  kRfSurveyEvent                     = 253,
  kAiSpecEvent                       = 254,
  kAntennaEvent                      = 255,
  kConnectionAttemptEvent            = 256,
  kConnectionCloseEvent              = 257,
  kLlrpStatus                        = 287,
  kFieldError                        = 288,
  kParameterError                    = 289,
  kC1G2LlrpCapabilities              = 327,
  kUhfC1G2RfModeTable                = 328,
  kUhfC1G2RfModeTableEntry           = 329,
  kC1G2InventoryCommand              = 330,
  kC1G2Filter                        = 331,
  kC1G2TagInventoryMask              = 332,
  kC1G2TagInventoryStateAwareFilterAction   = 333,
  kC1G2TagInventoryStateUnawareFilterAction = 334,
  kC1G2RfControl                     = 335,
  kC1G2SingulationControl            = 336,
  kC1G2TagInventoryStateAwareSingulationAction = 337,
  kC1G2TagSpec                       = 338,
  kC1G2TargetTag                     = 339,
  kC1G2Read                          = 341,
  kC1G2Write                         = 342,
  kC1G2Kill                          = 343,
  kC1G2Lock                          = 344,
  kC1G2LockPayload                   = 345,
  kC1G2EpcMemorySelector             = 348,
  kC1G2ReadOpSpecResult              = 349,
  kC1G2WriteOpSpecResult             = 350,
  kC1G2KillOpSpecResult              = 351,
  kC1G2LockOpSpecResult              = 352,
  kCustom                            = 1023,
};

constexpr std::uint16_t kTvMaxType       = 127;
constexpr std::uint16_t kTlvHeaderSize   = 4;
constexpr std::uint16_t kTvHeaderSize    = 1;
constexpr std::uint16_t kTypeMask        = 0x03FF;
constexpr std::uint8_t  kTvFlag          = 0x80;
constexpr std::uint16_t kCustomHeaderLen = kTlvHeaderSize + 8;

constexpr std::uint16_t ToWire(ParameterType type) {
  return static_cast<std::uint16_t>(type);
}

constexpr bool IsTvType(std::uint16_t type) {
  return type >= 1 && type <= kTvMaxType;
}

// Payload length (excluding the 1-byte header) of a known TV parameter.
std::optional<std::uint16_t> TvPayloadLength(std::uint16_t type);

// Display name for logs; "Unknown" for types outside the registry.
const char* ParameterTypeName(std::uint16_t type);

// True for types this engine has a schema for.
bool IsKnownParameterType(std::uint16_t type);

} // namespace llrp::codec
