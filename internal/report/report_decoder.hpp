#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/codec/message.hpp"
#include "internal/model/report.hpp"
#include "internal/util/bytes.hpp"

namespace llrp::report {

// Tag reports carried by an RO_ACCESS_REPORT. Throws
// CodecError(kSchemaMismatch) for any other message.
std::vector<model::TagReportData> DecodeTagReports(const codec::Message& message);

// Uppercase hex without separators, e.g. "8504700013684D573243363207702205".
std::string EpcToHex(const util::Bytes& epc);

// Accepts upper or lower case with an optional 0x prefix and ':' / '-' / ' '
// separators. nullopt on an odd digit count or a non-hex character.
std::optional<util::Bytes> EpcFromHex(std::string_view hex);

// PeakRSSI is a two's-complement byte holding dBm directly.
constexpr std::int8_t RssiFromRaw(std::uint8_t raw) {
  return static_cast<std::int8_t>(raw > 127 ? static_cast<int>(raw) - 256 : static_cast<int>(raw));
}

// "EPC antenna rssi count" with "-" for absent fields.
std::string FormatTagReport(const model::TagReportData& tag);

} // namespace llrp::report
