#include "report_decoder.hpp"

#include <sstream>

#include "internal/util/errors.hpp"

namespace llrp::report {

std::vector<model::TagReportData> DecodeTagReports(const codec::Message& message) {
  const auto* report = std::get_if<codec::RoAccessReport>(&message.body);
  if (message.type != codec::MessageType::kRoAccessReport || !report) {
    throw util::CodecError(util::CodecErrorCode::kSchemaMismatch,
                           std::string("expected RO_ACCESS_REPORT, got ") + codec::MessageTypeName(message.type));
  }
  return report->tag_reports;
}

std::string EpcToHex(const util::Bytes& epc) {
  return util::ToHex(epc);
}

std::optional<util::Bytes> EpcFromHex(std::string_view hex) {
  return util::FromHex(hex);
}

std::string FormatTagReport(const model::TagReportData& tag) {
  std::ostringstream out;
  out << EpcToHex(tag.epc) << ' ';
  if (tag.antenna_id) {
    out << *tag.antenna_id;
  } else {
    out << '-';
  }
  out << ' ';
  if (tag.peak_rssi) {
    out << static_cast<int>(*tag.peak_rssi);
  } else {
    out << '-';
  }
  out << ' ';
  if (tag.seen_count) {
    out << *tag.seen_count;
  } else {
    out << '-';
  }
  return out.str();
}

} // namespace llrp::report
