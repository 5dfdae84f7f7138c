#include "parameters.hpp"

namespace llrp::codec {

using util::CodecError;
using util::CodecErrorCode;

namespace {

constexpr std::size_t kEpc96Bytes = 12;

template <typename T>
void SetOnce(std::optional<T>* field, T value, std::uint16_t type) {
  if (field->has_value()) {
    throw CodecError(CodecErrorCode::kUnexpectedParameter,
                     std::string("TagReportData: duplicate ") + ParameterTypeName(type));
  }
  *field = value;
}

} // namespace

void Encode(ByteWriter& w, const model::TagReportData& v) {
  WriteTlv(w, ParameterType::kTagReportData, [&] {
    if (v.epc_format == model::EpcFormat::kEpc96) {
      if (v.epc.size() != kEpc96Bytes) {
        throw CodecError(CodecErrorCode::kFieldOutOfRange,
                         "EPC-96 needs 12 bytes, got " + std::to_string(v.epc.size()));
      }
      WriteTvHeader(w, ParameterType::kEpc96);
      w.Raw(v.epc);
    } else {
      WriteTlv(w, ParameterType::kEpcData, [&] { w.U1v(v.epc, v.epc_bit_count); });
    }

    if (v.rospec_id) WriteTvU32(w, ParameterType::kRoSpecId, *v.rospec_id);
    if (v.spec_index) WriteTvU16(w, ParameterType::kSpecIndex, *v.spec_index);
    if (v.inventory_parameter_spec_id) {
      WriteTvU16(w, ParameterType::kInventoryParameterSpecId, *v.inventory_parameter_spec_id);
    }
    if (v.antenna_id) WriteTvU16(w, ParameterType::kAntennaId, *v.antenna_id);
    if (v.peak_rssi) WriteTvU8(w, ParameterType::kPeakRssi, static_cast<std::uint8_t>(*v.peak_rssi));
    if (v.channel_index) WriteTvU16(w, ParameterType::kChannelIndex, *v.channel_index);
    if (v.first_seen_utc) WriteTvU64(w, ParameterType::kFirstSeenTimestampUtc, *v.first_seen_utc);
    if (v.first_seen_uptime) WriteTvU64(w, ParameterType::kFirstSeenTimestampUptime, *v.first_seen_uptime);
    if (v.last_seen_utc) WriteTvU64(w, ParameterType::kLastSeenTimestampUtc, *v.last_seen_utc);
    if (v.last_seen_uptime) WriteTvU64(w, ParameterType::kLastSeenTimestampUptime, *v.last_seen_uptime);
    if (v.seen_count) WriteTvU16(w, ParameterType::kTagSeenCount, *v.seen_count);
    if (v.pc_bits) WriteTvU16(w, ParameterType::kC1G2Pc, *v.pc_bits);
    if (v.crc) WriteTvU16(w, ParameterType::kC1G2Crc, *v.crc);
    if (v.singulation_details) {
      WriteTvHeader(w, ParameterType::kC1G2SingulationDetails);
      w.U16(v.singulation_details->num_collision_slots);
      w.U16(v.singulation_details->num_empty_slots);
    }
    if (v.access_spec_id) WriteTvU32(w, ParameterType::kAccessSpecId, *v.access_spec_id);
    for (const auto& result : v.op_spec_results) {
      Encode(w, result);
    }
    EncodeExtensions(w, v.custom, v.unknown);
  });
}

model::TagReportData DecodeTagReportData(const ParameterView& view) {
  RequireType(view, ParameterType::kTagReportData);
  auto                 body = view.Body();
  model::TagReportData out;

  ParameterCursor cursor(body, &out.unknown, "TagReportData");
  const auto epc = cursor.ExpectOneOf({ParameterType::kEpc96, ParameterType::kEpcData});
  auto       epc_body = epc.Body();
  if (epc.type == ToWire(ParameterType::kEpc96)) {
    out.epc_format    = model::EpcFormat::kEpc96;
    out.epc_bit_count = 96;
    out.epc           = epc_body.Raw(kEpc96Bytes);
  } else {
    out.epc_format = model::EpcFormat::kEpcData;
    out.epc        = epc_body.U1v(&out.epc_bit_count);
  }
  ExpectConsumed(epc_body, epc);

  // Optional fields are matched by type; the reader decides which appear.
  while (const auto next = cursor.PeekType()) {
    const auto type = static_cast<ParameterType>(*next);
    switch (type) {
      case ParameterType::kRoSpecId:
      case ParameterType::kSpecIndex:
      case ParameterType::kInventoryParameterSpecId:
      case ParameterType::kAntennaId:
      case ParameterType::kPeakRssi:
      case ParameterType::kChannelIndex:
      case ParameterType::kFirstSeenTimestampUtc:
      case ParameterType::kFirstSeenTimestampUptime:
      case ParameterType::kLastSeenTimestampUtc:
      case ParameterType::kLastSeenTimestampUptime:
      case ParameterType::kTagSeenCount:
      case ParameterType::kC1G2Pc:
      case ParameterType::kC1G2Crc:
      case ParameterType::kAccessSpecId: {
        const auto p = cursor.Next();
        auto       v = p.Body();
        switch (type) {
          case ParameterType::kRoSpecId: SetOnce(&out.rospec_id, v.U32(), *next); break;
          case ParameterType::kSpecIndex: SetOnce(&out.spec_index, v.U16(), *next); break;
          case ParameterType::kInventoryParameterSpecId:
            SetOnce(&out.inventory_parameter_spec_id, v.U16(), *next);
            break;
          case ParameterType::kAntennaId: SetOnce(&out.antenna_id, v.U16(), *next); break;
          case ParameterType::kPeakRssi: SetOnce(&out.peak_rssi, v.S8(), *next); break;
          case ParameterType::kChannelIndex: SetOnce(&out.channel_index, v.U16(), *next); break;
          case ParameterType::kFirstSeenTimestampUtc: SetOnce(&out.first_seen_utc, v.U64(), *next); break;
          case ParameterType::kFirstSeenTimestampUptime:
            SetOnce(&out.first_seen_uptime, v.U64(), *next);
            break;
          case ParameterType::kLastSeenTimestampUtc: SetOnce(&out.last_seen_utc, v.U64(), *next); break;
          case ParameterType::kLastSeenTimestampUptime:
            SetOnce(&out.last_seen_uptime, v.U64(), *next);
            break;
          case ParameterType::kTagSeenCount: SetOnce(&out.seen_count, v.U16(), *next); break;
          case ParameterType::kC1G2Pc: SetOnce(&out.pc_bits, v.U16(), *next); break;
          case ParameterType::kC1G2Crc: SetOnce(&out.crc, v.U16(), *next); break;
          default: SetOnce(&out.access_spec_id, v.U32(), *next); break;
        }
        break;
      }
      case ParameterType::kC1G2SingulationDetails: {
        const auto                    p = cursor.Next();
        auto                          v = p.Body();
        model::C1G2SingulationDetails details;
        details.num_collision_slots = v.U16();
        details.num_empty_slots     = v.U16();
        SetOnce(&out.singulation_details, details, *next);
        break;
      }
      case ParameterType::kC1G2ReadOpSpecResult:
      case ParameterType::kC1G2WriteOpSpecResult:
      case ParameterType::kC1G2KillOpSpecResult:
      case ParameterType::kC1G2LockOpSpecResult:
        out.op_spec_results.push_back(DecodeOpSpecResult(cursor.Next()));
        break;
      case ParameterType::kCustom: out.custom.push_back(DecodeCustom(cursor.Next())); break;
      default: cursor.ExpectEnd(); break;
    }
  }
  return out;
}

} // namespace llrp::codec
