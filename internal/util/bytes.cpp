#include "bytes.hpp"

namespace llrp::util {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

} // namespace

std::string ToHex(const Bytes& bytes) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string           out;
  out.reserve(bytes.size() * 2);
  for (const auto b : bytes) {
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0F]);
  }
  return out;
}

std::optional<Bytes> FromHex(std::string_view hex) {
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    hex.remove_prefix(2);
  }

  std::string digits;
  digits.reserve(hex.size());
  for (char c : hex) {
    if (c == ':' || c == '-' || c == ' ') continue;
    if (HexNibble(c) < 0) return std::nullopt;
    digits.push_back(c);
  }
  if (digits.size() % 2 != 0) return std::nullopt;

  Bytes out(digits.size() / 2);
  for (size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<std::uint8_t>((HexNibble(digits[2 * i]) << 4) | HexNibble(digits[2 * i + 1]));
  }
  return out;
}

} // namespace llrp::util
