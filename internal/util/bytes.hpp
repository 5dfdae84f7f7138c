#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace llrp::util {

/*
  Byte helpers

  Raw wire data is carried as std::vector<uint8_t>. EPCs and opaque
  payloads are formatted as upper-case hex for logs and the CLI.
*/

using Bytes = std::vector<std::uint8_t>;

std::string ToHex(const Bytes& bytes);

// Accepts upper or lower case; an optional "0x" prefix and ':' / '-' / ' '
// separators are ignored. Returns nullopt on odd length or non-hex input.
std::optional<Bytes> FromHex(std::string_view hex);

} // namespace llrp::util
