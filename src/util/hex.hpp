#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace modvault::util {

std::string HexEncode(std::span<const std::uint8_t> data);
// Same as HexEncode with a leading "0x"; the form used for addresses and
// encoded calls in tool output.
std::string HexEncodePrefixed(std::span<const std::uint8_t> data);
std::string_view StripHexPrefix(std::string_view hex);
bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out);

}  // namespace modvault::util
