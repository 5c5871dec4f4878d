#include "util/hex.hpp"

namespace modvault::util {

namespace {

constexpr char kHexLower[] = "0123456789abcdef";

int FromHexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

void AppendHex(std::span<const std::uint8_t> data, std::string* out) {
  for (const auto byte : data) {
    out->push_back(kHexLower[(byte >> 4) & 0x0F]);
    out->push_back(kHexLower[byte & 0x0F]);
  }
}

}  // namespace

std::string HexEncode(std::span<const std::uint8_t> data) {
  std::string out;
  out.reserve(data.size() * 2);
  AppendHex(data, &out);
  return out;
}

std::string HexEncodePrefixed(std::span<const std::uint8_t> data) {
  std::string out;
  out.reserve(2 + data.size() * 2);
  out.append("0x");
  AppendHex(data, &out);
  return out;
}

std::string_view StripHexPrefix(std::string_view hex) {
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
    hex.remove_prefix(2);
  }
  return hex;
}

bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out) {
  if (out == nullptr || hex.size() % 2 != 0) {
    return false;
  }
  out->clear();
  out->reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int hi = FromHexDigit(hex[i]);
    const int lo = FromHexDigit(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      out->clear();
      return false;
    }
    out->push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return true;
}

}  // namespace modvault::util
