#include "primitives/address.hpp"

#include <algorithm>
#include <span>
#include <vector>

#include "util/hex.hpp"

namespace modvault::primitives {

std::string AddressToHex(const Address& address) {
  return util::HexEncodePrefixed(std::span<const std::uint8_t>(address.data(), address.size()));
}

bool ParseAddress(std::string_view text, Address* out) {
  if (out == nullptr) {
    return false;
  }
  std::vector<std::uint8_t> bytes;
  if (!util::HexDecode(util::StripHexPrefix(text), &bytes)) {
    return false;
  }
  if (bytes.size() != kAddressSize) {
    return false;
  }
  std::copy(bytes.begin(), bytes.end(), out->begin());
  return true;
}

Address AddressFromTag(std::uint8_t tag) {
  Address address{};
  address[kAddressSize - 1] = tag;
  return address;
}

}  // namespace modvault::primitives
