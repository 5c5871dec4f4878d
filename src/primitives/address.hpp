#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace modvault::primitives {

inline constexpr std::size_t kAddressSize = 20;

using Address = std::array<std::uint8_t, kAddressSize>;

inline constexpr Address kZeroAddress{};

struct AddressHasher {
  std::size_t operator()(const Address& address) const noexcept {
    std::size_t result = 0;
    for (auto byte : address) {
      result = (result * 131) ^ static_cast<std::size_t>(byte);
    }
    return result;
  }
};

inline bool IsZeroAddress(const Address& address) noexcept { return address == kZeroAddress; }

// Renders as 0x-prefixed lowercase hex.
std::string AddressToHex(const Address& address);

// Accepts 40 hex digits with or without a 0x prefix.
bool ParseAddress(std::string_view text, Address* out);

// Deterministic test/tool helper: the address whose last byte is `tag`.
Address AddressFromTag(std::uint8_t tag);

}  // namespace modvault::primitives
