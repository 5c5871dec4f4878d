#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "primitives/address.hpp"

namespace modvault::primitives {

// Encoded calls follow the word layout wallets and storages agree on:
//   selector (4 bytes) || arg0 (32 bytes) || arg1 (32 bytes) || ...
// Addresses sit right-aligned in their word; integers are big-endian.
inline constexpr std::size_t kSelectorSize = 4;
inline constexpr std::size_t kWordSize = 32;

using Selector = std::array<std::uint8_t, kSelectorSize>;
using CallData = std::vector<std::uint8_t>;

struct SelectorHasher {
  std::size_t operator()(const Selector& selector) const noexcept {
    return static_cast<std::size_t>(selector[0]) |
           (static_cast<std::size_t>(selector[1]) << 8) |
           (static_cast<std::size_t>(selector[2]) << 16) |
           (static_cast<std::size_t>(selector[3]) << 24);
  }
};

// First four bytes of SHA3-256 over the canonical method signature,
// e.g. "setLock(address,uint256)".
Selector ComputeSelector(std::string_view signature);

bool ReadSelector(std::span<const std::uint8_t> data, Selector* out);

// Reads argument word `index` as an address. Fails when the word is
// missing or its upper 12 bytes are not zero.
bool ReadAddressArg(std::span<const std::uint8_t> data, std::size_t index, Address* out);

// Reads argument word `index` as an unsigned integer that must fit in 64 bits.
bool ReadUint64Arg(std::span<const std::uint8_t> data, std::size_t index, std::uint64_t* out);

void AppendAddressWord(CallData* out, const Address& address);
void AppendUint64Word(CallData* out, std::uint64_t value);

class CallDataBuilder {
 public:
  explicit CallDataBuilder(const Selector& selector);
  explicit CallDataBuilder(std::string_view signature);

  CallDataBuilder& AddAddress(const Address& value);
  CallDataBuilder& AddUint64(std::uint64_t value);
  CallDataBuilder& AddBool(bool value);

  CallData Build() const { return data_; }

 private:
  CallData data_;
};

}  // namespace modvault::primitives
