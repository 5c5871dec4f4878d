#include "primitives/calldata.hpp"

#include <algorithm>

#include "crypto/hash.hpp"

namespace modvault::primitives {

namespace {

constexpr std::size_t kAddressPadding = kWordSize - kAddressSize;

bool WordAt(std::span<const std::uint8_t> data, std::size_t index,
            std::span<const std::uint8_t>* word) {
  const std::size_t offset = kSelectorSize + index * kWordSize;
  if (offset > data.size() || data.size() - offset < kWordSize) {
    return false;
  }
  *word = data.subspan(offset, kWordSize);
  return true;
}

}  // namespace

Selector ComputeSelector(std::string_view signature) {
  const auto digest = crypto::Sha3_256(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(signature.data()), signature.size()));
  Selector selector{};
  std::copy_n(digest.begin(), selector.size(), selector.begin());
  return selector;
}

bool ReadSelector(std::span<const std::uint8_t> data, Selector* out) {
  if (data.size() < kSelectorSize) {
    return false;
  }
  std::copy_n(data.begin(), kSelectorSize, out->begin());
  return true;
}

bool ReadAddressArg(std::span<const std::uint8_t> data, std::size_t index, Address* out) {
  std::span<const std::uint8_t> word;
  if (!WordAt(data, index, &word)) {
    return false;
  }
  for (std::size_t i = 0; i < kAddressPadding; ++i) {
    if (word[i] != 0) {
      return false;
    }
  }
  std::copy_n(word.begin() + kAddressPadding, kAddressSize, out->begin());
  return true;
}

bool ReadUint64Arg(std::span<const std::uint8_t> data, std::size_t index, std::uint64_t* out) {
  std::span<const std::uint8_t> word;
  if (!WordAt(data, index, &word)) {
    return false;
  }
  for (std::size_t i = 0; i < kWordSize - 8; ++i) {
    if (word[i] != 0) {
      return false;
    }
  }
  std::uint64_t value = 0;
  for (std::size_t i = kWordSize - 8; i < kWordSize; ++i) {
    value = (value << 8) | word[i];
  }
  *out = value;
  return true;
}

void AppendAddressWord(CallData* out, const Address& address) {
  out->insert(out->end(), kAddressPadding, 0);
  out->insert(out->end(), address.begin(), address.end());
}

void AppendUint64Word(CallData* out, std::uint64_t value) {
  out->insert(out->end(), kWordSize - 8, 0);
  for (int i = 7; i >= 0; --i) {
    out->push_back(static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF));
  }
}

CallDataBuilder::CallDataBuilder(const Selector& selector)
    : data_(selector.begin(), selector.end()) {}

CallDataBuilder::CallDataBuilder(std::string_view signature)
    : CallDataBuilder(ComputeSelector(signature)) {}

CallDataBuilder& CallDataBuilder::AddAddress(const Address& value) {
  AppendAddressWord(&data_, value);
  return *this;
}

CallDataBuilder& CallDataBuilder::AddUint64(std::uint64_t value) {
  AppendUint64Word(&data_, value);
  return *this;
}

CallDataBuilder& CallDataBuilder::AddBool(bool value) {
  AppendUint64Word(&data_, value ? 1 : 0);
  return *this;
}

}  // namespace modvault::primitives
