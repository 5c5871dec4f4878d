#include "multisig/sign_hash.hpp"

#include <vector>

#include "primitives/calldata.hpp"

namespace modvault::multisig {

crypto::Sha3_256Hash ComputeSignHash(const primitives::Address& wallet,
                                     const primitives::Address& destination, std::uint64_t value,
                                     std::span<const std::uint8_t> data, std::uint64_t nonce) {
  std::vector<std::uint8_t> input;
  input.reserve(2 + 2 * primitives::kAddressSize + 2 * primitives::kWordSize + data.size());
  input.push_back(0x19);
  input.push_back(0x00);
  input.insert(input.end(), wallet.begin(), wallet.end());
  input.insert(input.end(), destination.begin(), destination.end());
  primitives::AppendUint64Word(&input, value);
  input.insert(input.end(), data.begin(), data.end());
  primitives::AppendUint64Word(&input, nonce);
  return crypto::Sha3_256(input);
}

}  // namespace modvault::multisig
