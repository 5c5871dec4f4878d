#pragma once

#include <cstdint>
#include <span>

#include "crypto/hash.hpp"
#include "primitives/address.hpp"

namespace modvault::multisig {

// SHA3-256 over
//   0x19 || 0x00 || wallet || destination || value (32-byte big-endian) ||
//   data || nonce (32-byte big-endian)
// The 0x19 0x00 prefix keeps the digest out of the space of any encoded
// call, and binding the wallet address prevents replay across wallets.
crypto::Sha3_256Hash ComputeSignHash(const primitives::Address& wallet,
                                     const primitives::Address& destination, std::uint64_t value,
                                     std::span<const std::uint8_t> data, std::uint64_t nonce);

}  // namespace modvault::multisig
