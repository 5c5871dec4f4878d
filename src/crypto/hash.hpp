#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace modvault::crypto {

using Sha3_256Hash = std::array<std::uint8_t, 32>;

// FIPS-202 SHA3-256 backed by liboqs. Used for record checksums, call
// selectors, signer addresses and multisig digests.
Sha3_256Hash Sha3_256(std::span<const std::uint8_t> data);

}  // namespace modvault::crypto
