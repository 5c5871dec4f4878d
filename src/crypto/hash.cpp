#include "crypto/hash.hpp"

#include <oqs/sha3.h>

namespace modvault::crypto {

Sha3_256Hash Sha3_256(std::span<const std::uint8_t> data) {
  Sha3_256Hash digest{};
  OQS_SHA3_sha3_256(digest.data(), data.data(), data.size());
  return digest;
}

}  // namespace modvault::crypto
