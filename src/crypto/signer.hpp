#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include <oqs/oqs.h>

#include "primitives/address.hpp"

namespace modvault::crypto {

inline constexpr std::string_view kSignerAlgorithm = OQS_SIG_alg_ml_dsa_65;

// ML-DSA-65 key pair held by a multisig owner. The secret key is wiped on
// destruction.
class SignerKey {
 public:
  SignerKey() = default;
  ~SignerKey();
  SignerKey(const SignerKey&) = delete;
  SignerKey& operator=(const SignerKey&) = delete;
  SignerKey(SignerKey&&) noexcept;
  SignerKey& operator=(SignerKey&&) noexcept;

  static SignerKey Generate();
  static SignerKey Import(std::span<const std::uint8_t> secret_key,
                         std::span<const std::uint8_t> public_key);

  std::vector<std::uint8_t> Sign(std::span<const std::uint8_t> message) const;

  std::span<const std::uint8_t> PublicKey() const noexcept { return public_key_; }
  primitives::Address address() const;

 private:
  SignerKey(std::vector<std::uint8_t> secret_key, std::vector<std::uint8_t> public_key);

  std::vector<std::uint8_t> secret_key_;
  std::vector<std::uint8_t> public_key_;
};

std::size_t SignerPublicKeySize();
std::size_t SignerSignatureSize();

// False on any size mismatch or failed verification.
bool VerifySignature(std::span<const std::uint8_t> message,
                     std::span<const std::uint8_t> signature,
                     std::span<const std::uint8_t> public_key);

// Last 20 bytes of SHA3-256(public key).
primitives::Address AddressFromPublicKey(std::span<const std::uint8_t> public_key);

}  // namespace modvault::crypto
