#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <unordered_set>
#include <vector>

#include "primitives/address.hpp"

namespace modvault::multisig {

struct OwnerSignature {
  primitives::Address signer{};
  std::vector<std::uint8_t> public_key;
  std::vector<std::uint8_t> signature;
};

// Performs the call once the signatures are accepted. Returning false (or
// throwing) leaves the wallet nonce where it was.
using CallExecutor = std::function<bool(const primitives::Address& destination,
                                        std::uint64_t value,
                                        std::span<const std::uint8_t> data, std::string* error)>;

// k-of-n wallet identity. Typically owns a feature-set catalog: its address
// is the catalog owner and the executor forwards to the manager.
class MultisigWallet {
 public:
  // nullptr when an owner is zero or repeated, or when the threshold is
  // outside [1, owners].
  static std::unique_ptr<MultisigWallet> Create(const primitives::Address& self,
                                                std::vector<primitives::Address> owners,
                                                std::uint32_t threshold, std::string* error);

  const primitives::Address& address() const noexcept { return self_; }
  const std::vector<primitives::Address>& owners() const noexcept { return owners_; }
  std::uint32_t threshold() const noexcept { return threshold_; }
  std::uint64_t nonce() const noexcept { return nonce_; }
  bool IsOwner(const primitives::Address& address) const;

  // Requires at least `threshold` signatures over the sign hash at the
  // current nonce, strictly ascending by signer, each from an owner whose
  // public key hashes to the signer address.
  bool Execute(const primitives::Address& destination, std::uint64_t value,
               std::span<const std::uint8_t> data, std::span<const OwnerSignature> signatures,
               const CallExecutor& executor, std::string* error);

 private:
  MultisigWallet(const primitives::Address& self, std::vector<primitives::Address> owners,
                 std::uint32_t threshold);

  primitives::Address self_;
  std::vector<primitives::Address> owners_;
  std::unordered_set<primitives::Address, primitives::AddressHasher> owner_index_;
  std::uint32_t threshold_{1};
  std::uint64_t nonce_{0};
};

}  // namespace modvault::multisig
