#include "multisig/multisig_wallet.hpp"

#include <exception>
#include <utility>

#include "crypto/signer.hpp"
#include "multisig/sign_hash.hpp"
#include "util/log.hpp"

namespace modvault::multisig {

namespace {

bool Fail(std::string* error, std::string message) {
  util::LogWarn("multisig", message);
  if (error) *error = std::move(message);
  return false;
}

}  // namespace

std::unique_ptr<MultisigWallet> MultisigWallet::Create(const primitives::Address& self,
                                                       std::vector<primitives::Address> owners,
                                                       std::uint32_t threshold,
                                                       std::string* error) {
  if (primitives::IsZeroAddress(self)) {
    if (error) *error = "wallet address is zero";
    return nullptr;
  }
  std::unordered_set<primitives::Address, primitives::AddressHasher> seen;
  for (const auto& owner : owners) {
    if (primitives::IsZeroAddress(owner)) {
      if (error) *error = "owner address is zero";
      return nullptr;
    }
    if (!seen.insert(owner).second) {
      if (error) *error = "duplicate owner " + primitives::AddressToHex(owner);
      return nullptr;
    }
  }
  if (threshold == 0 || threshold > owners.size()) {
    if (error) {
      *error = "threshold " + std::to_string(threshold) + " out of range for " +
               std::to_string(owners.size()) + " owners";
    }
    return nullptr;
  }
  return std::unique_ptr<MultisigWallet>(new MultisigWallet(self, std::move(owners), threshold));
}

MultisigWallet::MultisigWallet(const primitives::Address& self,
                               std::vector<primitives::Address> owners, std::uint32_t threshold)
    : self_(self),
      owners_(std::move(owners)),
      owner_index_(owners_.begin(), owners_.end()),
      threshold_(threshold) {}

bool MultisigWallet::IsOwner(const primitives::Address& address) const {
  return owner_index_.count(address) != 0;
}

bool MultisigWallet::Execute(const primitives::Address& destination, std::uint64_t value,
                             std::span<const std::uint8_t> data,
                             std::span<const OwnerSignature> signatures,
                             const CallExecutor& executor, std::string* error) {
  if (signatures.size() < threshold_) {
    return Fail(error, "wrong number of signatures: have " + std::to_string(signatures.size()) +
                           ", need " + std::to_string(threshold_));
  }
  const auto digest = ComputeSignHash(self_, destination, value, data, nonce_);
  for (std::size_t i = 0; i < signatures.size(); ++i) {
    const auto& entry = signatures[i];
    if (i > 0 && !(signatures[i - 1].signer < entry.signer)) {
      return Fail(error, "signatures not sorted by signer");
    }
    if (!IsOwner(entry.signer)) {
      return Fail(error, "signer " + primitives::AddressToHex(entry.signer) + " is not an owner");
    }
    if (crypto::AddressFromPublicKey(entry.public_key) != entry.signer) {
      return Fail(error, "public key does not match signer " +
                             primitives::AddressToHex(entry.signer));
    }
    if (!crypto::VerifySignature(digest, entry.signature, entry.public_key)) {
      return Fail(error, "invalid signature from " + primitives::AddressToHex(entry.signer));
    }
  }
  if (!executor) {
    return Fail(error, "no executor");
  }
  std::string call_error;
  bool ok = false;
  try {
    ok = executor(destination, value, data, &call_error);
  } catch (const std::exception& ex) {
    call_error = ex.what();
    ok = false;
  }
  if (!ok) {
    return Fail(error, "call to " + primitives::AddressToHex(destination) +
                           " failed: " + call_error);
  }
  util::LogInfo("multisig", primitives::AddressToHex(self_) + " executed nonce " +
                                std::to_string(nonce_) + " to " +
                                primitives::AddressToHex(destination));
  ++nonce_;
  return true;
}

}  // namespace modvault::multisig
