#include "multisig/multisig_executor.hpp"

#include <algorithm>
#include <utility>

#include "multisig/sign_hash.hpp"
#include "util/log.hpp"

namespace modvault::multisig {

PendingTransaction MultisigExecutor::Prepare(const primitives::Address& destination,
                                             std::uint64_t value,
                                             primitives::CallData data) const {
  PendingTransaction pending;
  pending.wallet = wallet_.address();
  pending.destination = destination;
  pending.value = value;
  pending.data = std::move(data);
  pending.nonce = wallet_.nonce();
  pending.threshold = wallet_.threshold();
  pending.sign_hash =
      ComputeSignHash(pending.wallet, destination, value, pending.data, pending.nonce);
  util::LogDebug("multisig", "prepared call to " + primitives::AddressToHex(destination) +
                                 " nonce " + std::to_string(pending.nonce) + ", " +
                                 std::to_string(pending.threshold) + " signatures required");
  return pending;
}

bool MultisigExecutor::AddSignature(PendingTransaction* pending, OwnerSignature signature,
                                    std::string* error) const {
  if (!wallet_.IsOwner(signature.signer)) {
    if (error) *error = "signer " + primitives::AddressToHex(signature.signer) + " is not an owner";
    return false;
  }
  const bool duplicate =
      std::any_of(pending->signatures.begin(), pending->signatures.end(),
                  [&](const OwnerSignature& existing) { return existing.signer == signature.signer; });
  if (duplicate) {
    if (error) *error = "duplicate signature from " + primitives::AddressToHex(signature.signer);
    return false;
  }
  if (crypto::AddressFromPublicKey(signature.public_key) != signature.signer ||
      !crypto::VerifySignature(pending->sign_hash, signature.signature, signature.public_key)) {
    if (error) *error = "invalid signature from " + primitives::AddressToHex(signature.signer);
    return false;
  }
  pending->signatures.push_back(std::move(signature));
  return true;
}

bool MultisigExecutor::Submit(PendingTransaction* pending, const CallExecutor& executor,
                              std::string* error) {
  if (pending->wallet != wallet_.address() || pending->nonce != wallet_.nonce()) {
    if (error) *error = "stale transaction: wallet nonce is " + std::to_string(wallet_.nonce());
    return false;
  }
  if (!IsReady(*pending)) {
    if (error) {
      *error = "need " + std::to_string(pending->threshold) + " signatures, have " +
               std::to_string(pending->signatures.size());
    }
    return false;
  }
  std::sort(pending->signatures.begin(), pending->signatures.end(),
            [](const OwnerSignature& a, const OwnerSignature& b) { return a.signer < b.signer; });
  return wallet_.Execute(pending->destination, pending->value, pending->data,
                         pending->signatures, executor, error);
}

bool MultisigExecutor::ExecuteCall(const primitives::Address& destination, std::uint64_t value,
                                   primitives::CallData data,
                                   std::span<const crypto::SignerKey* const> keys,
                                   const CallExecutor& executor, std::string* error) {
  PendingTransaction pending = Prepare(destination, value, std::move(data));
  for (const auto* key : keys) {
    if (!AddSignature(&pending, SignPending(pending, *key), error)) {
      return false;
    }
  }
  return Submit(&pending, executor, error);
}

OwnerSignature SignPending(const PendingTransaction& pending, const crypto::SignerKey& key) {
  OwnerSignature signature;
  signature.signer = key.address();
  const auto public_key = key.PublicKey();
  signature.public_key.assign(public_key.begin(), public_key.end());
  signature.signature = key.Sign(pending.sign_hash);
  return signature;
}

}  // namespace modvault::multisig
