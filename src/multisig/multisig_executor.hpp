#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "crypto/hash.hpp"
#include "crypto/signer.hpp"
#include "multisig/multisig_wallet.hpp"
#include "primitives/calldata.hpp"

namespace modvault::multisig {

// A call waiting for owner signatures.
struct PendingTransaction {
  primitives::Address wallet{};
  primitives::Address destination{};
  std::uint64_t value{0};
  primitives::CallData data;
  std::uint64_t nonce{0};
  crypto::Sha3_256Hash sign_hash{};
  std::uint32_t threshold{0};
  std::vector<OwnerSignature> signatures;
};

// Collects signatures off-line and submits them to a MultisigWallet.
class MultisigExecutor {
 public:
  explicit MultisigExecutor(MultisigWallet& wallet) : wallet_(wallet) {}

  PendingTransaction Prepare(const primitives::Address& destination, std::uint64_t value,
                             primitives::CallData data) const;

  // Rejects signers that are not owners, repeated signers, and signatures
  // that do not verify over the pending sign hash.
  bool AddSignature(PendingTransaction* pending, OwnerSignature signature,
                    std::string* error) const;
  bool IsReady(const PendingTransaction& pending) const {
    return pending.signatures.size() >= pending.threshold;
  }

  // Sorts the collected signatures by signer and executes. Fails when the
  // wallet nonce moved since Prepare.
  bool Submit(PendingTransaction* pending, const CallExecutor& executor, std::string* error);

  // Prepare, sign with every key and submit in one step.
  bool ExecuteCall(const primitives::Address& destination, std::uint64_t value,
                   primitives::CallData data, std::span<const crypto::SignerKey* const> keys,
                   const CallExecutor& executor, std::string* error);

 private:
  MultisigWallet& wallet_;
};

OwnerSignature SignPending(const PendingTransaction& pending, const crypto::SignerKey& key);

}  // namespace modvault::multisig
