#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <span>
#include <string>
#include <vector>

#include "crypto/hash.hpp"
#include "crypto/signer.hpp"
#include "manager/registry.hpp"
#include "manager/version_manager.hpp"
#include "multisig/multisig_executor.hpp"
#include "multisig/multisig_wallet.hpp"
#include "multisig/sign_hash.hpp"
#include "primitives/calldata.hpp"

using namespace modvault;

namespace {

const primitives::Address kWalletAddress = primitives::AddressFromTag(0x5E);
const primitives::Address kDestination = primitives::AddressFromTag(0xD0);

struct Signers {
  Signers() {
    for (int i = 0; i < 3; ++i) {
      keys.push_back(crypto::SignerKey::Generate());
    }
    std::sort(keys.begin(), keys.end(), [](const crypto::SignerKey& a, const crypto::SignerKey& b) {
      return a.address() < b.address();
    });
  }

  std::vector<primitives::Address> Addresses() const {
    std::vector<primitives::Address> out;
    for (const auto& key : keys) out.push_back(key.address());
    return out;
  }

  std::vector<crypto::SignerKey> keys;
};

multisig::OwnerSignature SignWith(const crypto::SignerKey& key,
                                  const crypto::Sha3_256Hash& digest) {
  multisig::OwnerSignature signature;
  signature.signer = key.address();
  const auto public_key = key.PublicKey();
  signature.public_key.assign(public_key.begin(), public_key.end());
  signature.signature = key.Sign(digest);
  return signature;
}

multisig::CallExecutor CountingExecutor(int* calls, bool succeed = true) {
  return [calls, succeed](const primitives::Address&, std::uint64_t, std::span<const std::uint8_t>,
                          std::string* error) {
    ++*calls;
    if (!succeed && error) *error = "destination reverted";
    return succeed;
  };
}

bool TestSignHashLayout() {
  const std::vector<std::uint8_t> data{0xAA, 0xBB};
  std::vector<std::uint8_t> expected_input{0x19, 0x00};
  expected_input.insert(expected_input.end(), kWalletAddress.begin(), kWalletAddress.end());
  expected_input.insert(expected_input.end(), kDestination.begin(), kDestination.end());
  primitives::AppendUint64Word(&expected_input, 7);
  expected_input.insert(expected_input.end(), data.begin(), data.end());
  primitives::AppendUint64Word(&expected_input, 3);
  if (multisig::ComputeSignHash(kWalletAddress, kDestination, 7, data, 3) !=
      crypto::Sha3_256(expected_input)) {
    std::cerr << "multisig_tests: sign hash layout mismatch\n";
    return false;
  }
  if (multisig::ComputeSignHash(kWalletAddress, kDestination, 7, data, 3) ==
      multisig::ComputeSignHash(kWalletAddress, kDestination, 7, data, 4)) {
    std::cerr << "multisig_tests: nonce does not affect sign hash\n";
    return false;
  }
  return true;
}

bool TestCreateValidation() {
  const auto a = primitives::AddressFromTag(1);
  const auto b = primitives::AddressFromTag(2);
  std::string error;
  if (multisig::MultisigWallet::Create(kWalletAddress, {a, b}, 0, &error) ||
      multisig::MultisigWallet::Create(kWalletAddress, {a, b}, 3, &error) ||
      multisig::MultisigWallet::Create(kWalletAddress, {a, a}, 1, &error) ||
      multisig::MultisigWallet::Create(kWalletAddress, {a, primitives::kZeroAddress}, 1, &error)) {
    std::cerr << "multisig_tests: invalid wallet parameters accepted\n";
    return false;
  }
  if (!multisig::MultisigWallet::Create(kWalletAddress, {a, b}, 2, &error)) {
    std::cerr << "multisig_tests: valid wallet rejected: " << error << "\n";
    return false;
  }
  return true;
}

bool TestExecuteRules() {
  Signers signers;
  std::string error;
  auto wallet = multisig::MultisigWallet::Create(kWalletAddress, signers.Addresses(), 2, &error);
  const std::vector<std::uint8_t> data{0x01, 0x02, 0x03};
  const auto digest = multisig::ComputeSignHash(kWalletAddress, kDestination, 0, data, 0);
  const std::vector<multisig::OwnerSignature> sorted{SignWith(signers.keys[0], digest),
                                                     SignWith(signers.keys[2], digest)};
  int calls = 0;

  const std::vector<multisig::OwnerSignature> unsorted{sorted[1], sorted[0]};
  if (wallet->Execute(kDestination, 0, data, unsorted, CountingExecutor(&calls), &error)) {
    std::cerr << "multisig_tests: unsorted signatures accepted\n";
    return false;
  }
  if (wallet->Execute(kDestination, 0, data, std::span(sorted).first(1), CountingExecutor(&calls),
                      &error)) {
    std::cerr << "multisig_tests: below-threshold signatures accepted\n";
    return false;
  }
  if (wallet->Execute(kDestination, 0, data, sorted, CountingExecutor(&calls, false), &error) ||
      wallet->nonce() != 0 || calls != 1) {
    std::cerr << "multisig_tests: failed call advanced the nonce\n";
    return false;
  }
  if (!wallet->Execute(kDestination, 0, data, sorted, CountingExecutor(&calls), &error) ||
      wallet->nonce() != 1 || calls != 2) {
    std::cerr << "multisig_tests: valid execution failed: " << error << "\n";
    return false;
  }
  // Replaying the same signatures fails once the nonce moved.
  if (wallet->Execute(kDestination, 0, data, sorted, CountingExecutor(&calls), &error) ||
      calls != 2) {
    std::cerr << "multisig_tests: replay accepted\n";
    return false;
  }
  return true;
}

bool TestForeignSigner() {
  Signers signers;
  auto outsider = crypto::SignerKey::Generate();
  std::string error;
  auto wallet = multisig::MultisigWallet::Create(kWalletAddress, signers.Addresses(), 1, &error);
  const std::vector<std::uint8_t> data{0x01};
  const auto digest = multisig::ComputeSignHash(kWalletAddress, kDestination, 0, data, 0);
  int calls = 0;
  const std::vector<multisig::OwnerSignature> foreign{SignWith(outsider, digest)};
  if (wallet->Execute(kDestination, 0, data, foreign, CountingExecutor(&calls), &error)) {
    std::cerr << "multisig_tests: non-owner signature accepted\n";
    return false;
  }
  // Owner address with someone else's key.
  auto spoofed = SignWith(outsider, digest);
  spoofed.signer = signers.keys[0].address();
  const std::vector<multisig::OwnerSignature> spoof{spoofed};
  if (wallet->Execute(kDestination, 0, data, spoof, CountingExecutor(&calls), &error) ||
      calls != 0) {
    std::cerr << "multisig_tests: spoofed signer accepted\n";
    return false;
  }
  return true;
}

// The multisig owns the catalog; catalog changes go through collected
// signatures.
bool TestExecutorAdministersCatalog() {
  Signers signers;
  std::string error;
  auto wallet = multisig::MultisigWallet::Create(kWalletAddress, signers.Addresses(), 2, &error);

  manager::InMemoryModuleRegistry registry;
  manager::InMemoryContractDirectory directory;
  manager::WalletOwnershipOracle oracle(directory);
  manager::VersionManager vm(wallet->address(), registry, oracle, directory);
  const auto manager_address = primitives::AddressFromTag(0x33);
  const auto add_storage = primitives::ComputeSelector("addStorage(address)");

  multisig::CallExecutor forward = [&](const primitives::Address& destination, std::uint64_t,
                                       std::span<const std::uint8_t> data, std::string* err) {
    primitives::Selector selector{};
    primitives::Address storage{};
    if (destination != manager_address || !primitives::ReadSelector(data, &selector) ||
        selector != add_storage || !primitives::ReadAddressArg(data, 0, &storage)) {
      if (err) *err = "unsupported call";
      return false;
    }
    manager::Rejection rejection;
    if (!vm.AddStorage(wallet->address(), storage, &rejection)) {
      if (err) *err = manager::DescribeRejection(rejection);
      return false;
    }
    return true;
  };

  multisig::MultisigExecutor executor(*wallet);
  const auto storage = primitives::AddressFromTag(0x5A);
  auto pending = executor.Prepare(
      manager_address, 0, primitives::CallDataBuilder(add_storage).AddAddress(storage).Build());
  if (pending.threshold != 2 || pending.nonce != 0) {
    std::cerr << "multisig_tests: pending transaction header wrong\n";
    return false;
  }
  // Collected out of order; Submit sorts.
  if (!executor.AddSignature(&pending, multisig::SignPending(pending, signers.keys[2]), &error)) {
    std::cerr << "multisig_tests: owner signature rejected: " << error << "\n";
    return false;
  }
  if (executor.AddSignature(&pending, multisig::SignPending(pending, signers.keys[2]), &error)) {
    std::cerr << "multisig_tests: duplicate signer accepted\n";
    return false;
  }
  if (executor.Submit(&pending, forward, &error)) {
    std::cerr << "multisig_tests: submitted below threshold\n";
    return false;
  }
  if (!executor.AddSignature(&pending, multisig::SignPending(pending, signers.keys[1]), &error) ||
      !executor.Submit(&pending, forward, &error)) {
    std::cerr << "multisig_tests: submission failed: " << error << "\n";
    return false;
  }
  if (!vm.catalog().IsStorage(storage) || wallet->nonce() != 1) {
    std::cerr << "multisig_tests: catalog change not applied\n";
    return false;
  }

  // Auto-sign path.
  const auto second = primitives::AddressFromTag(0x5B);
  const std::vector<const crypto::SignerKey*> keys{&signers.keys[0], &signers.keys[1]};
  if (!executor.ExecuteCall(manager_address, 0,
                            primitives::CallDataBuilder(add_storage).AddAddress(second).Build(),
                            keys, forward, &error) ||
      !vm.catalog().IsStorage(second) || wallet->nonce() != 2) {
    std::cerr << "multisig_tests: auto-sign execution failed: " << error << "\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  bool ok = true;
  ok &= TestSignHashLayout();
  ok &= TestCreateValidation();
  ok &= TestExecuteRules();
  ok &= TestForeignSigner();
  ok &= TestExecutorAdministersCatalog();
  if (!ok) {
    return EXIT_FAILURE;
  }
  std::cout << "multisig_tests: OK\n";
  return EXIT_SUCCESS;
}
