#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "manager/errors.hpp"
#include "primitives/calldata.hpp"
#include "tests/unit/manager/test_contracts.hpp"

using namespace modvault;

namespace {

constexpr std::uint8_t kWalletTag = 0x77;
constexpr std::uint8_t kOwnerTag = 0x70;

bool ExpectReason(const manager::Rejection& rejection, manager::RejectReason expected,
                  const char* label) {
  if (rejection.reason != expected) {
    std::cerr << "wallet_forwarding_tests: " << label << ": expected "
              << manager::RejectReasonToString(expected) << ", got "
              << manager::DescribeRejection(rejection) << "\n";
    return false;
  }
  return true;
}

bool TestInvokeWallet() {
  test::ManagerHarness h;
  auto* a = h.AddFeature(0x0A);
  auto* outsider = h.AddFeature(0x0E);
  auto* wallet = h.AddWallet(kWalletTag, kOwnerTag);
  h.manager.UpgradeAccount(wallet->address(), h.AddVersion({a->address()}), wallet->Owner(),
                           nullptr, nullptr);
  const auto target = primitives::AddressFromTag(0x99);
  const auto data = primitives::CallDataBuilder("transfer(address,uint256)")
                        .AddAddress(target)
                        .AddUint64(1000)
                        .Build();
  std::vector<std::uint8_t> result;
  manager::Rejection rejection;
  if (!h.manager.InvokeWallet(wallet->address(), a->address(), target, 5, data,
                              manager::CallContext::kMutating, &result, &rejection)) {
    std::cerr << "wallet_forwarding_tests: invoke refused: "
              << manager::DescribeRejection(rejection) << "\n";
    return false;
  }
  if (wallet->invocations().size() != 1 || wallet->invocations()[0].target != target ||
      wallet->invocations()[0].value != 5 || wallet->invocations()[0].data != data ||
      result != std::vector<std::uint8_t>{0x01}) {
    std::cerr << "wallet_forwarding_tests: invocation not forwarded intact\n";
    return false;
  }
  if (h.manager.InvokeWallet(wallet->address(), outsider->address(), target, 0, data,
                             manager::CallContext::kMutating, nullptr, &rejection) ||
      !ExpectReason(rejection, manager::RejectReason::kModuleNotAuthorized, "outsider")) {
    return false;
  }
  wallet->set_fail(true);
  if (h.manager.InvokeWallet(wallet->address(), a->address(), target, 0, data,
                             manager::CallContext::kMutating, nullptr, &rejection) ||
      !ExpectReason(rejection, manager::RejectReason::kWalletCallFailed, "reverting call")) {
    return false;
  }
  return wallet->invocations().size() == 1;
}

bool TestSetOwner() {
  test::ManagerHarness h;
  auto* a = h.AddFeature(0x0A);
  auto* wallet = h.AddWallet(kWalletTag, kOwnerTag);
  h.manager.UpgradeAccount(wallet->address(), h.AddVersion({a->address()}), wallet->Owner(),
                           nullptr, nullptr);
  manager::Rejection rejection;
  if (h.manager.SetOwner(wallet->address(), a->address(), primitives::kZeroAddress,
                         manager::CallContext::kMutating, &rejection) ||
      !ExpectReason(rejection, manager::RejectReason::kInvalidOwner, "zero owner")) {
    return false;
  }
  const auto new_owner = primitives::AddressFromTag(0x71);
  if (!h.manager.SetOwner(wallet->address(), a->address(), new_owner,
                          manager::CallContext::kMutating, &rejection) ||
      wallet->Owner() != new_owner) {
    std::cerr << "wallet_forwarding_tests: owner change failed\n";
    return false;
  }
  // The previous owner loses upgrade authority with the key.
  const auto v2 = h.AddVersion({a->address()});
  if (h.manager.UpgradeAccount(wallet->address(), v2, primitives::AddressFromTag(kOwnerTag),
                               nullptr, &rejection) ||
      !ExpectReason(rejection, manager::RejectReason::kNotOwnerAuthority, "old owner")) {
    return false;
  }
  return h.manager.UpgradeAccount(wallet->address(), v2, new_owner, nullptr, nullptr);
}

bool TestMissingWallet() {
  test::ManagerHarness h;
  auto* a = h.AddFeature(0x0A);
  auto* wallet = h.AddWallet(kWalletTag, kOwnerTag);
  h.manager.UpgradeAccount(wallet->address(), h.AddVersion({a->address()}), wallet->Owner(),
                           nullptr, nullptr);
  // A second manager sharing the catalog state through a snapshot, but with
  // an empty directory.
  manager::InMemoryModuleRegistry registry;
  registry.RegisterModule(a->address(), "a", nullptr);
  manager::InMemoryContractDirectory directory;
  manager::WalletOwnershipOracle oracle(directory);
  manager::VersionManager detached(h.owner, registry, oracle, directory);
  std::string error;
  if (!detached.RestoreSnapshot(h.manager.ExportSnapshot(), &error)) {
    std::cerr << "wallet_forwarding_tests: restore failed: " << error << "\n";
    return false;
  }
  manager::Rejection rejection;
  if (detached.InvokeWallet(wallet->address(), a->address(), primitives::AddressFromTag(1), 0,
                            std::vector<std::uint8_t>{}, manager::CallContext::kMutating, nullptr,
                            &rejection) ||
      !ExpectReason(rejection, manager::RejectReason::kWalletNotFound, "no proxy")) {
    return false;
  }
  return true;
}

}  // namespace

int main() {
  bool ok = true;
  ok &= TestInvokeWallet();
  ok &= TestSetOwner();
  ok &= TestMissingWallet();
  if (!ok) {
    return EXIT_FAILURE;
  }
  std::cout << "wallet_forwarding_tests: OK\n";
  return EXIT_SUCCESS;
}
