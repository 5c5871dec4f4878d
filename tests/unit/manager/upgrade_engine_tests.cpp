#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "manager/errors.hpp"
#include "manager/upgrade_engine.hpp"
#include "primitives/calldata.hpp"
#include "tests/unit/manager/test_contracts.hpp"

using namespace modvault;

namespace {

constexpr std::uint8_t kWalletTag = 0x77;
constexpr std::uint8_t kOwnerTag = 0x70;

bool ExpectReason(const manager::Rejection& rejection, manager::RejectReason expected,
                  const char* label) {
  if (rejection.reason != expected) {
    std::cerr << "upgrade_engine_tests: " << label << ": expected "
              << manager::RejectReasonToString(expected) << ", got "
              << manager::DescribeRejection(rejection) << "\n";
    return false;
  }
  return true;
}

bool SameSet(std::vector<primitives::Address> actual, std::vector<primitives::Address> expected) {
  std::sort(actual.begin(), actual.end());
  std::sort(expected.begin(), expected.end());
  return actual == expected;
}

bool TestTwoVersionScenario() {
  test::ManagerHarness h;
  auto* a = h.AddFeature(0x0A);
  auto* b = h.AddFeature(0x0B);
  auto* c = h.AddFeature(0x0C);
  auto* wallet = h.AddWallet(kWalletTag, kOwnerTag);
  const auto account = wallet->address();
  const auto v1 = h.AddVersion({a->address(), b->address()}, {a->address()});
  const auto v2 = h.AddVersion({b->address(), c->address()}, {c->address()});

  manager::UpgradeReport report;
  if (!h.manager.UpgradeAccount(account, v1, wallet->Owner(), &report, nullptr)) {
    std::cerr << "upgrade_engine_tests: 0 -> 1 failed\n";
    return false;
  }
  if (report.from_version != 0 || report.to_version != v1 ||
      !SameSet(report.authorized, {a->address(), b->address()}) ||
      !SameSet(report.initialized, {a->address()}) || !report.deauthorized.empty() ||
      a->InitCalls(account) != 1 || b->InitCalls(account) != 0) {
    std::cerr << "upgrade_engine_tests: 0 -> 1 report wrong\n";
    return false;
  }
  if (!SameSet(h.manager.AuthorizedFeatures(account), {a->address(), b->address()})) {
    std::cerr << "upgrade_engine_tests: version 1 should authorize {A, B}\n";
    return false;
  }

  if (!h.manager.UpgradeAccount(account, v2, wallet->Owner(), &report, nullptr)) {
    std::cerr << "upgrade_engine_tests: 1 -> 2 failed\n";
    return false;
  }
  if (!SameSet(report.authorized, {c->address()}) ||
      !SameSet(report.deauthorized, {a->address()}) ||
      !SameSet(report.initialized, {c->address()}) || c->InitCalls(account) != 1) {
    std::cerr << "upgrade_engine_tests: 1 -> 2 report wrong\n";
    return false;
  }
  if (!SameSet(h.manager.AuthorizedFeatures(account), {b->address(), c->address()}) ||
      h.manager.IsFeatureAuthorized(account, a->address())) {
    std::cerr << "upgrade_engine_tests: version 2 should authorize {B, C}\n";
    return false;
  }

  // Round trip: nothing initializes twice.
  if (!h.manager.UpgradeAccount(account, v1, wallet->Owner(), &report, nullptr) ||
      !report.initialized.empty() ||
      !h.manager.UpgradeAccount(account, v2, wallet->Owner(), &report, nullptr) ||
      !report.initialized.empty()) {
    std::cerr << "upgrade_engine_tests: round trip failed or re-initialized\n";
    return false;
  }
  if (a->InitCalls(account) != 1 || c->InitCalls(account) != 1) {
    std::cerr << "upgrade_engine_tests: setup hooks ran more than once\n";
    return false;
  }
  return true;
}

bool TestAlreadyOnVersionIsNoOp() {
  test::ManagerHarness h;
  auto* a = h.AddFeature(0x0A);
  auto* wallet = h.AddWallet(kWalletTag, kOwnerTag);
  const auto v1 = h.AddVersion({a->address()}, {a->address()});
  h.manager.UpgradeAccount(wallet->address(), v1, wallet->Owner(), nullptr, nullptr);
  const auto before = h.manager.GetAccount(wallet->address());
  manager::Rejection rejection;
  if (h.manager.UpgradeAccount(wallet->address(), v1, wallet->Owner(), nullptr, &rejection) ||
      !ExpectReason(rejection, manager::RejectReason::kAlreadyOnVersion, "same version")) {
    return false;
  }
  const auto after = h.manager.GetAccount(wallet->address());
  if (!before || !after || before->current_version != after->current_version ||
      before->initialized_modules != after->initialized_modules ||
      a->InitCalls(wallet->address()) != 1) {
    std::cerr << "upgrade_engine_tests: AlreadyOnVersion changed state\n";
    return false;
  }
  return true;
}

bool TestInvalidVersionBoundary() {
  test::ManagerHarness h;
  auto* a = h.AddFeature(0x0A);
  auto* wallet = h.AddWallet(kWalletTag, kOwnerTag);
  const auto last = h.AddVersion({a->address()});
  manager::Rejection rejection;
  if (h.manager.UpgradeAccount(wallet->address(), last + 1, wallet->Owner(), nullptr,
                               &rejection) ||
      !ExpectReason(rejection, manager::RejectReason::kInvalidVersion, "last + 1")) {
    return false;
  }
  if (h.manager.UpgradeAccount(wallet->address(), manager::kNoVersion, wallet->Owner(), nullptr,
                               &rejection) ||
      !ExpectReason(rejection, manager::RejectReason::kInvalidVersion, "version 0")) {
    return false;
  }
  if (!h.manager.UpgradeAccount(wallet->address(), last, wallet->Owner(), nullptr, nullptr)) {
    std::cerr << "upgrade_engine_tests: upgrade to last version failed\n";
    return false;
  }
  return true;
}

bool TestFailedHookRollsBack() {
  test::ManagerHarness h;
  auto* a = h.AddFeature(0x0A);
  auto* b = h.AddFeature(0x0B);
  auto* c = h.AddFeature(0x0C);
  auto* wallet = h.AddWallet(kWalletTag, kOwnerTag);
  const auto account = wallet->address();
  const auto v1 = h.AddVersion({a->address()});
  const auto v2 = h.AddVersion({a->address(), b->address(), c->address()},
                               {b->address(), c->address()});
  h.manager.UpgradeAccount(account, v1, wallet->Owner(), nullptr, nullptr);

  c->set_fail_init(true);
  manager::Rejection rejection;
  if (h.manager.UpgradeAccount(account, v2, wallet->Owner(), nullptr, &rejection) ||
      !ExpectReason(rejection, manager::RejectReason::kInitializationFailed, "failing hook") ||
      rejection.subject != c->address()) {
    return false;
  }
  const auto state = h.manager.GetAccount(account);
  if (!state || state->current_version != v1 || state->phase != manager::UpgradePhase::kIdle ||
      !state->initialized_modules.empty()) {
    std::cerr << "upgrade_engine_tests: failed upgrade left partial state\n";
    return false;
  }
  if (h.manager.IsFeatureAuthorized(account, b->address()) ||
      h.manager.IsFeatureAuthorized(account, c->address()) ||
      h.manager.IsLocked(account) || wallet->Owner() != primitives::AddressFromTag(kOwnerTag) ||
      !wallet->invocations().empty()) {
    std::cerr << "upgrade_engine_tests: failed upgrade changed authorization, lock or wallet\n";
    return false;
  }

  // Throwing hooks are failures too.
  c->set_fail_init(false);
  c->set_hook([](const primitives::Address&, std::string*) -> bool {
    throw std::runtime_error("hook exploded");
  });
  if (h.manager.UpgradeAccount(account, v2, wallet->Owner(), nullptr, &rejection) ||
      !ExpectReason(rejection, manager::RejectReason::kInitializationFailed, "throwing hook") ||
      h.manager.AccountVersion(account) != v1) {
    return false;
  }

  c->set_hook(nullptr);
  manager::UpgradeReport report;
  if (!h.manager.UpgradeAccount(account, v2, wallet->Owner(), &report, nullptr) ||
      !SameSet(report.initialized, {b->address(), c->address()})) {
    std::cerr << "upgrade_engine_tests: retry after fix failed\n";
    return false;
  }
  return true;
}

// A hook of a module the account is upgrading to cannot reach the wallet or
// the lock, and anything an existing module changed mid-upgrade is undone
// when a later hook fails.
bool TestHookSideEffectsUndoneOnFailure() {
  test::ManagerHarness h;
  auto* a = h.AddFeature(0x0A);
  auto* b = h.AddFeature(0x0B);
  auto* c = h.AddFeature(0x0C);
  auto* wallet = h.AddWallet(kWalletTag, kOwnerTag);
  const auto account = wallet->address();
  const auto original_owner = wallet->Owner();
  const auto v1 = h.AddVersion({a->address()});
  const auto v2 = h.AddVersion({a->address(), b->address(), c->address()},
                               {b->address(), c->address()});
  h.manager.UpgradeAccount(account, v1, original_owner, nullptr, nullptr);

  manager::Rejection owner_change;
  manager::Rejection lock_change;
  manager::Rejection wallet_call;
  bool owner_result = true;
  bool lock_result = true;
  bool wallet_result = true;
  bool existing_lock_result = false;
  b->set_hook([&](const primitives::Address& target, std::string*) {
    owner_result = h.manager.SetOwner(target, b->address(), primitives::AddressFromTag(0xEE),
                                      manager::CallContext::kMutating, &owner_change);
    lock_result = h.manager.SetLock(target, b->address(), true, manager::CallContext::kMutating,
                                    &lock_change);
    wallet_result = h.manager.InvokeWallet(target, b->address(), primitives::AddressFromTag(0x99),
                                           1, {}, manager::CallContext::kMutating, nullptr,
                                           &wallet_call);
    existing_lock_result = h.manager.SetLock(target, a->address(), true,
                                             manager::CallContext::kMutating, nullptr);
    return true;
  });
  c->set_fail_init(true);

  manager::Rejection rejection;
  if (h.manager.UpgradeAccount(account, v2, original_owner, nullptr, &rejection) ||
      !ExpectReason(rejection, manager::RejectReason::kInitializationFailed, "failing hook")) {
    return false;
  }
  if (owner_result || lock_result || wallet_result ||
      !ExpectReason(owner_change, manager::RejectReason::kUpgradeInProgress, "owner change") ||
      !ExpectReason(lock_change, manager::RejectReason::kUpgradeInProgress, "lock change") ||
      !ExpectReason(wallet_call, manager::RejectReason::kUpgradeInProgress, "wallet call")) {
    std::cerr << "upgrade_engine_tests: incoming module acted on the wallet mid-upgrade\n";
    return false;
  }
  if (!existing_lock_result) {
    std::cerr << "upgrade_engine_tests: existing module could not lock mid-upgrade\n";
    return false;
  }
  if (h.manager.AccountVersion(account) != v1 || h.manager.IsLocked(account) ||
      wallet->Owner() != original_owner || !wallet->invocations().empty()) {
    std::cerr << "upgrade_engine_tests: side effects survived the failed upgrade\n";
    return false;
  }

  // The original owner can still finish the upgrade.
  b->set_hook(nullptr);
  c->set_fail_init(false);
  if (!h.manager.UpgradeAccount(account, v2, original_owner, nullptr, &rejection)) {
    std::cerr << "upgrade_engine_tests: retry by original owner failed: "
              << manager::DescribeRejection(rejection) << "\n";
    return false;
  }
  return true;
}

bool TestFailedFirstUpgradeLeavesNoRecord() {
  test::ManagerHarness h;
  auto* a = h.AddFeature(0x0A);
  auto* wallet = h.AddWallet(kWalletTag, kOwnerTag);
  const auto v1 = h.AddVersion({a->address()}, {a->address()});
  a->set_fail_init(true);

  if (h.manager.UpgradeAccount(wallet->address(), v1, wallet->Owner(), nullptr, nullptr)) {
    std::cerr << "upgrade_engine_tests: upgrade with failing hook succeeded\n";
    return false;
  }
  if (h.manager.GetAccount(wallet->address()).has_value() ||
      !h.manager.ExportSnapshot().accounts.empty()) {
    std::cerr << "upgrade_engine_tests: failed first upgrade left an account record\n";
    return false;
  }
  return true;
}

bool TestRequesterAuthority() {
  test::ManagerHarness h;
  auto* a = h.AddFeature(0x0A);
  auto* b = h.AddFeature(0x0B);
  auto* wallet = h.AddWallet(kWalletTag, kOwnerTag);
  const auto account = wallet->address();
  const auto v1 = h.AddVersion({a->address()});
  const auto v2 = h.AddVersion({b->address()});
  manager::Rejection rejection;
  if (h.manager.UpgradeAccount(account, v1, primitives::AddressFromTag(0x99), nullptr,
                               &rejection) ||
      !ExpectReason(rejection, manager::RejectReason::kNotOwnerAuthority, "stranger")) {
    return false;
  }
  h.manager.UpgradeAccount(account, v1, wallet->Owner(), nullptr, nullptr);
  // An authorized feature may move its account to another version.
  if (!h.manager.UpgradeAccount(account, v2, a->address(), nullptr, &rejection)) {
    std::cerr << "upgrade_engine_tests: feature-driven upgrade refused: "
              << manager::DescribeRejection(rejection) << "\n";
    return false;
  }
  if (h.manager.UpgradeAccount(account, v1, a->address(), nullptr, &rejection) ||
      !ExpectReason(rejection, manager::RejectReason::kNotOwnerAuthority, "deauthorized feature")) {
    return false;
  }
  return true;
}

bool TestLockedAccountCannotUpgrade() {
  test::ManagerHarness h;
  auto* a = h.AddFeature(0x0A);
  auto* wallet = h.AddWallet(kWalletTag, kOwnerTag);
  const auto v1 = h.AddVersion({a->address()});
  const auto v2 = h.AddVersion({a->address()});
  h.manager.UpgradeAccount(wallet->address(), v1, wallet->Owner(), nullptr, nullptr);
  h.manager.SetLock(wallet->address(), a->address(), true, manager::CallContext::kMutating,
                    nullptr);
  manager::Rejection rejection;
  if (h.manager.UpgradeAccount(wallet->address(), v2, wallet->Owner(), nullptr, &rejection) ||
      !ExpectReason(rejection, manager::RejectReason::kAccountLocked, "locked")) {
    return false;
  }
  h.manager.SetLock(wallet->address(), a->address(), false, manager::CallContext::kMutating,
                    nullptr);
  if (!h.manager.UpgradeAccount(wallet->address(), v2, wallet->Owner(), nullptr, nullptr)) {
    std::cerr << "upgrade_engine_tests: upgrade after unlock failed\n";
    return false;
  }
  return true;
}

// Setup hooks run with the account already on the target version: they may
// use the manager for the account, but may not start another upgrade.
bool TestHookReentry() {
  test::ManagerHarness h;
  auto* a = h.AddFeature(0x0A);
  auto* storage = h.AddStorage(0x5A);
  auto* wallet = h.AddWallet(kWalletTag, kOwnerTag);
  const auto account = wallet->address();
  const auto v1 = h.AddVersion({a->address()}, {a->address()});
  const auto v2 = h.AddVersion({a->address()});

  manager::VersionId seen_version = 0;
  manager::Rejection nested;
  bool nested_result = true;
  bool storage_result = false;
  a->set_hook([&](const primitives::Address& target, std::string*) {
    seen_version = h.manager.AccountVersion(target);
    const auto call = primitives::CallDataBuilder("setGuardian(address,address)")
                          .AddAddress(target)
                          .AddAddress(primitives::AddressFromTag(0x61))
                          .Build();
    storage_result = h.manager.InvokeStorage(target, a->address(), storage->address(), call,
                                             manager::CallContext::kMutating, nullptr);
    nested_result = h.manager.UpgradeAccount(target, v2, wallet->Owner(), nullptr, &nested);
    return true;
  });

  if (!h.manager.UpgradeAccount(account, v1, wallet->Owner(), nullptr, nullptr)) {
    std::cerr << "upgrade_engine_tests: outer upgrade failed\n";
    return false;
  }
  if (seen_version != v1) {
    std::cerr << "upgrade_engine_tests: hook saw version " << seen_version << "\n";
    return false;
  }
  if (!storage_result || storage->calls().size() != 1) {
    std::cerr << "upgrade_engine_tests: hook could not write storage\n";
    return false;
  }
  if (nested_result ||
      !ExpectReason(nested, manager::RejectReason::kUpgradeInProgress, "nested upgrade")) {
    return false;
  }
  if (h.manager.AccountVersion(account) != v1) {
    std::cerr << "upgrade_engine_tests: nested upgrade changed the version\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  bool ok = true;
  ok &= TestTwoVersionScenario();
  ok &= TestAlreadyOnVersionIsNoOp();
  ok &= TestInvalidVersionBoundary();
  ok &= TestFailedHookRollsBack();
  ok &= TestHookSideEffectsUndoneOnFailure();
  ok &= TestFailedFirstUpgradeLeavesNoRecord();
  ok &= TestRequesterAuthority();
  ok &= TestLockedAccountCannotUpgrade();
  ok &= TestHookReentry();
  if (!ok) {
    return EXIT_FAILURE;
  }
  std::cout << "upgrade_engine_tests: OK\n";
  return EXIT_SUCCESS;
}
