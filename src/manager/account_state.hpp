#pragma once

#include <cstddef>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "manager/errors.hpp"
#include "manager/feature_set.hpp"
#include "primitives/address.hpp"

namespace modvault::manager {

enum class UpgradePhase {
  kIdle,
  kUpgrading,
};

const char* UpgradePhaseToString(UpgradePhase phase);

using ModuleSet = std::unordered_set<primitives::Address, primitives::AddressHasher>;

struct AccountState {
  VersionId current_version{kNoVersion};
  bool locked{false};
  UpgradePhase phase{UpgradePhase::kIdle};
  // Every module whose setup hook ever ran for this account, whatever
  // version it ran under.
  ModuleSet initialized_modules;
};

// Cheap copy of the fields the authorization path needs.
struct AccountSummary {
  VersionId current_version{kNoVersion};
  bool locked{false};
  UpgradePhase phase{UpgradePhase::kIdle};
  // Version the account is leaving; only meaningful while Upgrading.
  VersionId previous_version{kNoVersion};
};

// Per-account records, created by the first successful upgrade and never
// removed. The lock is only held for the duration of each call, never across
// calls out to modules, so setup hooks may re-enter the manager.
class AccountBook {
 public:
  AccountBook() = default;
  AccountBook(const AccountBook&) = delete;
  AccountBook& operator=(const AccountBook&) = delete;

  // Unknown accounts summarize as version 0, unlocked, idle.
  AccountSummary Summary(const primitives::Address& account) const;
  std::optional<AccountState> Get(const primitives::Address& account) const;
  bool WasInitialized(const primitives::Address& account, const primitives::Address& module) const;
  bool SetLocked(const primitives::Address& account, bool locked);
  std::size_t size() const;

  // Upgrade protocol. BeginUpgrade atomically checks that the account is
  // idle and still on `expected_version`, saves the whole record, then binds
  // it to `to_version` in phase Upgrading (creating the record on first
  // upgrade). AbortUpgrade puts the saved record back, or erases the record
  // if this upgrade created it.
  bool BeginUpgrade(const primitives::Address& account, VersionId expected_version,
                    VersionId to_version, Rejection* rejection);
  void CommitUpgrade(const primitives::Address& account,
                     const std::vector<primitives::Address>& initialized);
  void AbortUpgrade(const primitives::Address& account);

  // Sorted by address so snapshots are byte-stable.
  std::vector<std::pair<primitives::Address, AccountState>> Export() const;
  void Restore(const primitives::Address& account, AccountState state);

 private:
  struct PendingUpgrade {
    AccountState previous;
    bool created{false};
  };

  std::unordered_map<primitives::Address, AccountState, primitives::AddressHasher> accounts_;
  std::unordered_map<primitives::Address, PendingUpgrade, primitives::AddressHasher> pending_;
  mutable std::shared_mutex mutex_;
};

}  // namespace modvault::manager
