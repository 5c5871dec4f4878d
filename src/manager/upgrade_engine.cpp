#include "manager/upgrade_engine.hpp"

#include <exception>
#include <string>

#include "util/log.hpp"

namespace modvault::manager {

namespace {

// Holds an account in phase Upgrading. Unless Commit() is reached the
// destructor restores the record saved by BeginUpgrade, on every exit path.
class ScopedUpgrade {
 public:
  ScopedUpgrade(AccountBook& accounts, const primitives::Address& account)
      : accounts_(accounts), account_(account) {}
  ScopedUpgrade(const ScopedUpgrade&) = delete;
  ScopedUpgrade& operator=(const ScopedUpgrade&) = delete;

  ~ScopedUpgrade() {
    if (!committed_) {
      accounts_.AbortUpgrade(account_);
    }
  }

  void Commit(const std::vector<primitives::Address>& initialized) {
    accounts_.CommitUpgrade(account_, initialized);
    committed_ = true;
  }

 private:
  AccountBook& accounts_;
  primitives::Address account_;
  bool committed_{false};
};

bool Refuse(Rejection* rejection, const primitives::Address& account, RejectReason reason,
            const primitives::Address& subject, std::string detail = {}) {
  Rejection local;
  Reject(&local, reason, subject, std::move(detail));
  util::LogInfo("upgrade", "refused for " + primitives::AddressToHex(account) + ": " +
                               DescribeRejection(local));
  if (rejection) {
    *rejection = std::move(local);
  }
  return false;
}

}  // namespace

UpgradeEngine::UpgradeEngine(const FeatureSetCatalog& catalog, AccountBook& accounts,
                             const AuthorizationGate& gate, const OwnershipOracle& ownership,
                             ContractDirectory& directory)
    : catalog_(catalog),
      accounts_(accounts),
      gate_(gate),
      ownership_(ownership),
      directory_(directory) {}

bool UpgradeEngine::UpgradeAccount(const primitives::Address& account, VersionId to_version,
                                   const primitives::Address& requester, UpgradeReport* report,
                                   Rejection* rejection) {
  const AccountSummary summary = accounts_.Summary(account);
  if (summary.phase == UpgradePhase::kUpgrading) {
    return Refuse(rejection, account, RejectReason::kUpgradeInProgress, account);
  }
  if (!ownership_.IsOwnerAuthority(account, requester) &&
      !gate_.IsFeatureAuthorized(account, requester)) {
    return Refuse(rejection, account, RejectReason::kNotOwnerAuthority, requester,
                  "requester may not upgrade account");
  }
  if (summary.locked) {
    return Refuse(rejection, account, RejectReason::kAccountLocked, account);
  }
  const FeatureSetHandle target = catalog_.GetFeatureSet(to_version);
  if (!target) {
    return Refuse(rejection, account, RejectReason::kInvalidVersion, {},
                  "version " + std::to_string(to_version) + " does not exist (last " +
                      std::to_string(catalog_.LastVersion()) + ")");
  }
  if (to_version == summary.current_version) {
    return Refuse(rejection, account, RejectReason::kAlreadyOnVersion, {},
                  "already on version " + std::to_string(to_version));
  }
  const FeatureSetHandle current = catalog_.GetFeatureSet(summary.current_version);

  if (!accounts_.BeginUpgrade(account, summary.current_version, to_version, rejection)) {
    return false;
  }
  ScopedUpgrade scope(accounts_, account);

  UpgradeReport local;
  local.from_version = summary.current_version;
  local.to_version = to_version;
  for (const auto& module : target->features()) {
    if (current && current->Contains(module)) {
      continue;
    }
    local.authorized.push_back(module);
    if (!target->RequiresInitialization(module) || accounts_.WasInitialized(account, module)) {
      continue;
    }
    if (!RunSetupHook(account, module, rejection)) {
      util::LogWarn("upgrade", "rolled back " + primitives::AddressToHex(account) + " to version " +
                                   std::to_string(summary.current_version));
      return false;
    }
    local.initialized.push_back(module);
  }
  if (current) {
    for (const auto& module : current->features()) {
      if (!target->Contains(module)) {
        local.deauthorized.push_back(module);
      }
    }
  }

  scope.Commit(local.initialized);
  util::LogInfo("upgrade", primitives::AddressToHex(account) + " " +
                               std::to_string(local.from_version) + " -> " +
                               std::to_string(local.to_version) +
                               " authorized=" + std::to_string(local.authorized.size()) +
                               " deauthorized=" + std::to_string(local.deauthorized.size()) +
                               " initialized=" + std::to_string(local.initialized.size()));
  if (report) {
    *report = std::move(local);
  }
  return true;
}

bool UpgradeEngine::RunSetupHook(const primitives::Address& account,
                                 const primitives::Address& module, Rejection* rejection) {
  FeatureModule* feature = directory_.FindFeature(module);
  if (feature == nullptr) {
    return Refuse(rejection, account, RejectReason::kInitializationFailed, module,
                  "module not deployed");
  }
  std::string error;
  bool ok = false;
  try {
    ok = feature->InitializeAccount(account, &error);
  } catch (const std::exception& ex) {
    error = ex.what();
    ok = false;
  }
  if (!ok) {
    return Refuse(rejection, account, RejectReason::kInitializationFailed, module,
                  error.empty() ? "setup hook failed" : error);
  }
  util::LogDebug("upgrade", "initialized " + primitives::AddressToHex(module) + " for " +
                                primitives::AddressToHex(account));
  return true;
}

}  // namespace modvault::manager
