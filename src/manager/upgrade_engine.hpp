#pragma once

#include <vector>

#include "manager/account_state.hpp"
#include "manager/authorization_gate.hpp"
#include "manager/contracts.hpp"
#include "manager/errors.hpp"
#include "manager/feature_set.hpp"

namespace modvault::manager {

struct UpgradeReport {
  VersionId from_version{kNoVersion};
  VersionId to_version{kNoVersion};
  std::vector<primitives::Address> authorized;    // new \ old
  std::vector<primitives::Address> deauthorized;  // old \ new
  std::vector<primitives::Address> initialized;   // hooks run by this upgrade
};

// Moves an account between feature-set versions. Authorization of the
// modules is derived from the bound version, so the only state written is
// the version itself and the per-account "ever initialized" flags.
class UpgradeEngine {
 public:
  UpgradeEngine(const FeatureSetCatalog& catalog, AccountBook& accounts,
                const AuthorizationGate& gate, const OwnershipOracle& ownership,
                ContractDirectory& directory);

  // Checks, in order: UpgradeInProgress, NotOwnerAuthority (requester is
  // neither an owner authority nor a feature authorized for the account),
  // AccountLocked, InvalidVersion, AlreadyOnVersion. A failing setup hook
  // fails the whole upgrade with InitializationFailed and puts the account
  // record back exactly as it was, lock flag included. While hooks run,
  // only modules of the previous version may reach the wallet or the lock
  // (see AuthorizationRequest::require_settled).
  bool UpgradeAccount(const primitives::Address& account, VersionId to_version,
                      const primitives::Address& requester, UpgradeReport* report,
                      Rejection* rejection);

 private:
  bool RunSetupHook(const primitives::Address& account, const primitives::Address& module,
                    Rejection* rejection);

  const FeatureSetCatalog& catalog_;
  AccountBook& accounts_;
  const AuthorizationGate& gate_;
  const OwnershipOracle& ownership_;
  ContractDirectory& directory_;
};

}  // namespace modvault::manager
