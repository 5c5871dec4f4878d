#pragma once

#include <vector>

#include "manager/account_state.hpp"
#include "manager/contracts.hpp"
#include "manager/errors.hpp"
#include "manager/feature_set.hpp"

namespace modvault::manager {

// What the caller claims to be doing.
enum class CallClass {
  kMutating,
  kReadOnly,
};

// What the execution substrate says the current invocation is. Decided by
// the outermost dispatch layer and passed down explicitly.
enum class CallContext {
  kMutating,
  kReadOnly,
};

const char* CallClassToString(CallClass call_class);
const char* CallContextToString(CallContext context);

struct AuthorizationRequest {
  primitives::Address account{};
  primitives::Address module{};
  CallClass call_class{CallClass::kMutating};
  CallContext context{CallContext::kMutating};
  bool require_unlocked{false};
  // For effects an aborted upgrade cannot undo (wallet calls, owner and
  // lock changes): while the account is Upgrading, the module must also
  // belong to the version being left.
  bool require_settled{false};
};

// Decides whether `module` may act for `account` under the account's
// current version. Checks, in order:
//   1. the account is bound to a version          (AccountNotUpgraded)
//   2. the module is registered and in that set   (ModuleNotAuthorized)
//   3. the claimed class matches the context      (StaticCallRequired,
//                                                  MutationInReadOnlyContext)
//   4. the account is unlocked, when required     (AccountLocked)
//   5. mid-upgrade, the module predates the upgrade,
//      when required                              (UpgradeInProgress)
class AuthorizationGate {
 public:
  AuthorizationGate(const FeatureSetCatalog& catalog, const AccountBook& accounts,
                    const ModuleRegistry& registry);

  bool Authorize(const AuthorizationRequest& request, Rejection* rejection) const;
  bool Authorize(const primitives::Address& account, const primitives::Address& module,
                 CallClass call_class, CallContext context, Rejection* rejection) const;

  // Pure membership view: registered and in the current version's set.
  bool IsFeatureAuthorized(const primitives::Address& account,
                           const primitives::Address& module) const;
  std::vector<primitives::Address> AuthorizedFeatures(const primitives::Address& account) const;

 private:
  const FeatureSetCatalog& catalog_;
  const AccountBook& accounts_;
  const ModuleRegistry& registry_;
};

}  // namespace modvault::manager
