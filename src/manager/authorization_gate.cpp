#include "manager/authorization_gate.hpp"

#include "util/log.hpp"

namespace modvault::manager {

namespace {

bool Deny(Rejection* rejection, const AuthorizationRequest& request, RejectReason reason,
          const primitives::Address& subject, std::string detail = {}) {
  Rejection local;
  Reject(&local, reason, subject, std::move(detail));
  util::LogDebug("gate", "denied " + primitives::AddressToHex(request.module) + " on " +
                             primitives::AddressToHex(request.account) + ": " +
                             DescribeRejection(local));
  if (rejection) {
    *rejection = std::move(local);
  }
  return false;
}

}  // namespace

const char* CallClassToString(CallClass call_class) {
  switch (call_class) {
    case CallClass::kMutating:
      return "mutating";
    case CallClass::kReadOnly:
      return "read_only";
  }
  return "unknown";
}

const char* CallContextToString(CallContext context) {
  switch (context) {
    case CallContext::kMutating:
      return "mutating";
    case CallContext::kReadOnly:
      return "read_only";
  }
  return "unknown";
}

AuthorizationGate::AuthorizationGate(const FeatureSetCatalog& catalog, const AccountBook& accounts,
                                     const ModuleRegistry& registry)
    : catalog_(catalog), accounts_(accounts), registry_(registry) {}

bool AuthorizationGate::Authorize(const AuthorizationRequest& request,
                                  Rejection* rejection) const {
  const AccountSummary summary = accounts_.Summary(request.account);
  if (summary.current_version == kNoVersion) {
    return Deny(rejection, request, RejectReason::kAccountNotUpgraded, request.account);
  }
  const FeatureSetHandle features = catalog_.GetFeatureSet(summary.current_version);
  if (!features) {
    // Unreachable while the catalog is append-only; refuse rather than guess.
    return Deny(rejection, request, RejectReason::kInvalidVersion, request.account,
                "account bound to unknown version " + std::to_string(summary.current_version));
  }
  if (!registry_.IsRegisteredModule(request.module)) {
    return Deny(rejection, request, RejectReason::kModuleNotAuthorized, request.module,
                "module not in registry");
  }
  if (!features->Contains(request.module)) {
    return Deny(rejection, request, RejectReason::kModuleNotAuthorized, request.module,
                "module not in version " + std::to_string(summary.current_version));
  }
  if (request.call_class == CallClass::kReadOnly && request.context != CallContext::kReadOnly) {
    return Deny(rejection, request, RejectReason::kStaticCallRequired, request.module);
  }
  if (request.call_class == CallClass::kMutating && request.context == CallContext::kReadOnly) {
    return Deny(rejection, request, RejectReason::kMutationInReadOnlyContext, request.module);
  }
  if (request.require_unlocked && summary.locked) {
    return Deny(rejection, request, RejectReason::kAccountLocked, request.account);
  }
  if (request.require_settled && summary.phase == UpgradePhase::kUpgrading) {
    const FeatureSetHandle previous = catalog_.GetFeatureSet(summary.previous_version);
    if (!previous || !previous->Contains(request.module)) {
      return Deny(rejection, request, RejectReason::kUpgradeInProgress, request.module,
                  "module not authorized before the upgrade in flight");
    }
  }
  return true;
}

bool AuthorizationGate::Authorize(const primitives::Address& account,
                                  const primitives::Address& module, CallClass call_class,
                                  CallContext context, Rejection* rejection) const {
  AuthorizationRequest request;
  request.account = account;
  request.module = module;
  request.call_class = call_class;
  request.context = context;
  return Authorize(request, rejection);
}

bool AuthorizationGate::IsFeatureAuthorized(const primitives::Address& account,
                                            const primitives::Address& module) const {
  const auto features = catalog_.GetFeatureSet(accounts_.Summary(account).current_version);
  return features && features->Contains(module) && registry_.IsRegisteredModule(module);
}

std::vector<primitives::Address> AuthorizationGate::AuthorizedFeatures(
    const primitives::Address& account) const {
  std::vector<primitives::Address> out;
  const auto features = catalog_.GetFeatureSet(accounts_.Summary(account).current_version);
  if (!features) {
    return out;
  }
  for (const auto& module : features->features()) {
    if (registry_.IsRegisteredModule(module)) {
      out.push_back(module);
    }
  }
  return out;
}

}  // namespace modvault::manager
