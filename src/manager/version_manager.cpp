#include "manager/version_manager.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include "primitives/calldata.hpp"
#include "util/log.hpp"

namespace modvault::manager {

VersionManager::VersionManager(const primitives::Address& catalog_owner,
                               const ModuleRegistry& registry, const OwnershipOracle& ownership,
                               ContractDirectory& directory)
    : registry_(registry),
      directory_(directory),
      catalog_(catalog_owner),
      gate_(catalog_, accounts_, registry),
      upgrades_(catalog_, accounts_, gate_, ownership, directory),
      storage_gate_(catalog_, directory) {}

bool VersionManager::AddFeatureSet(const primitives::Address& caller,
                                   const std::vector<primitives::Address>& features,
                                   const std::vector<primitives::Address>& to_initialize,
                                   VersionId* version_out, Rejection* rejection) {
  FeatureSetDraft draft;
  draft.features = features;
  draft.to_initialize = to_initialize;
  return AddFeatureSet(caller, std::move(draft), version_out, rejection);
}

bool VersionManager::AddFeatureSet(const primitives::Address& caller, FeatureSetDraft draft,
                                   VersionId* version_out, Rejection* rejection) {
  for (const auto& address : draft.features) {
    const FeatureModule* feature = directory_.FindFeature(address);
    if (feature == nullptr) {
      continue;
    }
    for (const auto& selector : feature->StaticCallSelectors()) {
      draft.static_routes.emplace_back(selector, address);
    }
  }
  return catalog_.AddFeatureSet(caller, std::move(draft), version_out, rejection);
}

bool VersionManager::AddStorage(const primitives::Address& caller,
                                const primitives::Address& storage, Rejection* rejection) {
  return catalog_.AddStorage(caller, storage, rejection);
}

bool VersionManager::TransferCatalogOwnership(const primitives::Address& caller,
                                              const primitives::Address& new_owner,
                                              Rejection* rejection) {
  return catalog_.TransferOwnership(caller, new_owner, rejection);
}

bool VersionManager::Authorize(const AuthorizationRequest& request, Rejection* rejection) const {
  return gate_.Authorize(request, rejection);
}

bool VersionManager::AuthorizeMutation(const primitives::Address& account,
                                       const primitives::Address& module, CallContext context,
                                       bool settled, Rejection* rejection) const {
  AuthorizationRequest request;
  request.account = account;
  request.module = module;
  request.call_class = CallClass::kMutating;
  request.context = context;
  request.require_settled = settled;
  return gate_.Authorize(request, rejection);
}

bool VersionManager::InvokeWallet(const primitives::Address& account,
                                  const primitives::Address& module,
                                  const primitives::Address& target, std::uint64_t value,
                                  std::span<const std::uint8_t> data, CallContext context,
                                  std::vector<std::uint8_t>* result, Rejection* rejection) {
  if (!AuthorizeMutation(account, module, context, true, rejection)) {
    return false;
  }
  WalletProxy* wallet = directory_.FindWallet(account);
  if (wallet == nullptr) {
    return Reject(rejection, RejectReason::kWalletNotFound, account);
  }
  std::string error;
  std::vector<std::uint8_t> output;
  if (!wallet->Invoke(target, value, data, &output, &error)) {
    util::LogInfo("vm", "wallet call from " + primitives::AddressToHex(module) + " failed: " + error);
    return Reject(rejection, RejectReason::kWalletCallFailed, target,
                  error.empty() ? "wallet call failed" : error);
  }
  if (result) {
    *result = std::move(output);
  }
  return true;
}

bool VersionManager::SetOwner(const primitives::Address& account,
                              const primitives::Address& module,
                              const primitives::Address& new_owner, CallContext context,
                              Rejection* rejection) {
  if (!AuthorizeMutation(account, module, context, true, rejection)) {
    return false;
  }
  if (primitives::IsZeroAddress(new_owner)) {
    return Reject(rejection, RejectReason::kInvalidOwner, new_owner, "new owner is zero");
  }
  WalletProxy* wallet = directory_.FindWallet(account);
  if (wallet == nullptr) {
    return Reject(rejection, RejectReason::kWalletNotFound, account);
  }
  std::string error;
  if (!wallet->SetOwner(new_owner, &error)) {
    return Reject(rejection, RejectReason::kWalletCallFailed, account,
                  error.empty() ? "owner change failed" : error);
  }
  util::LogInfo("vm", "owner of " + primitives::AddressToHex(account) + " set by " +
                          primitives::AddressToHex(module));
  return true;
}

bool VersionManager::InvokeStorage(const primitives::Address& account,
                                   const primitives::Address& module,
                                   const primitives::Address& storage,
                                   std::span<const std::uint8_t> data, CallContext context,
                                   Rejection* rejection) {
  if (!AuthorizeMutation(account, module, context, false, rejection)) {
    return false;
  }
  return storage_gate_.InvokeStorage(account, storage, data, rejection);
}

bool VersionManager::SetLock(const primitives::Address& account,
                             const primitives::Address& module, bool locked, CallContext context,
                             Rejection* rejection) {
  if (!AuthorizeMutation(account, module, context, true, rejection)) {
    return false;
  }
  if (!accounts_.SetLocked(account, locked)) {
    return Reject(rejection, RejectReason::kAccountNotUpgraded, account);
  }
  util::LogInfo("vm", primitives::AddressToHex(account) + (locked ? " locked by " : " unlocked by ") +
                          primitives::AddressToHex(module));
  return true;
}

bool VersionManager::StaticCall(const primitives::Address& account,
                                std::span<const std::uint8_t> data, CallContext context,
                                std::vector<std::uint8_t>* result,
                                Rejection* rejection) const {
  if (context != CallContext::kReadOnly) {
    return Reject(rejection, RejectReason::kStaticCallRequired, account, "not in a static call");
  }
  const VersionId version = accounts_.Summary(account).current_version;
  const FeatureSetHandle features = catalog_.GetFeatureSet(version);
  if (!features) {
    return Reject(rejection, RejectReason::kAccountNotUpgraded, account);
  }
  primitives::Selector selector{};
  if (!primitives::ReadSelector(data, &selector)) {
    return Reject(rejection, RejectReason::kStaticCallNotSupported, account, "call too short");
  }
  const auto routed = features->StaticRouteFor(selector);
  if (!routed) {
    return Reject(rejection, RejectReason::kStaticCallNotSupported, account,
                  "static call not supported for version " + std::to_string(version));
  }
  if (!gate_.Authorize(account, *routed, CallClass::kReadOnly, context, rejection)) {
    return false;
  }
  const FeatureModule* feature = directory_.FindFeature(*routed);
  if (feature == nullptr) {
    return Reject(rejection, RejectReason::kStaticCallNotSupported, *routed,
                  "routed module not deployed");
  }
  std::string error;
  std::vector<std::uint8_t> output;
  bool ok = false;
  try {
    ok = feature->HandleStaticCall(account, data, &output, &error);
  } catch (const std::exception& ex) {
    error = ex.what();
    ok = false;
  }
  if (!ok) {
    return Reject(rejection, RejectReason::kStaticCallNotSupported, *routed,
                  error.empty() ? "static handler failed" : error);
  }
  if (result) {
    *result = std::move(output);
  }
  return true;
}

bool VersionManager::UpgradeAccount(const primitives::Address& account, VersionId to_version,
                                    const primitives::Address& requester, UpgradeReport* report,
                                    Rejection* rejection) {
  return upgrades_.UpgradeAccount(account, to_version, requester, report, rejection);
}

VersionId VersionManager::AccountVersion(const primitives::Address& account) const {
  return accounts_.Summary(account).current_version;
}

bool VersionManager::IsLocked(const primitives::Address& account) const {
  return accounts_.Summary(account).locked;
}

bool VersionManager::IsFeatureAuthorized(const primitives::Address& account,
                                         const primitives::Address& module) const {
  return gate_.IsFeatureAuthorized(account, module);
}

std::vector<primitives::Address> VersionManager::AuthorizedFeatures(
    const primitives::Address& account) const {
  return gate_.AuthorizedFeatures(account);
}

std::optional<AccountState> VersionManager::GetAccount(const primitives::Address& account) const {
  return accounts_.Get(account);
}

ManagerSnapshot VersionManager::ExportSnapshot() const {
  ManagerSnapshot snapshot;
  snapshot.catalog_owner = catalog_.owner();
  const VersionId last = catalog_.LastVersion();
  snapshot.versions.reserve(last);
  for (VersionId version = 1; version <= last; ++version) {
    const auto features = catalog_.GetFeatureSet(version);
    FeatureSetDraft draft;
    draft.features = features->features();
    draft.to_initialize = features->to_initialize();
    draft.static_routes = features->static_routes();
    snapshot.versions.push_back(std::move(draft));
  }
  snapshot.storages = catalog_.Storages();
  snapshot.accounts = accounts_.Export();
  return snapshot;
}

bool VersionManager::RestoreSnapshot(const ManagerSnapshot& snapshot, std::string* error) {
  auto fail = [error](std::string message) {
    util::LogWarn("vm", "restore refused: " + message);
    if (error) *error = std::move(message);
    return false;
  };
  if (catalog_.LastVersion() != kNoVersion || !catalog_.Storages().empty() ||
      accounts_.size() != 0) {
    return fail("restore requires an empty manager");
  }
  if (snapshot.catalog_owner != catalog_.owner()) {
    return fail("snapshot catalog owner does not match");
  }
  const primitives::Address owner = catalog_.owner();

  // Validate everything against a scratch catalog first so a bad snapshot
  // leaves this manager untouched.
  FeatureSetCatalog scratch(owner);
  ModuleSet known_features;
  for (std::size_t i = 0; i < snapshot.versions.size(); ++i) {
    Rejection rejection;
    VersionId version = kNoVersion;
    if (!scratch.AddFeatureSet(owner, snapshot.versions[i], &version, &rejection)) {
      return fail("version " + std::to_string(i + 1) + ": " + DescribeRejection(rejection));
    }
    known_features.insert(snapshot.versions[i].features.begin(),
                          snapshot.versions[i].features.end());
  }
  for (const auto& storage : snapshot.storages) {
    Rejection rejection;
    if (!scratch.AddStorage(owner, storage, &rejection)) {
      return fail("storage: " + DescribeRejection(rejection));
    }
  }
  const VersionId last = scratch.LastVersion();
  ModuleSet seen_accounts;
  for (const auto& [account, state] : snapshot.accounts) {
    const std::string name = primitives::AddressToHex(account);
    if (!seen_accounts.insert(account).second) {
      return fail("account " + name + " listed twice");
    }
    if (state.current_version == kNoVersion || state.current_version > last) {
      return fail("account " + name + " bound to unknown version " +
                  std::to_string(state.current_version));
    }
    for (const auto& module : state.initialized_modules) {
      if (known_features.count(module) == 0) {
        return fail("account " + name + " initialized unknown module " +
                    primitives::AddressToHex(module));
      }
    }
  }

  for (const auto& draft : snapshot.versions) {
    VersionId version = kNoVersion;
    Rejection rejection;
    if (!catalog_.AddFeatureSet(owner, draft, &version, &rejection)) {
      throw std::runtime_error("restore diverged from validation: " +
                               DescribeRejection(rejection));
    }
  }
  for (const auto& storage : snapshot.storages) {
    Rejection rejection;
    if (!catalog_.AddStorage(owner, storage, &rejection)) {
      throw std::runtime_error("restore diverged from validation: " +
                               DescribeRejection(rejection));
    }
  }
  for (const auto& [account, state] : snapshot.accounts) {
    accounts_.Restore(account, state);
  }
  util::LogInfo("vm", "restored versions=" + std::to_string(last) +
                          " storages=" + std::to_string(snapshot.storages.size()) +
                          " accounts=" + std::to_string(snapshot.accounts.size()));
  return true;
}

}  // namespace modvault::manager
