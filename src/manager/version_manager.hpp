#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "manager/account_state.hpp"
#include "manager/authorization_gate.hpp"
#include "manager/contracts.hpp"
#include "manager/errors.hpp"
#include "manager/feature_set.hpp"
#include "manager/storage_gate.hpp"
#include "manager/upgrade_engine.hpp"

namespace modvault::manager {

// Everything needed to rebuild a manager: the catalog log, the storage
// table and every account record.
struct ManagerSnapshot {
  primitives::Address catalog_owner{};
  std::vector<FeatureSetDraft> versions;
  std::vector<primitives::Address> storages;
  std::vector<std::pair<primitives::Address, AccountState>> accounts;
};

// Entry point for capability modules and account owners. Every privileged
// path runs the authorization gate first and reports refusals through the
// optional Rejection out-parameter.
class VersionManager {
 public:
  VersionManager(const primitives::Address& catalog_owner, const ModuleRegistry& registry,
                 const OwnershipOracle& ownership, ContractDirectory& directory);

  VersionManager(const VersionManager&) = delete;
  VersionManager& operator=(const VersionManager&) = delete;

  // Catalog administration (catalog owner only). Static-call routes for the
  // new version are collected from every feature the directory resolves.
  bool AddFeatureSet(const primitives::Address& caller,
                     const std::vector<primitives::Address>& features,
                     const std::vector<primitives::Address>& to_initialize,
                     VersionId* version_out, Rejection* rejection);
  // Routes already in `draft` are kept; the directory's routes are appended.
  bool AddFeatureSet(const primitives::Address& caller, FeatureSetDraft draft,
                     VersionId* version_out, Rejection* rejection);
  bool AddStorage(const primitives::Address& caller, const primitives::Address& storage,
                  Rejection* rejection);
  bool TransferCatalogOwnership(const primitives::Address& caller,
                                const primitives::Address& new_owner, Rejection* rejection);

  bool Authorize(const AuthorizationRequest& request, Rejection* rejection) const;

  // Generic call through the account's proxy.
  bool InvokeWallet(const primitives::Address& account, const primitives::Address& module,
                    const primitives::Address& target, std::uint64_t value,
                    std::span<const std::uint8_t> data, CallContext context,
                    std::vector<std::uint8_t>* result, Rejection* rejection);
  bool SetOwner(const primitives::Address& account, const primitives::Address& module,
                const primitives::Address& new_owner, CallContext context, Rejection* rejection);
  bool InvokeStorage(const primitives::Address& account, const primitives::Address& module,
                     const primitives::Address& storage, std::span<const std::uint8_t> data,
                     CallContext context, Rejection* rejection);
  bool SetLock(const primitives::Address& account, const primitives::Address& module, bool locked,
               CallContext context, Rejection* rejection);

  // Read-only fallback: routes `data` by selector to the feature the
  // account's version assigns it to.
  bool StaticCall(const primitives::Address& account, std::span<const std::uint8_t> data,
                  CallContext context, std::vector<std::uint8_t>* result,
                  Rejection* rejection) const;

  // `requester` is an owner authority or a feature authorized for `account`.
  bool UpgradeAccount(const primitives::Address& account, VersionId to_version,
                      const primitives::Address& requester, UpgradeReport* report,
                      Rejection* rejection);

  VersionId LastVersion() const { return catalog_.LastVersion(); }
  FeatureSetHandle GetFeatureSet(VersionId version) const {
    return catalog_.GetFeatureSet(version);
  }
  VersionId AccountVersion(const primitives::Address& account) const;
  bool IsLocked(const primitives::Address& account) const;
  bool IsFeatureAuthorized(const primitives::Address& account,
                           const primitives::Address& module) const;
  std::vector<primitives::Address> AuthorizedFeatures(const primitives::Address& account) const;
  std::optional<AccountState> GetAccount(const primitives::Address& account) const;

  const FeatureSetCatalog& catalog() const noexcept { return catalog_; }

  ManagerSnapshot ExportSnapshot() const;
  // Only valid on a manager with no versions, storages or accounts. Versions
  // and storages go through the normal catalog validation.
  bool RestoreSnapshot(const ManagerSnapshot& snapshot, std::string* error);

 private:
  // `settled` adds AuthorizationRequest::require_settled.
  bool AuthorizeMutation(const primitives::Address& account, const primitives::Address& module,
                         CallContext context, bool settled, Rejection* rejection) const;

  const ModuleRegistry& registry_;
  ContractDirectory& directory_;
  FeatureSetCatalog catalog_;
  AccountBook accounts_;
  AuthorizationGate gate_;
  UpgradeEngine upgrades_;
  StorageInvocationGate storage_gate_;
};

}  // namespace modvault::manager
