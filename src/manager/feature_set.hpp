#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "manager/errors.hpp"
#include "primitives/address.hpp"
#include "primitives/calldata.hpp"

namespace modvault::manager {

using VersionId = std::uint32_t;

// Version 0 means "not bound to any feature set".
inline constexpr VersionId kNoVersion = 0;

using StaticRoute = std::pair<primitives::Selector, primitives::Address>;

// Input to FeatureSetCatalog::AddFeatureSet.
struct FeatureSetDraft {
  std::vector<primitives::Address> features;
  std::vector<primitives::Address> to_initialize;
  std::vector<StaticRoute> static_routes;
};

// One immutable catalog entry. Membership lookups are memoized at creation,
// which is safe because entries never change.
class FeatureSet {
 public:
  FeatureSet(VersionId version, FeatureSetDraft draft);

  VersionId version() const noexcept { return version_; }
  const std::vector<primitives::Address>& features() const noexcept { return features_; }
  const std::vector<primitives::Address>& to_initialize() const noexcept {
    return to_initialize_;
  }
  const std::vector<StaticRoute>& static_routes() const noexcept { return static_routes_; }

  bool Contains(const primitives::Address& module) const;
  bool RequiresInitialization(const primitives::Address& module) const;
  std::optional<primitives::Address> StaticRouteFor(const primitives::Selector& selector) const;

 private:
  VersionId version_{kNoVersion};
  std::vector<primitives::Address> features_;
  std::vector<primitives::Address> to_initialize_;
  std::vector<StaticRoute> static_routes_;
  std::unordered_set<primitives::Address, primitives::AddressHasher> feature_index_;
  std::unordered_set<primitives::Address, primitives::AddressHasher> init_index_;
  std::unordered_map<primitives::Selector, primitives::Address, primitives::SelectorHasher>
      route_index_;
};

using FeatureSetHandle = std::shared_ptr<const FeatureSet>;

// Append-only log of feature sets plus the append-only table of storage
// modules features may write through. Only the owner identity appends.
class FeatureSetCatalog {
 public:
  explicit FeatureSetCatalog(const primitives::Address& owner);

  FeatureSetCatalog(const FeatureSetCatalog&) = delete;
  FeatureSetCatalog& operator=(const FeatureSetCatalog&) = delete;

  primitives::Address owner() const;
  bool TransferOwnership(const primitives::Address& caller, const primitives::Address& new_owner,
                         Rejection* rejection);

  // On success `*version_out` holds the new version (previous last + 1).
  // On failure nothing is appended.
  bool AddFeatureSet(const primitives::Address& caller, FeatureSetDraft draft,
                     VersionId* version_out, Rejection* rejection);
  bool AddStorage(const primitives::Address& caller, const primitives::Address& storage,
                  Rejection* rejection);

  // nullptr when `version` does not exist (including version 0).
  FeatureSetHandle GetFeatureSet(VersionId version) const;
  VersionId LastVersion() const;
  bool HasVersion(VersionId version) const;

  bool IsStorage(const primitives::Address& storage) const;
  // Registration order.
  std::vector<primitives::Address> Storages() const;

 private:
  static bool ValidateDraft(const FeatureSetDraft& draft, Rejection* rejection);

  primitives::Address owner_;
  std::vector<FeatureSetHandle> versions_;
  std::vector<primitives::Address> storage_order_;
  std::unordered_set<primitives::Address, primitives::AddressHasher> storages_;
  mutable std::shared_mutex mutex_;
};

}  // namespace modvault::manager
