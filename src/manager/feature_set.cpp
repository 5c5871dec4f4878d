#include "manager/feature_set.hpp"

#include <mutex>
#include <span>
#include <string>

#include "util/hex.hpp"
#include "util/log.hpp"

namespace modvault::manager {

namespace {

std::string SelectorHex(const primitives::Selector& selector) {
  return util::HexEncodePrefixed(std::span<const std::uint8_t>(selector.data(), selector.size()));
}

}  // namespace

FeatureSet::FeatureSet(VersionId version, FeatureSetDraft draft)
    : version_(version),
      features_(std::move(draft.features)),
      to_initialize_(std::move(draft.to_initialize)),
      static_routes_(std::move(draft.static_routes)) {
  feature_index_.insert(features_.begin(), features_.end());
  init_index_.insert(to_initialize_.begin(), to_initialize_.end());
  for (const auto& [selector, module] : static_routes_) {
    route_index_.emplace(selector, module);
  }
}

bool FeatureSet::Contains(const primitives::Address& module) const {
  return feature_index_.count(module) != 0;
}

bool FeatureSet::RequiresInitialization(const primitives::Address& module) const {
  return init_index_.count(module) != 0;
}

std::optional<primitives::Address> FeatureSet::StaticRouteFor(
    const primitives::Selector& selector) const {
  const auto it = route_index_.find(selector);
  if (it == route_index_.end()) {
    return std::nullopt;
  }
  return it->second;
}

FeatureSetCatalog::FeatureSetCatalog(const primitives::Address& owner) : owner_(owner) {}

primitives::Address FeatureSetCatalog::owner() const {
  std::shared_lock lock(mutex_);
  return owner_;
}

bool FeatureSetCatalog::TransferOwnership(const primitives::Address& caller,
                                          const primitives::Address& new_owner,
                                          Rejection* rejection) {
  std::unique_lock lock(mutex_);
  if (caller != owner_) {
    return Reject(rejection, RejectReason::kNotCatalogOwner, caller);
  }
  if (primitives::IsZeroAddress(new_owner)) {
    return Reject(rejection, RejectReason::kInvalidOwner, new_owner, "new owner is zero");
  }
  owner_ = new_owner;
  util::LogInfo("catalog", "ownership transferred to " + primitives::AddressToHex(new_owner));
  return true;
}

bool FeatureSetCatalog::ValidateDraft(const FeatureSetDraft& draft, Rejection* rejection) {
  if (draft.features.empty()) {
    return Reject(rejection, RejectReason::kInvalidModule, {}, "feature list is empty");
  }
  std::unordered_set<primitives::Address, primitives::AddressHasher> features;
  for (const auto& feature : draft.features) {
    if (primitives::IsZeroAddress(feature)) {
      return Reject(rejection, RejectReason::kInvalidModule, feature, "zero feature address");
    }
    if (!features.insert(feature).second) {
      return Reject(rejection, RejectReason::kDuplicateStorageOrModule, feature,
                    "feature listed twice");
    }
  }
  std::unordered_set<primitives::Address, primitives::AddressHasher> to_init;
  for (const auto& module : draft.to_initialize) {
    if (features.count(module) == 0) {
      return Reject(rejection, RejectReason::kInvalidInitSubset, module,
                    "module to initialize is not a feature");
    }
    if (!to_init.insert(module).second) {
      return Reject(rejection, RejectReason::kInvalidInitSubset, module,
                    "module to initialize listed twice");
    }
  }
  std::unordered_set<primitives::Selector, primitives::SelectorHasher> selectors;
  for (const auto& [selector, module] : draft.static_routes) {
    if (features.count(module) == 0) {
      return Reject(rejection, RejectReason::kInvalidModule, module,
                    "static route target is not a feature");
    }
    if (!selectors.insert(selector).second) {
      return Reject(rejection, RejectReason::kDuplicateStaticRoute, module,
                    "selector " + SelectorHex(selector) + " routed twice");
    }
  }
  return true;
}

bool FeatureSetCatalog::AddFeatureSet(const primitives::Address& caller, FeatureSetDraft draft,
                                      VersionId* version_out, Rejection* rejection) {
  std::unique_lock lock(mutex_);
  if (caller != owner_) {
    return Reject(rejection, RejectReason::kNotCatalogOwner, caller);
  }
  if (!ValidateDraft(draft, rejection)) {
    return false;
  }
  const VersionId version = static_cast<VersionId>(versions_.size() + 1);
  const std::size_t feature_count = draft.features.size();
  const std::size_t init_count = draft.to_initialize.size();
  versions_.push_back(std::make_shared<const FeatureSet>(version, std::move(draft)));
  if (version_out) {
    *version_out = version;
  }
  util::LogInfo("catalog", "added version " + std::to_string(version) + " features=" +
                               std::to_string(feature_count) +
                               " to_init=" + std::to_string(init_count));
  return true;
}

bool FeatureSetCatalog::AddStorage(const primitives::Address& caller,
                                   const primitives::Address& storage, Rejection* rejection) {
  std::unique_lock lock(mutex_);
  if (caller != owner_) {
    return Reject(rejection, RejectReason::kNotCatalogOwner, caller);
  }
  if (primitives::IsZeroAddress(storage)) {
    return Reject(rejection, RejectReason::kInvalidModule, storage, "zero storage address");
  }
  if (!storages_.insert(storage).second) {
    return Reject(rejection, RejectReason::kDuplicateStorageOrModule, storage,
                  "storage already added");
  }
  storage_order_.push_back(storage);
  util::LogInfo("catalog", "added storage " + primitives::AddressToHex(storage));
  return true;
}

FeatureSetHandle FeatureSetCatalog::GetFeatureSet(VersionId version) const {
  std::shared_lock lock(mutex_);
  if (version == kNoVersion || version > versions_.size()) {
    return nullptr;
  }
  return versions_[version - 1];
}

VersionId FeatureSetCatalog::LastVersion() const {
  std::shared_lock lock(mutex_);
  return static_cast<VersionId>(versions_.size());
}

bool FeatureSetCatalog::HasVersion(VersionId version) const {
  std::shared_lock lock(mutex_);
  return version != kNoVersion && version <= versions_.size();
}

bool FeatureSetCatalog::IsStorage(const primitives::Address& storage) const {
  std::shared_lock lock(mutex_);
  return storages_.count(storage) != 0;
}

std::vector<primitives::Address> FeatureSetCatalog::Storages() const {
  std::shared_lock lock(mutex_);
  return storage_order_;
}

}  // namespace modvault::manager
