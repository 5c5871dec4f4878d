#pragma once

#include <cstdint>
#include <span>

#include "manager/contracts.hpp"
#include "manager/errors.hpp"
#include "manager/feature_set.hpp"

namespace modvault::manager {

// Forwards a feature's write to a registered storage module. The caller
// path has already authorized the feature for `account`; this gate only
// makes sure the write lands on that same account and on a storage the
// catalog owner registered.
class StorageInvocationGate {
 public:
  StorageInvocationGate(const FeatureSetCatalog& catalog, ContractDirectory& directory);

  // TargetMismatch is checked first, so a call aimed at another account is
  // refused whether or not `storage` is registered.
  bool InvokeStorage(const primitives::Address& account, const primitives::Address& storage,
                     std::span<const std::uint8_t> encoded_call, Rejection* rejection);

 private:
  const FeatureSetCatalog& catalog_;
  ContractDirectory& directory_;
};

}  // namespace modvault::manager
