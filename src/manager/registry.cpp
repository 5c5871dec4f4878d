#include "manager/registry.hpp"

#include <mutex>

namespace modvault::manager {

bool InMemoryModuleRegistry::RegisterModule(const primitives::Address& module, std::string name,
                                            std::string* error) {
  if (primitives::IsZeroAddress(module)) {
    if (error) *error = "cannot register the zero address";
    return false;
  }
  std::unique_lock lock(mutex_);
  if (modules_.count(module) != 0) {
    if (error) *error = "module already registered";
    return false;
  }
  modules_.emplace(module, std::move(name));
  return true;
}

bool InMemoryModuleRegistry::DeregisterModule(const primitives::Address& module,
                                              std::string* error) {
  std::unique_lock lock(mutex_);
  if (modules_.erase(module) == 0) {
    if (error) *error = "module not registered";
    return false;
  }
  return true;
}

std::optional<std::string> InMemoryModuleRegistry::ModuleName(
    const primitives::Address& module) const {
  std::shared_lock lock(mutex_);
  const auto it = modules_.find(module);
  if (it == modules_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t InMemoryModuleRegistry::size() const {
  std::shared_lock lock(mutex_);
  return modules_.size();
}

bool InMemoryModuleRegistry::IsRegisteredModule(const primitives::Address& module) const {
  std::shared_lock lock(mutex_);
  return modules_.count(module) != 0;
}

bool WalletOwnershipOracle::IsOwnerAuthority(const primitives::Address& account,
                                             const primitives::Address& requester) const {
  const WalletProxy* wallet = directory_.FindWallet(account);
  if (wallet == nullptr) {
    return false;
  }
  const auto owner = wallet->Owner();
  return !primitives::IsZeroAddress(owner) && owner == requester;
}

void InMemoryContractDirectory::AddFeature(FeatureModule* feature) {
  features_[feature->address()] = feature;
}

void InMemoryContractDirectory::AddStorage(StorageModule* storage) {
  storages_[storage->address()] = storage;
}

void InMemoryContractDirectory::AddWallet(WalletProxy* wallet) {
  wallets_[wallet->address()] = wallet;
}

FeatureModule* InMemoryContractDirectory::FindFeature(const primitives::Address& address) {
  const auto it = features_.find(address);
  return it == features_.end() ? nullptr : it->second;
}

StorageModule* InMemoryContractDirectory::FindStorage(const primitives::Address& address) {
  const auto it = storages_.find(address);
  return it == storages_.end() ? nullptr : it->second;
}

WalletProxy* InMemoryContractDirectory::FindWallet(const primitives::Address& address) {
  const auto it = wallets_.find(address);
  return it == wallets_.end() ? nullptr : it->second;
}

}  // namespace modvault::manager
