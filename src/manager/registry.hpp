#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "manager/contracts.hpp"

namespace modvault::manager {

// Module registry kept in memory: a name per registered module, removal
// revokes authority everywhere the registry is consulted.
class InMemoryModuleRegistry final : public ModuleRegistry {
 public:
  bool RegisterModule(const primitives::Address& module, std::string name, std::string* error);
  bool DeregisterModule(const primitives::Address& module, std::string* error);
  std::optional<std::string> ModuleName(const primitives::Address& module) const;
  std::size_t size() const;

  bool IsRegisteredModule(const primitives::Address& module) const override;

 private:
  std::unordered_map<primitives::Address, std::string, primitives::AddressHasher> modules_;
  mutable std::shared_mutex mutex_;
};

// Treats the wallet proxy's current owner as the only owner authority.
class WalletOwnershipOracle final : public OwnershipOracle {
 public:
  explicit WalletOwnershipOracle(ContractDirectory& directory) : directory_(directory) {}

  bool IsOwnerAuthority(const primitives::Address& account,
                        const primitives::Address& requester) const override;

 private:
  ContractDirectory& directory_;
};

// Address book of in-process contracts. Does not own them.
class InMemoryContractDirectory final : public ContractDirectory {
 public:
  void AddFeature(FeatureModule* feature);
  void AddStorage(StorageModule* storage);
  void AddWallet(WalletProxy* wallet);

  FeatureModule* FindFeature(const primitives::Address& address) override;
  StorageModule* FindStorage(const primitives::Address& address) override;
  WalletProxy* FindWallet(const primitives::Address& address) override;

 private:
  std::unordered_map<primitives::Address, FeatureModule*, primitives::AddressHasher> features_;
  std::unordered_map<primitives::Address, StorageModule*, primitives::AddressHasher> storages_;
  std::unordered_map<primitives::Address, WalletProxy*, primitives::AddressHasher> wallets_;
};

}  // namespace modvault::manager
