#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "primitives/address.hpp"
#include "primitives/calldata.hpp"

namespace modvault::manager {

// Collaborators the manager consumes. Implementations live outside the
// core (module business logic, key infrastructure, the execution
// substrate); tests and tools provide in-memory versions.

class ModuleRegistry {
 public:
  virtual ~ModuleRegistry() = default;
  // True for registered, non-revoked modules.
  virtual bool IsRegisteredModule(const primitives::Address& module) const = 0;
};

class OwnershipOracle {
 public:
  virtual ~OwnershipOracle() = default;
  virtual bool IsOwnerAuthority(const primitives::Address& account,
                                const primitives::Address& requester) const = 0;
};

class FeatureModule {
 public:
  virtual ~FeatureModule() = default;

  virtual primitives::Address address() const = 0;

  // One-time setup hook. The manager calls it at most once per account,
  // while the account already reports the target version, so the module may
  // use the manager on the account's behalf. Returning false (or throwing)
  // aborts the surrounding upgrade.
  virtual bool InitializeAccount(const primitives::Address& account, std::string* error) = 0;

  // Selectors this module answers through the read-only fallback route.
  virtual std::vector<primitives::Selector> StaticCallSelectors() const = 0;

  virtual bool HandleStaticCall(const primitives::Address& account,
                                std::span<const std::uint8_t> data,
                                std::vector<std::uint8_t>* result,
                                std::string* error) const = 0;
};

class StorageModule {
 public:
  virtual ~StorageModule() = default;
  virtual primitives::Address address() const = 0;
  virtual bool Execute(std::span<const std::uint8_t> data, std::string* error) = 0;
};

// The account's proxy: holds the owner key and performs calls on the
// account's behalf.
class WalletProxy {
 public:
  virtual ~WalletProxy() = default;
  virtual primitives::Address address() const = 0;
  virtual primitives::Address Owner() const = 0;
  virtual bool SetOwner(const primitives::Address& owner, std::string* error) = 0;
  virtual bool Invoke(const primitives::Address& target, std::uint64_t value,
                      std::span<const std::uint8_t> data, std::vector<std::uint8_t>* result,
                      std::string* error) = 0;
};

// Resolves an address to the contract deployed there. Returns nullptr when
// nothing of that kind lives at the address.
class ContractDirectory {
 public:
  virtual ~ContractDirectory() = default;
  virtual FeatureModule* FindFeature(const primitives::Address& address) = 0;
  virtual StorageModule* FindStorage(const primitives::Address& address) = 0;
  virtual WalletProxy* FindWallet(const primitives::Address& address) = 0;
};

}  // namespace modvault::manager
