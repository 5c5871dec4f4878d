#include "manager/storage_gate.hpp"

#include <exception>
#include <string>

#include "primitives/calldata.hpp"
#include "util/log.hpp"

namespace modvault::manager {

StorageInvocationGate::StorageInvocationGate(const FeatureSetCatalog& catalog,
                                             ContractDirectory& directory)
    : catalog_(catalog), directory_(directory) {}

bool StorageInvocationGate::InvokeStorage(const primitives::Address& account,
                                          const primitives::Address& storage,
                                          std::span<const std::uint8_t> encoded_call,
                                          Rejection* rejection) {
  primitives::Address target{};
  if (!primitives::ReadAddressArg(encoded_call, 0, &target)) {
    util::LogDebug("storage", "malformed call for " + primitives::AddressToHex(storage));
    return Reject(rejection, RejectReason::kTargetMismatch, storage,
                  "call does not encode a target account");
  }
  if (target != account) {
    util::LogDebug("storage", "target " + primitives::AddressToHex(target) + " != account " +
                                  primitives::AddressToHex(account));
    return Reject(rejection, RejectReason::kTargetMismatch, target,
                  "target of call is not the account");
  }
  if (!catalog_.IsStorage(storage)) {
    util::LogDebug("storage", "unregistered storage " + primitives::AddressToHex(storage));
    return Reject(rejection, RejectReason::kUnregisteredStorage, storage);
  }
  StorageModule* module = directory_.FindStorage(storage);
  if (module == nullptr) {
    return Reject(rejection, RejectReason::kStorageCallFailed, storage, "storage not deployed");
  }
  std::string error;
  bool ok = false;
  try {
    ok = module->Execute(encoded_call, &error);
  } catch (const std::exception& ex) {
    error = ex.what();
    ok = false;
  }
  if (!ok) {
    util::LogInfo("storage", "call into " + primitives::AddressToHex(storage) + " failed: " + error);
    return Reject(rejection, RejectReason::kStorageCallFailed, storage,
                  error.empty() ? "storage call failed" : error);
  }
  return true;
}

}  // namespace modvault::manager
