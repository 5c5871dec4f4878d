#pragma once

#include <string>

#include "primitives/address.hpp"

namespace modvault::manager {

enum class ErrorKind {
  kNone,
  kConfigurationError,
  kAuthorizationError,
  kVersionError,
  kInitializationError,
  kStorageError,
  kExecutionError,
};

enum class RejectReason {
  kNone,
  // Catalog registration.
  kNotCatalogOwner,
  kDuplicateStorageOrModule,
  kInvalidInitSubset,
  kInvalidModule,
  kDuplicateStaticRoute,
  // Authorization.
  kAccountNotUpgraded,
  kModuleNotAuthorized,
  kStaticCallRequired,
  kMutationInReadOnlyContext,
  kAccountLocked,
  kNotOwnerAuthority,
  kStaticCallNotSupported,
  // Versioning.
  kInvalidVersion,
  kAlreadyOnVersion,
  kUpgradeInProgress,
  // Initialization.
  kInitializationFailed,
  // Storage.
  kUnregisteredStorage,
  kTargetMismatch,
  kStorageCallFailed,
  // Forwarding to the account proxy.
  kWalletNotFound,
  kWalletCallFailed,
  kInvalidOwner,
};

// Why a privileged operation was refused. `subject` names the module,
// storage or requester the reason is about, when there is one.
struct Rejection {
  RejectReason reason{RejectReason::kNone};
  primitives::Address subject{};
  std::string detail;
};

ErrorKind ErrorKindOf(RejectReason reason);
const char* RejectReasonToString(RejectReason reason);
const char* ErrorKindToString(ErrorKind kind);

// "kind/reason: detail (subject)" for logs and tool output.
std::string DescribeRejection(const Rejection& rejection);

// Fills `out` when non-null and returns false so callers can write
// `return Reject(rejection, ...);`.
bool Reject(Rejection* out, RejectReason reason, const primitives::Address& subject = {},
            std::string detail = {});

}  // namespace modvault::manager
