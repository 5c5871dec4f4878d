#include "manager/errors.hpp"

namespace modvault::manager {

ErrorKind ErrorKindOf(RejectReason reason) {
  switch (reason) {
    case RejectReason::kNone:
      return ErrorKind::kNone;
    case RejectReason::kNotCatalogOwner:
    case RejectReason::kDuplicateStorageOrModule:
    case RejectReason::kInvalidInitSubset:
    case RejectReason::kInvalidModule:
    case RejectReason::kDuplicateStaticRoute:
      return ErrorKind::kConfigurationError;
    case RejectReason::kAccountNotUpgraded:
    case RejectReason::kModuleNotAuthorized:
    case RejectReason::kStaticCallRequired:
    case RejectReason::kMutationInReadOnlyContext:
    case RejectReason::kAccountLocked:
    case RejectReason::kNotOwnerAuthority:
    case RejectReason::kStaticCallNotSupported:
      return ErrorKind::kAuthorizationError;
    case RejectReason::kInvalidVersion:
    case RejectReason::kAlreadyOnVersion:
    case RejectReason::kUpgradeInProgress:
      return ErrorKind::kVersionError;
    case RejectReason::kInitializationFailed:
      return ErrorKind::kInitializationError;
    case RejectReason::kUnregisteredStorage:
    case RejectReason::kTargetMismatch:
    case RejectReason::kStorageCallFailed:
      return ErrorKind::kStorageError;
    case RejectReason::kWalletNotFound:
    case RejectReason::kWalletCallFailed:
    case RejectReason::kInvalidOwner:
      return ErrorKind::kExecutionError;
  }
  return ErrorKind::kNone;
}

const char* RejectReasonToString(RejectReason reason) {
  switch (reason) {
    case RejectReason::kNone:
      return "none";
    case RejectReason::kNotCatalogOwner:
      return "not_catalog_owner";
    case RejectReason::kDuplicateStorageOrModule:
      return "duplicate_storage_or_module";
    case RejectReason::kInvalidInitSubset:
      return "invalid_init_subset";
    case RejectReason::kInvalidModule:
      return "invalid_module";
    case RejectReason::kDuplicateStaticRoute:
      return "duplicate_static_route";
    case RejectReason::kAccountNotUpgraded:
      return "account_not_upgraded";
    case RejectReason::kModuleNotAuthorized:
      return "module_not_authorized";
    case RejectReason::kStaticCallRequired:
      return "static_call_required";
    case RejectReason::kMutationInReadOnlyContext:
      return "mutation_in_read_only_context";
    case RejectReason::kAccountLocked:
      return "account_locked";
    case RejectReason::kNotOwnerAuthority:
      return "not_owner_authority";
    case RejectReason::kStaticCallNotSupported:
      return "static_call_not_supported";
    case RejectReason::kInvalidVersion:
      return "invalid_version";
    case RejectReason::kAlreadyOnVersion:
      return "already_on_version";
    case RejectReason::kUpgradeInProgress:
      return "upgrade_in_progress";
    case RejectReason::kInitializationFailed:
      return "initialization_failed";
    case RejectReason::kUnregisteredStorage:
      return "unregistered_storage";
    case RejectReason::kTargetMismatch:
      return "target_mismatch";
    case RejectReason::kStorageCallFailed:
      return "storage_call_failed";
    case RejectReason::kWalletNotFound:
      return "wallet_not_found";
    case RejectReason::kWalletCallFailed:
      return "wallet_call_failed";
    case RejectReason::kInvalidOwner:
      return "invalid_owner";
  }
  return "unknown";
}

const char* ErrorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "none";
    case ErrorKind::kConfigurationError:
      return "configuration_error";
    case ErrorKind::kAuthorizationError:
      return "authorization_error";
    case ErrorKind::kVersionError:
      return "version_error";
    case ErrorKind::kInitializationError:
      return "initialization_error";
    case ErrorKind::kStorageError:
      return "storage_error";
    case ErrorKind::kExecutionError:
      return "execution_error";
  }
  return "unknown";
}

std::string DescribeRejection(const Rejection& rejection) {
  std::string out = ErrorKindToString(ErrorKindOf(rejection.reason));
  out += "/";
  out += RejectReasonToString(rejection.reason);
  if (!rejection.detail.empty()) {
    out += ": " + rejection.detail;
  }
  if (!primitives::IsZeroAddress(rejection.subject)) {
    out += " (" + primitives::AddressToHex(rejection.subject) + ")";
  }
  return out;
}

bool Reject(Rejection* out, RejectReason reason, const primitives::Address& subject,
            std::string detail) {
  if (out) {
    out->reason = reason;
    out->subject = subject;
    out->detail = std::move(detail);
  }
  return false;
}

}  // namespace modvault::manager
