#include "tools/cli_commands.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "manager/registry.hpp"
#include "manager/version_manager.hpp"
#include "multisig/sign_hash.hpp"
#include "primitives/address.hpp"
#include "primitives/calldata.hpp"
#include "storage/manager_snapshot.hpp"
#include "util/hex.hpp"
#include "util/log.hpp"

namespace modvault::cli {

namespace {

using modvault::primitives::Address;
using nlohmann::json;

Address RequireAddress(const std::string& text, std::string_view label) {
  Address address{};
  if (!modvault::primitives::ParseAddress(text, &address)) {
    throw std::runtime_error("invalid " + std::string(label) + ": " + text);
  }
  return address;
}

std::vector<Address> ParseAddressList(const std::string& text, std::string_view label) {
  std::vector<Address> out;
  std::stringstream stream(text);
  std::string item;
  while (std::getline(stream, item, ',')) {
    item = modvault::config::Trim(item);
    if (!item.empty()) {
      out.push_back(RequireAddress(item, label));
    }
  }
  return out;
}

// Selector given either as 8 hex digits or as a method signature.
modvault::primitives::Selector ParseSelector(const std::string& text) {
  std::vector<std::uint8_t> bytes;
  const auto hex = modvault::util::StripHexPrefix(text);
  if (hex.size() == 2 * modvault::primitives::kSelectorSize &&
      modvault::util::HexDecode(hex, &bytes)) {
    modvault::primitives::Selector selector{};
    std::copy(bytes.begin(), bytes.end(), selector.begin());
    return selector;
  }
  if (text.find('(') == std::string::npos) {
    throw std::runtime_error("invalid selector: " + text);
  }
  return modvault::primitives::ComputeSelector(text);
}


json AddressArray(const std::vector<Address>& list) {
  json out = json::array();
  for (const auto& address : list) {
    out.push_back(modvault::primitives::AddressToHex(address));
  }
  return out;
}

json FeatureSetToJson(const modvault::manager::FeatureSet& features) {
  json routes = json::array();
  for (const auto& [selector, module] : features.static_routes()) {
    routes.push_back({{"selector", modvault::util::HexEncodePrefixed(selector)},
                      {"module", modvault::primitives::AddressToHex(module)}});
  }
  return {{"version", features.version()},
          {"features", AddressArray(features.features())},
          {"init", AddressArray(features.to_initialize())},
          {"static_routes", std::move(routes)}};
}

// Offline manager: no modules are deployed, so only catalog and account
// bookkeeping are available.
class OfflineManager {
 public:
  explicit OfflineManager(const Address& owner)
      : oracle_(directory_), manager_(owner, registry_, oracle_, directory_) {}

  modvault::manager::VersionManager& get() { return manager_; }

 private:
  modvault::manager::InMemoryModuleRegistry registry_;
  modvault::manager::InMemoryContractDirectory directory_;
  modvault::manager::WalletOwnershipOracle oracle_;
  modvault::manager::VersionManager manager_;
};

void LoadInto(const std::filesystem::path& path, modvault::manager::ManagerSnapshot* snapshot) {
  std::string error;
  if (!modvault::storage::LoadManagerSnapshot(path.string(), snapshot, &error)) {
    throw std::runtime_error("failed to load snapshot: " + error);
  }
}

void Save(const std::filesystem::path& path, const modvault::manager::ManagerSnapshot& snapshot) {
  std::string error;
  if (!modvault::storage::SaveManagerSnapshot(snapshot, path.string(), &error)) {
    throw std::runtime_error("failed to write snapshot: " + error);
  }
}

void Restore(OfflineManager* offline, const modvault::manager::ManagerSnapshot& snapshot) {
  std::string error;
  if (!offline->get().RestoreSnapshot(snapshot, &error)) {
    throw std::runtime_error("snapshot rejected: " + error);
  }
}

Address CatalogCaller(const modvault::config::ManagerConfig& cfg) {
  if (cfg.catalog_owner.empty()) {
    throw std::runtime_error("catalog changes need --catalog-owner");
  }
  return RequireAddress(cfg.catalog_owner, "catalog owner");
}

json RejectionToJson(const modvault::manager::Rejection& rejection) {
  return {{"error", modvault::manager::ErrorKindToString(
                        modvault::manager::ErrorKindOf(rejection.reason))},
          {"reason", modvault::manager::RejectReasonToString(rejection.reason)},
          {"subject", modvault::primitives::AddressToHex(rejection.subject)},
          {"detail", rejection.detail}};
}

}  // namespace

std::uint64_t ParseUint64(const std::string& text, std::string_view label) {
  // std::stoull skips blanks and accepts a sign, wrapping "-1" to 2^64-1.
  if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
    throw std::runtime_error("invalid " + std::string(label) + ": " + text);
  }
  std::size_t pos = 0;
  unsigned long long value = 0;
  try {
    value = std::stoull(text, &pos, 0);
  } catch (const std::exception&) {
    throw std::runtime_error("invalid " + std::string(label) + ": " + text);
  }
  if (pos != text.size()) {
    throw std::runtime_error("invalid " + std::string(label) + ": " + text);
  }
  return static_cast<std::uint64_t>(value);
}

std::optional<std::string> CommandArgs::Flag(std::string_view name) const {
  for (const auto& [key, value] : flags) {
    if (key == name) return value;
  }
  return std::nullopt;
}

CommandArgs SplitCommandArgs(const std::vector<std::string>& rest) {
  CommandArgs out;
  for (std::size_t i = 0; i < rest.size(); ++i) {
    const auto& token = rest[i];
    if (token.rfind("--", 0) == 0) {
      if (i + 1 >= rest.size()) {
        throw std::runtime_error("missing value for argument " + token);
      }
      out.flags.emplace_back(token.substr(2), rest[++i]);
    } else {
      out.positional.push_back(token);
    }
  }
  return out;
}

json RunCommand(const config::ManagerConfig& cfg, const std::string& command,
                const CommandArgs& args) {
  const auto snapshot_path = modvault::config::ResolveSnapshotPath(cfg);

  if (command == "sign-hash") {
    const auto wallet = args.Flag("wallet");
    const auto to = args.Flag("to");
    if (!wallet || !to) {
      throw std::runtime_error("sign-hash needs --wallet and --to");
    }
    std::vector<std::uint8_t> data;
    if (const auto data_hex = args.Flag("data")) {
      if (!modvault::util::HexDecode(modvault::util::StripHexPrefix(*data_hex), &data)) {
        throw std::runtime_error("invalid --data hex");
      }
    }
    const std::uint64_t value = ParseUint64(args.Flag("value").value_or("0"), "value");
    const std::uint64_t nonce = ParseUint64(args.Flag("nonce").value_or("0"), "nonce");
    const auto hash = modvault::multisig::ComputeSignHash(
        RequireAddress(*wallet, "wallet"), RequireAddress(*to, "destination"), value, data, nonce);
    return {{"sign_hash", modvault::util::HexEncodePrefixed(hash)}, {"nonce", nonce}};
  }

  if (command == "init") {
    if (std::filesystem::exists(snapshot_path)) {
      throw std::runtime_error("snapshot already exists: " + snapshot_path.string());
    }
    modvault::manager::ManagerSnapshot snapshot;
    snapshot.catalog_owner = CatalogCaller(cfg);
    Save(snapshot_path, snapshot);
    modvault::util::LogInfo("cli", "created " + snapshot_path.string());
    return {{"snapshot", snapshot_path.string()},
            {"catalog_owner", modvault::primitives::AddressToHex(snapshot.catalog_owner)}};
  }

  modvault::manager::ManagerSnapshot snapshot;
  LoadInto(snapshot_path, &snapshot);
  OfflineManager offline(snapshot.catalog_owner);
  Restore(&offline, snapshot);
  auto& manager = offline.get();

  if (command == "add-storage") {
    if (args.positional.size() != 1) {
      throw std::runtime_error("add-storage needs exactly one address");
    }
    const Address storage = RequireAddress(args.positional[0], "storage");
    modvault::manager::Rejection rejection;
    if (!manager.AddStorage(CatalogCaller(cfg), storage, &rejection)) {
      return RejectionToJson(rejection);
    }
    Save(snapshot_path, manager.ExportSnapshot());
    return {{"storage", modvault::primitives::AddressToHex(storage)},
            {"storages", manager.catalog().Storages().size()}};
  }

  if (command == "add-version") {
    modvault::manager::FeatureSetDraft draft;
    const auto features = args.Flag("features");
    if (!features) {
      throw std::runtime_error("add-version needs --features");
    }
    draft.features = ParseAddressList(*features, "feature");
    if (const auto init = args.Flag("init")) {
      draft.to_initialize = ParseAddressList(*init, "init module");
    }
    for (const auto& [key, value] : args.flags) {
      if (key != "route") continue;
      const auto eq_pos = value.rfind('=');
      if (eq_pos == std::string::npos) {
        throw std::runtime_error("--route expects <selector>=<module>");
      }
      draft.static_routes.emplace_back(ParseSelector(value.substr(0, eq_pos)),
                                       RequireAddress(value.substr(eq_pos + 1), "route module"));
    }
    modvault::manager::Rejection rejection;
    modvault::manager::VersionId version = modvault::manager::kNoVersion;
    if (!manager.AddFeatureSet(CatalogCaller(cfg), std::move(draft), &version, &rejection)) {
      return RejectionToJson(rejection);
    }
    Save(snapshot_path, manager.ExportSnapshot());
    return FeatureSetToJson(*manager.GetFeatureSet(version));
  }

  if (command == "list-versions") {
    json versions = json::array();
    for (modvault::manager::VersionId v = 1; v <= manager.LastVersion(); ++v) {
      const auto features = manager.GetFeatureSet(v);
      versions.push_back({{"version", v},
                          {"features", features->features().size()},
                          {"init", features->to_initialize().size()},
                          {"static_routes", features->static_routes().size()}});
    }
    return {{"catalog_owner", modvault::primitives::AddressToHex(manager.catalog().owner())},
            {"last_version", manager.LastVersion()},
            {"storages", AddressArray(manager.catalog().Storages())},
            {"versions", std::move(versions)}};
  }

  if (command == "show-version") {
    if (args.positional.size() != 1) {
      throw std::runtime_error("show-version needs a version number");
    }
    const auto version = ParseUint64(args.positional[0], "version");
    const auto features =
        manager.GetFeatureSet(static_cast<modvault::manager::VersionId>(version));
    if (!features || version > manager.LastVersion()) {
      throw std::runtime_error("unknown version " + args.positional[0]);
    }
    return FeatureSetToJson(*features);
  }

  if (command == "show-account") {
    if (args.positional.size() != 1) {
      throw std::runtime_error("show-account needs an address");
    }
    const Address account = RequireAddress(args.positional[0], "account");
    const auto state = manager.GetAccount(account);
    if (!state) {
      return {{"account", modvault::primitives::AddressToHex(account)}, {"version", 0}};
    }
    std::vector<Address> initialized(state->initialized_modules.begin(),
                                     state->initialized_modules.end());
    std::sort(initialized.begin(), initialized.end());
    return {{"account", modvault::primitives::AddressToHex(account)},
            {"version", state->current_version},
            {"locked", state->locked},
            {"phase", modvault::manager::UpgradePhaseToString(state->phase)},
            {"initialized", AddressArray(initialized)}};
  }

  throw std::runtime_error("unknown command: " + command);
}

}  // namespace modvault::cli
