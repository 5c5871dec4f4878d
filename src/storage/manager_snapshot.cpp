#include "storage/manager_snapshot.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <span>
#include <utility>
#include <vector>

#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"
#include "util/atomic_file.hpp"

namespace modvault::storage {

namespace {

constexpr std::uint32_t kSnapshotMagic = 0x3153564D;  // 'MVS1' (little-endian uint32)
constexpr std::uint32_t kSnapshotVersion = 1;
constexpr std::uint32_t kMaxRecordSize = 4 * 1024 * 1024;  // 4 MiB safety cap
constexpr std::uint64_t kMaxListSize = 1u << 20;

namespace ser = primitives::serialize;

bool Fail(std::string* error, const std::string& message) {
  if (error) *error = message;
  return false;
}

bool AppendRecord(std::vector<std::uint8_t>* out, const std::vector<std::uint8_t>& payload) {
  if (payload.size() > kMaxRecordSize) return false;
  ser::WriteUint32(out, static_cast<std::uint32_t>(payload.size()));
  out->insert(out->end(), payload.begin(), payload.end());
  const auto digest = crypto::Sha3_256(payload);
  out->insert(out->end(), digest.begin(), digest.end());
  return true;
}

bool ReadRecord(std::span<const std::uint8_t> data, std::size_t* offset,
                std::vector<std::uint8_t>* payload) {
  std::uint32_t size = 0;
  if (!ser::ReadUint32(data, offset, &size) || size == 0 || size > kMaxRecordSize) {
    return false;
  }
  crypto::Sha3_256Hash expected{};
  if (data.size() - *offset < static_cast<std::size_t>(size) + expected.size()) return false;
  payload->assign(data.begin() + *offset, data.begin() + *offset + size);
  *offset += size;
  std::copy_n(data.begin() + *offset, expected.size(), expected.begin());
  *offset += expected.size();
  return crypto::Sha3_256(*payload) == expected;
}

void WriteAddressList(std::vector<std::uint8_t>* out,
                      const std::vector<primitives::Address>& list) {
  ser::WriteVarInt(out, list.size());
  for (const auto& address : list) {
    ser::WriteAddress(out, address);
  }
}

bool ReadAddressList(std::span<const std::uint8_t> data, std::size_t* offset,
                     std::vector<primitives::Address>* list) {
  std::uint64_t count = 0;
  if (!ser::ReadVarInt(data, offset, &count) || count > kMaxListSize) return false;
  list->clear();
  list->reserve(static_cast<std::size_t>(count));
  for (std::uint64_t i = 0; i < count; ++i) {
    primitives::Address address{};
    if (!ser::ReadAddress(data, offset, &address)) return false;
    list->push_back(address);
  }
  return true;
}

std::vector<std::uint8_t> EncodeVersion(const manager::FeatureSetDraft& draft) {
  std::vector<std::uint8_t> payload;
  WriteAddressList(&payload, draft.features);
  WriteAddressList(&payload, draft.to_initialize);
  ser::WriteVarInt(&payload, draft.static_routes.size());
  for (const auto& [selector, module] : draft.static_routes) {
    payload.insert(payload.end(), selector.begin(), selector.end());
    ser::WriteAddress(&payload, module);
  }
  return payload;
}

bool DecodeVersion(std::span<const std::uint8_t> payload, manager::FeatureSetDraft* draft) {
  std::size_t offset = 0;
  if (!ReadAddressList(payload, &offset, &draft->features)) return false;
  if (!ReadAddressList(payload, &offset, &draft->to_initialize)) return false;
  std::uint64_t routes = 0;
  if (!ser::ReadVarInt(payload, &offset, &routes) || routes > kMaxListSize) return false;
  draft->static_routes.clear();
  for (std::uint64_t i = 0; i < routes; ++i) {
    primitives::Selector selector{};
    for (auto& byte : selector) {
      if (!ser::ReadUint8(payload, &offset, &byte)) return false;
    }
    primitives::Address module{};
    if (!ser::ReadAddress(payload, &offset, &module)) return false;
    draft->static_routes.emplace_back(selector, module);
  }
  return offset == payload.size();
}

std::vector<std::uint8_t> EncodeAccount(const primitives::Address& account,
                                        const manager::AccountState& state) {
  std::vector<std::uint8_t> payload;
  ser::WriteAddress(&payload, account);
  ser::WriteUint32(&payload, state.current_version);
  ser::WriteUint8(&payload, state.locked ? 1 : 0);
  std::vector<primitives::Address> initialized(state.initialized_modules.begin(),
                                               state.initialized_modules.end());
  std::sort(initialized.begin(), initialized.end());
  WriteAddressList(&payload, initialized);
  return payload;
}

bool DecodeAccount(std::span<const std::uint8_t> payload, primitives::Address* account,
                   manager::AccountState* state) {
  std::size_t offset = 0;
  if (!ser::ReadAddress(payload, &offset, account)) return false;
  if (!ser::ReadUint32(payload, &offset, &state->current_version)) return false;
  std::uint8_t locked = 0;
  if (!ser::ReadUint8(payload, &offset, &locked) || locked > 1) return false;
  state->locked = locked != 0;
  state->phase = manager::UpgradePhase::kIdle;
  std::vector<primitives::Address> initialized;
  if (!ReadAddressList(payload, &offset, &initialized)) return false;
  state->initialized_modules.clear();
  state->initialized_modules.insert(initialized.begin(), initialized.end());
  return offset == payload.size();
}

}  // namespace

bool SaveManagerSnapshot(const manager::ManagerSnapshot& snapshot, const std::string& path,
                         std::string* error) {
  std::vector<std::uint8_t> out;
  ser::WriteUint32(&out, kSnapshotMagic);
  ser::WriteUint32(&out, kSnapshotVersion);

  std::vector<std::uint8_t> header;
  ser::WriteAddress(&header, snapshot.catalog_owner);
  ser::WriteVarInt(&header, snapshot.versions.size());
  ser::WriteVarInt(&header, snapshot.storages.size());
  ser::WriteVarInt(&header, snapshot.accounts.size());
  if (!AppendRecord(&out, header)) return Fail(error, "snapshot header too large");

  for (const auto& draft : snapshot.versions) {
    if (!AppendRecord(&out, EncodeVersion(draft))) {
      return Fail(error, "feature set record too large");
    }
  }
  for (const auto& storage : snapshot.storages) {
    std::vector<std::uint8_t> payload;
    ser::WriteAddress(&payload, storage);
    if (!AppendRecord(&out, payload)) return Fail(error, "storage record too large");
  }
  for (const auto& [account, state] : snapshot.accounts) {
    if (!AppendRecord(&out, EncodeAccount(account, state))) {
      return Fail(error, "account record too large");
    }
  }
  return util::AtomicWriteFileBytes(std::filesystem::path(path), out, error);
}

bool LoadManagerSnapshot(const std::string& path, manager::ManagerSnapshot* snapshot,
                         std::string* error) {
  std::vector<std::uint8_t> data;
  if (!util::ReadFileBytes(std::filesystem::path(path), &data, error)) {
    return false;
  }
  std::size_t offset = 0;
  std::uint32_t magic = 0;
  std::uint32_t version = 0;
  if (!ser::ReadUint32(data, &offset, &magic) || magic != kSnapshotMagic) {
    return Fail(error, "not a manager snapshot: " + path);
  }
  if (!ser::ReadUint32(data, &offset, &version) || version != kSnapshotVersion) {
    return Fail(error, "unsupported snapshot version");
  }

  std::vector<std::uint8_t> payload;
  if (!ReadRecord(data, &offset, &payload)) return Fail(error, "corrupt snapshot header");
  manager::ManagerSnapshot loaded;
  std::uint64_t version_count = 0;
  std::uint64_t storage_count = 0;
  std::uint64_t account_count = 0;
  std::size_t header_offset = 0;
  if (!ser::ReadAddress(payload, &header_offset, &loaded.catalog_owner) ||
      !ser::ReadVarInt(payload, &header_offset, &version_count) ||
      !ser::ReadVarInt(payload, &header_offset, &storage_count) ||
      !ser::ReadVarInt(payload, &header_offset, &account_count) ||
      header_offset != payload.size()) {
    return Fail(error, "corrupt snapshot header");
  }
  if (version_count > kMaxListSize || storage_count > kMaxListSize ||
      account_count > kMaxListSize) {
    return Fail(error, "snapshot counts out of range");
  }

  for (std::uint64_t i = 0; i < version_count; ++i) {
    manager::FeatureSetDraft draft;
    if (!ReadRecord(data, &offset, &payload) || !DecodeVersion(payload, &draft)) {
      return Fail(error, "corrupt feature set record " + std::to_string(i + 1));
    }
    loaded.versions.push_back(std::move(draft));
  }
  for (std::uint64_t i = 0; i < storage_count; ++i) {
    primitives::Address storage{};
    std::size_t record_offset = 0;
    if (!ReadRecord(data, &offset, &payload) ||
        !ser::ReadAddress(payload, &record_offset, &storage) ||
        record_offset != payload.size()) {
      return Fail(error, "corrupt storage record " + std::to_string(i));
    }
    loaded.storages.push_back(storage);
  }
  for (std::uint64_t i = 0; i < account_count; ++i) {
    primitives::Address account{};
    manager::AccountState state;
    if (!ReadRecord(data, &offset, &payload) || !DecodeAccount(payload, &account, &state)) {
      return Fail(error, "corrupt account record " + std::to_string(i));
    }
    loaded.accounts.emplace_back(account, std::move(state));
  }
  if (offset != data.size()) {
    return Fail(error, "trailing bytes after snapshot");
  }
  *snapshot = std::move(loaded);
  return true;
}

}  // namespace modvault::storage
