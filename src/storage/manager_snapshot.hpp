#pragma once

#include <string>

#include "manager/version_manager.hpp"

namespace modvault::storage {

// Binary snapshot of a version manager:
//   magic 'MVS1' (u32) || format version (u32)
//   header record   owner, version count, storage count, account count
//   version records features, init subset, static routes
//   storage records one address each
//   account records address, version, lock flag, initialized modules
// Each record is u32 length || payload || SHA3-256(payload).
bool SaveManagerSnapshot(const manager::ManagerSnapshot& snapshot, const std::string& path,
                         std::string* error = nullptr);
bool LoadManagerSnapshot(const std::string& path, manager::ManagerSnapshot* snapshot,
                         std::string* error = nullptr);

}  // namespace modvault::storage
