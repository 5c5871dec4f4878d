#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "util/log.hpp"

namespace modvault::config {

struct ManagerConfig {
  std::string data_dir{"."};
  // Empty means <data_dir>/manager.snapshot.
  std::string snapshot_path;
  // Hex address of the catalog owner used when a fresh snapshot is created.
  std::string catalog_owner;
  std::string debug_log_path;
  std::string log_level{"info"};
  std::size_t log_max_size_mb{0};
  std::size_t log_max_files{0};
  bool log_to_stderr{false};
  std::string config_path;
  bool disable_config_file{false};
};

std::string Trim(const std::string& input);
// Empty means true. Throws std::runtime_error on anything else that is not
// 1/0, true/false, yes/no or on/off.
bool ParseBool(const std::string& value);
// Drops '-' and '_' and lowercases, so "log-level", "log_level" and
// "LogLevel" name the same option.
std::string NormalizeKey(std::string key);

// Returns false for an unknown key. Throws on a malformed value.
bool ApplyConfigOption(const std::string& raw_key, const std::string& value, ManagerConfig* cfg);
bool IsConfigKey(const std::string& raw_key);

// key=value or "key value" lines, '#' comments, bare keys mean 1. A missing
// file is not an error. Errors are reported as "<file>:<line>: <reason>".
void LoadConfigFile(const std::filesystem::path& path, ManagerConfig* cfg);

// MODVAULT_DATA_DIR, MODVAULT_SNAPSHOT, MODVAULT_CATALOG_OWNER,
// MODVAULT_DEBUG_LOG, MODVAULT_LOG_LEVEL, MODVAULT_LOG_TO_STDERR.
void ApplyEnvironmentOverrides(ManagerConfig* cfg);

// Precedence: defaults < config file < environment < --key flags. Flags that
// are not config options are returned in `rest` in their original order.
ManagerConfig ParseManagerConfig(const std::vector<std::string>& args,
                                 std::vector<std::string>* rest);

std::filesystem::path ResolveSnapshotPath(const ManagerConfig& cfg);

// Applies the log settings to util::GlobalLogger(). Throws on a bad level.
void ConfigureLogging(const ManagerConfig& cfg);

}  // namespace modvault::config
