#include "config/manager_config.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace modvault::config {

namespace {

std::optional<std::string> GetEnvValue(std::string_view name) {
  std::string key(name);
  const char* value = std::getenv(key.c_str());
  if (!value || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::size_t ParseSize(const std::string& value) {
  std::size_t pos = 0;
  unsigned long long parsed = 0;
  try {
    parsed = std::stoull(value, &pos);
  } catch (const std::exception&) {
    throw std::runtime_error("invalid number: " + value);
  }
  if (pos != value.size()) {
    throw std::runtime_error("invalid number: " + value);
  }
  return static_cast<std::size_t>(parsed);
}

}  // namespace

std::string Trim(const std::string& input) {
  const std::string whitespace = " \t\r\n";
  const auto first = input.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return {};
  }
  const auto last = input.find_last_not_of(whitespace);
  return input.substr(first, last - first + 1);
}

bool ParseBool(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lower.empty()) {
    return true;
  }
  if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
    return false;
  }
  throw std::runtime_error("invalid boolean value: " + value);
}

std::string NormalizeKey(std::string key) {
  std::string out;
  out.reserve(key.size());
  for (char c : key) {
    if (c == '-' || c == '_') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool ApplyConfigOption(const std::string& raw_key, const std::string& value, ManagerConfig* cfg) {
  const std::string key = NormalizeKey(raw_key);
  if (key == "datadir" || key == "datadirectory") {
    cfg->data_dir = value;
  } else if (key == "snapshot" || key == "snapshotpath") {
    cfg->snapshot_path = value;
  } else if (key == "catalogowner" || key == "owner") {
    cfg->catalog_owner = value;
  } else if (key == "debuglog" || key == "debuglogpath") {
    cfg->debug_log_path = value;
  } else if (key == "loglevel") {
    util::ParseLogLevel(value);
    cfg->log_level = value;
  } else if (key == "logmaxsizemb") {
    cfg->log_max_size_mb = ParseSize(value);
  } else if (key == "logmaxfiles") {
    cfg->log_max_files = ParseSize(value);
  } else if (key == "logtostderr" || key == "printtoconsole") {
    cfg->log_to_stderr = ParseBool(value);
  } else if (key == "config" || key == "conf") {
    cfg->config_path = value;
  } else {
    return false;
  }
  return true;
}

bool IsConfigKey(const std::string& raw_key) {
  ManagerConfig scratch;
  try {
    return ApplyConfigOption(raw_key, "1", &scratch);
  } catch (const std::exception&) {
    // Known key that rejects "1" as a value.
    return true;
  }
}

void LoadConfigFile(const std::filesystem::path& path, ManagerConfig* cfg) {
  if (path.empty()) {
    return;
  }
  if (!std::filesystem::exists(path)) {
    return;
  }
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open config file: " + path.string());
  }
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.resize(comment_pos);
    }
    line = Trim(line);
    if (line.empty()) {
      continue;
    }
    std::string key;
    std::string value;
    const auto eq_pos = line.find_first_of("= ");
    if (eq_pos == std::string::npos) {
      key = line;
      value = "1";
    } else {
      key = Trim(line.substr(0, eq_pos));
      value = Trim(line.substr(eq_pos + 1));
      if (!value.empty() && value.front() == '=') {
        value = Trim(value.substr(1));
      }
      if (value.empty()) {
        value = "1";
      }
    }
    bool known = false;
    try {
      known = ApplyConfigOption(key, value, cfg);
    } catch (const std::exception& ex) {
      throw std::runtime_error(path.string() + ":" + std::to_string(lineno) + ": " + ex.what());
    }
    if (!known) {
      util::LogWarn("config", path.string() + ":" + std::to_string(lineno) +
                                  ": unknown config key '" + key + "'");
    }
  }
}

void ApplyEnvironmentOverrides(ManagerConfig* cfg) {
  auto apply_string = [&](std::string_view name, std::string* target) {
    if (auto value = GetEnvValue(name)) {
      *target = std::move(*value);
    }
  };
  apply_string("MODVAULT_DATA_DIR", &cfg->data_dir);
  apply_string("MODVAULT_SNAPSHOT", &cfg->snapshot_path);
  apply_string("MODVAULT_CATALOG_OWNER", &cfg->catalog_owner);
  apply_string("MODVAULT_DEBUG_LOG", &cfg->debug_log_path);
  if (auto value = GetEnvValue("MODVAULT_LOG_LEVEL")) {
    util::ParseLogLevel(*value);
    cfg->log_level = std::move(*value);
  }
  if (auto value = GetEnvValue("MODVAULT_LOG_TO_STDERR")) {
    cfg->log_to_stderr = ParseBool(*value);
  }
}

ManagerConfig ParseManagerConfig(const std::vector<std::string>& raw_args,
                                 std::vector<std::string>* rest) {
  ManagerConfig cfg;
  std::vector<std::string> args;
  args.reserve(raw_args.size());
  for (const auto& token : raw_args) {
    const auto eq_pos = token.find('=');
    if (eq_pos != std::string::npos && token.rfind("--", 0) == 0) {
      args.push_back(token.substr(0, eq_pos));
      args.push_back(token.substr(eq_pos + 1));
    } else {
      args.push_back(token);
    }
  }
  auto ensure_value = [&](std::size_t& idx) -> std::string {
    if (idx + 1 >= args.size()) {
      throw std::runtime_error("missing value for argument " + args[idx]);
    }
    return args[++idx];
  };

  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--conf") {
      cfg.config_path = ensure_value(i);
    } else if (args[i] == "--no-conf") {
      cfg.disable_config_file = true;
    }
  }
  if (!cfg.disable_config_file) {
    const std::filesystem::path config_path = cfg.config_path.empty()
                                                  ? std::filesystem::path("modvault.conf")
                                                  : std::filesystem::path(cfg.config_path);
    LoadConfigFile(config_path, &cfg);
  }

  ApplyEnvironmentOverrides(&cfg);

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--no-conf") {
      continue;
    }
    if (arg.rfind("--", 0) == 0 && IsConfigKey(arg.substr(2))) {
      if (arg == "--log-to-stderr" &&
          (i + 1 >= args.size() || args[i + 1].rfind("--", 0) == 0)) {
        cfg.log_to_stderr = true;
        continue;
      }
      const std::string value = ensure_value(i);
      ApplyConfigOption(arg.substr(2), value, &cfg);
      continue;
    }
    if (rest) {
      rest->push_back(arg);
    }
  }
  return cfg;
}

std::filesystem::path ResolveSnapshotPath(const ManagerConfig& cfg) {
  if (!cfg.snapshot_path.empty()) {
    return std::filesystem::path(cfg.snapshot_path);
  }
  return std::filesystem::path(cfg.data_dir) / "manager.snapshot";
}

void ConfigureLogging(const ManagerConfig& cfg) {
  auto& logger = util::GlobalLogger();
  const auto level = util::ParseLogLevel(cfg.log_level);
  const std::uintmax_t max_bytes =
      static_cast<std::uintmax_t>(cfg.log_max_size_mb) * 1024u * 1024u;
  logger.Configure(level, max_bytes, cfg.log_max_files);
  logger.SetStderr(cfg.log_to_stderr);
  if (!cfg.debug_log_path.empty()) {
    logger.EnableFile(cfg.debug_log_path);
  } else {
    logger.DisableFile();
  }
}

}  // namespace modvault::config
